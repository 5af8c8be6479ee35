#include "sessions/git_stats_cache.hpp"

#include <print>

GitStatsCache::GitStatsCache(SessionDb& db, int64_t stale_after_seconds,
                             Calculator calculator, Clock clock)
    : db_(db), stale_after_seconds_(stale_after_seconds),
      calculator_(std::move(calculator)), clock_(std::move(clock)) {}

Result<GitStats> GitStatsCache::get(const Session& session) {
    auto cached = db_.get_git_stats(session.id);
    if (!cached) {
        std::println(stderr, "stats: failed to read cached stats for {}: {}",
                     session.name, cached.error().to_string());
    } else if (*cached && clock_() - (*cached)->calculated_at <= stale_after_seconds_) {
        return **cached;
    }

    auto fresh = refresh(session);
    if (fresh) return fresh;

    if (cached && *cached) {
        std::println(stderr, "stats: recompute failed for {}, serving stale value: {}",
                     session.name, fresh.error().to_string());
        return **cached;
    }
    return fresh;
}

Result<GitStats> GitStatsCache::refresh(const Session& session) {
    auto stats = calculator_(session.worktree_path, session.parent_branch);
    if (!stats) return stats;

    stats->session_id = session.id;
    stats->calculated_at = clock_();

    auto saved = db_.save_git_stats(*stats);
    if (!saved) return std::unexpected(saved.error());
    return stats;
}
