#pragma once

#include "errors.hpp"
#include "git/stats.hpp"
#include "sessions/session.hpp"
#include "storage/session_db.hpp"

#include <cstdint>
#include <functional>
#include <string>

// Time-bounded cache of per-session git stats, backed by the git_stats table.
class GitStatsCache {
public:
    using Calculator = std::function<Result<GitStats>(const std::string& worktree,
                                                      const std::string& parent_branch)>;
    using Clock = std::function<int64_t()>;

    explicit GitStatsCache(SessionDb& db, int64_t stale_after_seconds = 60,
                           Calculator calculator = git::calculate_git_stats,
                           Clock clock = unix_now);

    // Cached stats if computed within the stale window, otherwise freshly
    // computed and persisted. Falls back to the stale row when recomputation
    // fails.
    Result<GitStats> get(const Session& session);

    // Always recomputes and persists.
    Result<GitStats> refresh(const Session& session);

    int64_t stale_after_seconds() const { return stale_after_seconds_; }

private:
    SessionDb& db_;
    int64_t stale_after_seconds_;
    Calculator calculator_;
    Clock clock_;
};
