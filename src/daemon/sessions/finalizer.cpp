#include "sessions/finalizer.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

SessionFinalizer::SessionFinalizer(SessionDb& db, GitStatsCache& stats, bool verbose)
    : db_(db), stats_(stats), verbose_(verbose) {}

Result<FinalizationResult> SessionFinalizer::finalize_creation(FinalizationConfig config) {
    auto& session = config.session;

    auto inserted = db_.insert_session(session);
    if (!inserted) return std::unexpected(inserted.error());

    FinalizationResult result{.session = session, .git_stats = std::nullopt};

    if (config.compute_git_stats) {
        result.git_stats = compute_stats(session);
    }

    if (config.update_activity) {
        auto now = unix_now();
        auto stamped = db_.set_session_activity(session.id, now);
        if (stamped) {
            result.session.last_activity = now;
        } else {
            std::println(stderr, "session: failed to stamp activity for {}: {}",
                         session.name, stamped.error().to_string());
        }
    }

    return result;
}

Result<void> SessionFinalizer::finalize_state_transition(const std::string& session_id,
                                                         SessionState state) {
    auto updated = db_.update_session_state(session_id, state);
    if (!updated) return updated;

    auto stamped = db_.set_session_activity(session_id, unix_now());
    if (!stamped) {
        std::println(stderr, "session: failed to stamp activity for {}: {}",
                     session_id, stamped.error().to_string());
    }
    return {};
}

std::optional<GitStats> SessionFinalizer::compute_stats(const Session& session) {
    if (session.session_state == SessionState::Spec) {
        log("Skipping git stats for spec session " + session.name);
        return std::nullopt;
    }

    std::error_code ec;
    if (!fs::exists(session.worktree_path, ec)) {
        log("Skipping git stats for " + session.name + ": worktree not on disk yet");
        return std::nullopt;
    }

    auto stats = stats_.refresh(session);
    if (!stats) {
        std::println(stderr, "session: git stats failed for {}: {}",
                     session.name, stats.error().to_string());
        return std::nullopt;
    }
    return *stats;
}

void SessionFinalizer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[schaltwerk] {}", msg);
    }
}
