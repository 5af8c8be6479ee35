#pragma once

#include "errors.hpp"
#include "git/stats.hpp"
#include "sessions/git_stats_cache.hpp"
#include "sessions/session.hpp"
#include "storage/session_db.hpp"

#include <optional>
#include <string>

struct FinalizationConfig {
    Session session;
    bool compute_git_stats = true;
    bool update_activity = true;
};

struct FinalizationResult {
    Session session;
    std::optional<GitStats> git_stats;
};

// Persists a freshly created session and primes its derived data. Only the
// row insert is fatal; stats and activity failures are logged and absorbed.
class SessionFinalizer {
public:
    SessionFinalizer(SessionDb& db, GitStatsCache& stats, bool verbose = false);

    Result<FinalizationResult> finalize_creation(FinalizationConfig config);
    Result<void> finalize_state_transition(const std::string& session_id, SessionState state);

private:
    std::optional<GitStats> compute_stats(const Session& session);
    void log(const std::string& msg);

    SessionDb& db_;
    GitStatsCache& stats_;
    bool verbose_;
};
