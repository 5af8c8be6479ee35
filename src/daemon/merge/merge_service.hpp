#pragma once

#include "errors.hpp"
#include "sessions/git_stats_cache.hpp"
#include "sessions/session.hpp"
#include "storage/session_db.hpp"
#include "timed_runner.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

enum class MergeMode { Squash, Reapply };

std::string_view to_string(MergeMode mode);
std::optional<MergeMode> parse_merge_mode(std::string_view s);

struct MergeState {
    bool has_conflicts = false;
    std::vector<std::string> conflicting_paths; // at most 5, .schaltwerk/ excluded
    bool is_up_to_date = false;
};

struct MergePreview {
    std::string session_branch;
    std::string parent_branch;
    std::vector<std::string> squash_commands;
    std::vector<std::string> reapply_commands;
    std::string default_commit_message;
    bool has_conflicts = false;
    std::vector<std::string> conflicting_paths;
    bool is_up_to_date = false;
};

struct MergeOutcome {
    std::string session_branch;
    std::string parent_branch;
    std::string new_commit;
    MergeMode mode = MergeMode::Squash;
};

enum class UpdateFromParentStatus {
    Success,
    AlreadyUpToDate,
    HasUncommittedChanges,
    HasConflicts,
    PullFailed,
    MergeFailed,
    NoSession,
};

std::string_view to_string(UpdateFromParentStatus status);

struct UpdateSessionFromParentResult {
    UpdateFromParentStatus status = UpdateFromParentStatus::Success;
    std::string parent_branch;
    std::string message;
    std::vector<std::string> conflicting_paths;
};

// Session names with a merge in flight. A second merge of the same session
// is refused instead of queued.
class MergeLocks {
public:
    bool try_acquire(const std::string& session_name);
    void release(const std::string& session_name);
    bool is_held(const std::string& session_name) const;

private:
    mutable std::mutex mu_;
    std::set<std::string> held_;
};

// Previews and applies the reconciliation of a session branch into its
// parent branch. All repository access goes through the git CLI.
class MergeService {
public:
    MergeService(std::string repo, SessionDb& db, GitStatsCache& stats, MergeLocks& locks,
                 TimedRunner& runner,
                 std::chrono::milliseconds timeout = std::chrono::seconds(180),
                 bool verbose = false);

    // Read-only. Up to date means the session tip has no commits the parent
    // lacks; conflicts come from a trial merge of the two tips.
    static Result<MergeState> compute(const std::string& repo, const std::string& session_oid,
                                      const std::string& parent_oid,
                                      const std::string& session_branch,
                                      const std::string& parent_branch);

    Result<MergePreview> compute_merge_preview(const std::string& session_name);

    Result<MergeOutcome> apply_merge(const std::string& session_name, MergeMode mode,
                                     const std::optional<std::string>& commit_message);

    UpdateSessionFromParentResult update_session_from_parent(const std::string& session_name);

private:
    struct MergeContext {
        std::string session_id;
        std::string session_name;
        std::string repo_path;
        std::string worktree_path;
        std::string session_branch;
        std::string parent_branch;
        std::string session_oid;
        std::string parent_oid;
    };

    Result<MergeContext> prepare_context(const std::string& session_name);
    Result<std::string> resolve_local_parent(const std::string& parent_branch);
    void warn_if_parent_checkout_dirty(const MergeContext& ctx);
    void after_success(const MergeContext& ctx);
    void log(const std::string& msg);

    std::string repo_;
    SessionDb& db_;
    GitStatsCache& stats_;
    MergeLocks& locks_;
    TimedRunner& runner_;
    std::chrono::milliseconds timeout_;
    bool verbose_;
};
