#include "merge/merge_service.hpp"

#include "git/branches.hpp"
#include "git/git_command.hpp"
#include "git/worktrees.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr size_t CONFLICT_SAMPLE_LIMIT = 5;

bool is_internal_path(const std::string& path) {
    return path == ".schaltwerk" || path.starts_with(".schaltwerk/");
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// Deduplicated, capped, with schaltwerk's own files dropped.
std::vector<std::string> sample_conflicts(const std::vector<std::string>& paths) {
    std::set<std::string> seen;
    for (const auto& p : paths) {
        if (p.empty() || is_internal_path(p)) continue;
        seen.insert(p);
        if (seen.size() == CONFLICT_SAMPLE_LIMIT) break;
    }
    return {seen.begin(), seen.end()};
}

Result<GitOutput> git_checked(const std::string& dir, const std::vector<std::string>& args,
                              const std::string& op) {
    auto out = git::run(dir, args);
    if (!out) return std::unexpected(Error::git(op, out.error()));
    if (!out->ok()) return std::unexpected(Error::git(op, out->diagnostic()));
    return *out;
}

Result<bool> is_ancestor(const std::string& dir, const std::string& ancestor, const std::string& rev) {
    auto out = git::run(dir, {"merge-base", "--is-ancestor", ancestor, rev});
    if (!out) return std::unexpected(Error::git("merge-base", out.error()));
    if (out->exit_code == 0) return true;
    if (out->exit_code == 1) return false;
    return std::unexpected(Error::git("merge-base", out->diagnostic()));
}

std::vector<std::string> unmerged_paths(const std::string& worktree) {
    auto out = git::run(worktree, {"diff", "--name-only", "--diff-filter=U"});
    if (!out || !out->ok()) return {};
    return git::split_lines(out->out);
}

void abort_rebase(const std::string& worktree) {
    auto out = git::run(worktree, {"rebase", "--abort"});
    if (!out || !out->ok()) {
        std::println(stderr, "merge: rebase --abort failed in {}: {}", worktree,
                     out ? out->diagnostic() : out.error());
    }
}

struct RebaseFailure {
    std::vector<std::string> conflicts;
    std::string message;
};

// Rebases the branch checked out in worktree onto parent. On failure the
// rebase is aborted so the worktree is left as it was.
std::optional<RebaseFailure> rebase_onto(const std::string& worktree, const std::string& parent) {
    auto out = git::run(worktree, {"rebase", parent});
    if (out && out->ok()) return std::nullopt;

    RebaseFailure failure{
        .conflicts = unmerged_paths(worktree),
        .message = out ? out->diagnostic() : out.error(),
    };
    abort_rebase(worktree);
    return failure;
}

// Moves refs/heads/<branch> forward to new_oid. A main checkout sitting on
// the branch is brought along when it has no tracked modifications.
Result<void> fast_forward_branch(const std::string& repo, const std::string& branch,
                                 const std::string& new_oid) {
    auto ref = "refs/heads/" + branch;
    auto current = git::resolve_commit(repo, ref);
    if (!current) return std::unexpected(current.error());
    if (*current == new_oid) return {};

    auto descends = is_ancestor(repo, *current, new_oid);
    if (!descends) return std::unexpected(descends.error());
    if (!*descends) {
        return std::unexpected(Error::git("fast_forward", std::format(
            "Cannot fast-forward branch '{}' because new commit {} does not descend from current head {}",
            branch, new_oid, *current)));
    }

    bool update_checkout = false;
    auto head = git::current_branch(repo);
    if (head && *head == branch) {
        auto dirty = git::has_tracked_changes(repo);
        if (dirty && !*dirty) {
            update_checkout = true;
        } else {
            std::println(stderr, "merge: leaving working tree of {} untouched: {}", repo,
                         dirty ? "tracked changes present" : dirty.error().to_string());
        }
    }

    auto moved = git_checked(repo, {"update-ref", "-m", "schaltwerk fast-forward merge", ref,
                                    new_oid, *current}, "update-ref");
    if (!moved) return std::unexpected(moved.error());

    if (update_checkout) {
        auto reset = git_checked(repo, {"reset", "--hard", "--quiet", "HEAD"}, "reset");
        if (!reset) return std::unexpected(reset.error());
    }
    return {};
}

Result<std::string> rebase_if_needed(const std::string& worktree, const std::string& session_name,
                                     const std::string& parent_branch) {
    auto integrated = is_ancestor(worktree, parent_branch, "HEAD");
    if (!integrated) return std::unexpected(integrated.error());

    if (!*integrated) {
        if (auto failure = rebase_onto(worktree, parent_branch)) {
            auto conflicts = sample_conflicts(failure->conflicts);
            if (!conflicts.empty()) {
                return std::unexpected(Error::merge_conflict(conflicts, std::format(
                    "Rebase produced conflicts for session '{}': {}", session_name, join(conflicts, ", "))));
            }
            return std::unexpected(Error::git("rebase", std::format(
                "Rebase failed for session '{}': {}", session_name, failure->message)));
        }
    }
    return git::resolve_commit(worktree, "HEAD");
}

Result<std::string> squash_commit(const std::string& worktree, const std::string& parent_branch,
                                  const std::string& message) {
    auto reset = git_checked(worktree, {"reset", "--soft", parent_branch}, "reset");
    if (!reset) return std::unexpected(reset.error());

    auto commit = git_checked(worktree, {"commit", "--no-verify", "--quiet", "-m", message}, "commit");
    if (!commit) return std::unexpected(commit.error());

    return git::resolve_commit(worktree, "HEAD");
}

} // namespace

std::string_view to_string(MergeMode mode) {
    switch (mode) {
        case MergeMode::Squash: return "squash";
        case MergeMode::Reapply: return "reapply";
    }
    return "squash";
}

std::optional<MergeMode> parse_merge_mode(std::string_view s) {
    if (s == "squash") return MergeMode::Squash;
    if (s == "reapply") return MergeMode::Reapply;
    return std::nullopt;
}

std::string_view to_string(UpdateFromParentStatus status) {
    switch (status) {
        case UpdateFromParentStatus::Success: return "success";
        case UpdateFromParentStatus::AlreadyUpToDate: return "already_up_to_date";
        case UpdateFromParentStatus::HasUncommittedChanges: return "has_uncommitted_changes";
        case UpdateFromParentStatus::HasConflicts: return "has_conflicts";
        case UpdateFromParentStatus::PullFailed: return "pull_failed";
        case UpdateFromParentStatus::MergeFailed: return "merge_failed";
        case UpdateFromParentStatus::NoSession: return "no_session";
    }
    return "merge_failed";
}

// --- MergeLocks ---

bool MergeLocks::try_acquire(const std::string& session_name) {
    std::lock_guard lock(mu_);
    return held_.insert(session_name).second;
}

void MergeLocks::release(const std::string& session_name) {
    std::lock_guard lock(mu_);
    held_.erase(session_name);
}

bool MergeLocks::is_held(const std::string& session_name) const {
    std::lock_guard lock(mu_);
    return held_.contains(session_name);
}

namespace {

class MergeLockGuard {
public:
    MergeLockGuard(MergeLocks& locks, std::string name) : locks_(locks), name_(std::move(name)) {}
    ~MergeLockGuard() { locks_.release(name_); }

    MergeLockGuard(const MergeLockGuard&) = delete;
    MergeLockGuard& operator=(const MergeLockGuard&) = delete;

private:
    MergeLocks& locks_;
    std::string name_;
};

} // namespace

// --- MergeService ---

MergeService::MergeService(std::string repo, SessionDb& db, GitStatsCache& stats, MergeLocks& locks,
                           TimedRunner& runner, std::chrono::milliseconds timeout, bool verbose)
    : repo_(std::move(repo)), db_(db), stats_(stats), locks_(locks), runner_(runner),
      timeout_(timeout), verbose_(verbose) {}

Result<MergeState> MergeService::compute(const std::string& repo, const std::string& session_oid,
                                         const std::string& parent_oid,
                                         const std::string& session_branch,
                                         const std::string& parent_branch) {
    if (session_oid == parent_oid) return MergeState{.is_up_to_date = true};

    auto ahead = git::run(repo, {"rev-list", "--count", parent_oid + ".." + session_oid});
    if (!ahead) return std::unexpected(Error::git("rev-list", ahead.error()));
    if (!ahead->ok()) {
        return std::unexpected(Error::git("rev-list", std::format(
            "Failed to compare '{}' with '{}': {}", session_branch, parent_branch, ahead->diagnostic())));
    }
    if (ahead->first_line() == "0") return MergeState{.is_up_to_date = true};

    auto trial = git::run(repo, {"merge-tree", "--write-tree", "--name-only", "--no-messages",
                                 session_oid, parent_oid});
    if (!trial) return std::unexpected(Error::git("merge-tree", trial.error()));
    if (trial->exit_code != 0 && trial->exit_code != 1) {
        return std::unexpected(Error::git("merge-tree", std::format(
            "Failed to simulate merge between '{}' and '{}': {}", session_branch, parent_branch,
            trial->diagnostic())));
    }

    MergeState state;
    if (trial->exit_code == 1) {
        // First line is the resulting tree, the rest are conflicted paths.
        auto lines = git::split_lines(trial->out);
        if (!lines.empty()) lines.erase(lines.begin());
        state.conflicting_paths = sample_conflicts(lines);
    }
    state.has_conflicts = !state.conflicting_paths.empty();
    return state;
}

Result<MergePreview> MergeService::compute_merge_preview(const std::string& session_name) {
    auto ctx = prepare_context(session_name);
    if (!ctx) return std::unexpected(ctx.error());

    auto state = compute(ctx->repo_path, ctx->session_oid, ctx->parent_oid, ctx->session_branch,
                         ctx->parent_branch);
    if (!state) return std::unexpected(state.error());

    const auto& parent = ctx->parent_branch;
    return MergePreview{
        .session_branch = ctx->session_branch,
        .parent_branch = parent,
        .squash_commands = {
            "git rebase " + parent,
            "git reset --soft " + parent,
            "git commit -m \"<your message>\"",
        },
        .reapply_commands = {
            "git rebase " + parent,
            std::format("git update-ref refs/heads/{} $(git rev-parse HEAD)", parent),
        },
        .default_commit_message = std::format("Merge session {} into {}", ctx->session_name, parent),
        .has_conflicts = state->has_conflicts,
        .conflicting_paths = state->conflicting_paths,
        .is_up_to_date = state->is_up_to_date,
    };
}

Result<MergeOutcome> MergeService::apply_merge(const std::string& session_name, MergeMode mode,
                                               const std::optional<std::string>& commit_message) {
    auto ctx = prepare_context(session_name);
    if (!ctx) return std::unexpected(ctx.error());

    auto state = compute(ctx->repo_path, ctx->session_oid, ctx->parent_oid, ctx->session_branch,
                         ctx->parent_branch);
    if (!state) return std::unexpected(state.error());

    if (state->has_conflicts) {
        return std::unexpected(Error::merge_conflict(state->conflicting_paths, std::format(
            "Session '{}' has merge conflicts when applying '{}' into '{}'. Conflicting paths: {}",
            ctx->session_name, ctx->parent_branch, ctx->session_branch,
            join(state->conflicting_paths, ", "))));
    }
    if (state->is_up_to_date) {
        return std::unexpected(Error::invalid_input("session", std::format(
            "Session '{}' has no commits to merge into parent branch '{}'.",
            ctx->session_name, ctx->parent_branch)));
    }

    std::string message = commit_message ? git::trim(*commit_message) : std::string();
    if (mode == MergeMode::Squash && message.empty()) {
        return std::unexpected(Error::invalid_input("commit_message",
                                                    "Commit message is required for squash merges"));
    }

    warn_if_parent_checkout_dirty(*ctx);

    if (!locks_.try_acquire(ctx->session_name)) {
        return std::unexpected(Error::invalid_input("session", std::format(
            "Merge already running for session '{}'", ctx->session_name)));
    }
    MergeLockGuard lock(locks_, ctx->session_name);

    log(std::format("Merging {} into {} ({})", ctx->session_branch, ctx->parent_branch, to_string(mode)));

    auto outcome = runner_.run<Result<MergeOutcome>>(timeout_, [c = *ctx, mode, message]() -> Result<MergeOutcome> {
        auto rebased = rebase_if_needed(c.worktree_path, c.session_name, c.parent_branch);
        if (!rebased) return std::unexpected(rebased.error());

        std::string new_commit = *rebased;
        if (mode == MergeMode::Squash) {
            auto squashed = squash_commit(c.worktree_path, c.parent_branch, message);
            if (!squashed) return std::unexpected(squashed.error());
            new_commit = *squashed;
        }

        auto ff = fast_forward_branch(c.repo_path, c.parent_branch, new_commit);
        if (!ff) return std::unexpected(ff.error());

        return MergeOutcome{
            .session_branch = c.session_branch,
            .parent_branch = c.parent_branch,
            .new_commit = new_commit,
            .mode = mode,
        };
    });

    if (!outcome) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout_).count();
        std::println(stderr, "merge: session {} timed out after {}s", ctx->session_name, secs);
        return std::unexpected(Error::git("merge", std::format(
            "Merge operation timed out after {} seconds", secs)));
    }
    if (!*outcome) return *outcome;

    after_success(*ctx);
    log(std::format("Merged {} into {} at {}", ctx->session_branch, ctx->parent_branch,
                    (*outcome)->new_commit));
    return *outcome;
}

UpdateSessionFromParentResult MergeService::update_session_from_parent(const std::string& session_name) {
    UpdateSessionFromParentResult result;

    auto session = db_.get_session_by_name(repo_, session_name);
    if (!session || session->session_state == SessionState::Spec ||
        session->status == SessionStatus::Cancelled) {
        result.status = UpdateFromParentStatus::NoSession;
        result.message = std::format("Session '{}' not found or not running", session_name);
        return result;
    }

    result.parent_branch = session->parent_branch;
    std::error_code ec;
    if (!fs::exists(session->worktree_path, ec)) {
        result.status = UpdateFromParentStatus::NoSession;
        result.message = std::format("Worktree not found at path: {}", session->worktree_path);
        return result;
    }

    auto dirty = git::has_uncommitted_changes(session->worktree_path);
    if (!dirty || *dirty) {
        result.status = UpdateFromParentStatus::HasUncommittedChanges;
        result.message = dirty ? "Commit or stash your changes before updating from the parent branch"
                               : dirty.error().to_string();
        return result;
    }

    if (!locks_.try_acquire(session->name)) {
        result.status = UpdateFromParentStatus::MergeFailed;
        result.message = std::format("Merge already running for session '{}'", session->name);
        return result;
    }
    MergeLockGuard lock(locks_, session->name);

    const auto& parent = session->parent_branch;

    bool on_origin = false;
    auto origin = git::run(repo_, {"remote", "get-url", "origin"});
    if (origin && origin->ok()) {
        // Exit code 2 means origin has no such branch; the parent is local only.
        auto listed = git::run(repo_, {"ls-remote", "--exit-code", "--heads", "origin", "refs/heads/" + parent});
        if (!listed || (!listed->ok() && listed->exit_code != 2)) {
            result.status = UpdateFromParentStatus::PullFailed;
            result.message = std::format("Failed to query origin for '{}': {}", parent,
                                         listed ? listed->diagnostic() : listed.error());
            return result;
        }
        on_origin = listed->ok();
        if (!on_origin) log(std::format("'{}' has no counterpart on origin; using the local branch", parent));
    }

    if (on_origin) {
        auto fetched = git::run(repo_, {"fetch", "--quiet", "origin", parent});
        if (!fetched || !fetched->ok()) {
            result.status = UpdateFromParentStatus::PullFailed;
            result.message = std::format("Failed to fetch '{}' from origin: {}", parent,
                                         fetched ? fetched->diagnostic() : fetched.error());
            return result;
        }

        auto remote_tip = git::resolve_commit(repo_, "refs/remotes/origin/" + parent);
        if (remote_tip) {
            auto local_behind = is_ancestor(repo_, "refs/heads/" + parent, *remote_tip);
            if (local_behind && *local_behind) {
                auto ff = fast_forward_branch(repo_, parent, *remote_tip);
                if (!ff) {
                    result.status = UpdateFromParentStatus::PullFailed;
                    result.message = ff.error().to_string();
                    return result;
                }
            } else {
                log(std::format("Local {} has diverged from origin; using the local branch", parent));
            }
        }
    }

    auto integrated = is_ancestor(session->worktree_path, parent, "HEAD");
    if (!integrated) {
        result.status = UpdateFromParentStatus::MergeFailed;
        result.message = integrated.error().to_string();
        return result;
    }
    if (*integrated) {
        result.status = UpdateFromParentStatus::AlreadyUpToDate;
        result.message = std::format("Session '{}' is already up to date with '{}'", session->name, parent);
        return result;
    }

    if (auto failure = rebase_onto(session->worktree_path, parent)) {
        auto conflicts = sample_conflicts(failure->conflicts);
        if (!conflicts.empty()) {
            result.status = UpdateFromParentStatus::HasConflicts;
            result.conflicting_paths = conflicts;
            result.message = std::format("Updating from '{}' conflicts in: {}", parent, join(conflicts, ", "));
        } else {
            result.status = UpdateFromParentStatus::MergeFailed;
            result.message = failure->message;
        }
        return result;
    }

    auto stats = stats_.refresh(*session);
    if (!stats) {
        std::println(stderr, "merge: failed to refresh git stats for {}: {}", session->name,
                     stats.error().to_string());
    }

    result.status = UpdateFromParentStatus::Success;
    result.message = std::format("Updated session '{}' from '{}'", session->name, parent);
    return result;
}

Result<MergeService::MergeContext> MergeService::prepare_context(const std::string& session_name) {
    auto session = db_.get_session_by_name(repo_, session_name);
    if (!session) return std::unexpected(session.error());

    if (session->session_state == SessionState::Spec) {
        return std::unexpected(Error::invalid_state(session_name, "spec", "running"));
    }
    if (session->status == SessionStatus::Cancelled) {
        return std::unexpected(Error::invalid_state(session_name, "cancelled", "reviewed"));
    }
    if (!session->ready_to_merge) {
        return std::unexpected(Error::invalid_input("ready_to_merge", std::format(
            "Session '{}' is not marked ready to merge", session_name)));
    }

    std::error_code ec;
    if (!fs::exists(session->worktree_path, ec)) {
        return std::unexpected(Error::worktree_not_found(session->worktree_path));
    }

    auto dirty = git::has_uncommitted_changes(session->worktree_path);
    if (!dirty) return std::unexpected(dirty.error());
    if (*dirty) {
        return std::unexpected(Error::invalid_input("worktree", std::format(
            "Session '{}' has uncommitted changes. Clean the worktree before merging.", session_name)));
    }

    auto requested_parent = git::trim(session->parent_branch);
    if (requested_parent.empty()) {
        return std::unexpected(Error::invalid_input("parent_branch", std::format(
            "Session '{}' has no recorded parent branch", session_name)));
    }

    auto parent = resolve_local_parent(requested_parent);
    if (!parent) return std::unexpected(parent.error());

    auto parent_oid = git::resolve_commit(repo_, "refs/heads/" + *parent);
    if (!parent_oid) {
        return std::unexpected(Error::git("merge_preview", std::format(
            "Parent branch '{}' not found for session '{}'", *parent, session_name)));
    }
    auto session_oid = git::resolve_commit(repo_, "refs/heads/" + session->branch);
    if (!session_oid) {
        return std::unexpected(Error::git("merge_preview", std::format(
            "Session branch '{}' not found for session '{}'", session->branch, session_name)));
    }

    return MergeContext{
        .session_id = session->id,
        .session_name = session->name,
        .repo_path = repo_,
        .worktree_path = session->worktree_path,
        .session_branch = session->branch,
        .parent_branch = *parent,
        .session_oid = *session_oid,
        .parent_oid = *parent_oid,
    };
}

// Parent branches recorded as remote-tracking names (origin/main) are
// merged into their local counterpart.
Result<std::string> MergeService::resolve_local_parent(const std::string& parent_branch) {
    if (git::branch_exists(repo_, parent_branch)) return parent_branch;

    auto slash = parent_branch.find('/');
    if (slash != std::string::npos) {
        auto remote = parent_branch.substr(0, slash);
        auto local = parent_branch.substr(slash + 1);
        auto known = git::run(repo_, {"remote", "get-url", remote});
        if (known && known->ok() && git::branch_exists(repo_, local)) return local;
    }

    return std::unexpected(Error::git("merge_preview", std::format(
        "Parent branch '{}' is unavailable as a local branch", parent_branch)));
}

void MergeService::warn_if_parent_checkout_dirty(const MergeContext& ctx) {
    auto head = git::current_branch(ctx.repo_path);
    if (!head || *head != ctx.parent_branch) return;

    auto dirty = git::has_uncommitted_changes(ctx.repo_path);
    if (dirty && *dirty) {
        std::println(stderr, "merge: parent branch '{}' has uncommitted changes in {}; "
                     "only the branch ref will be updated", ctx.parent_branch, ctx.repo_path);
    }
}

void MergeService::after_success(const MergeContext& ctx) {
    auto updated = db_.update_session_state(ctx.session_id, SessionState::Reviewed);
    if (!updated) {
        std::println(stderr, "merge: failed to mark {} reviewed: {}", ctx.session_name,
                     updated.error().to_string());
    }

    auto session = db_.get_session_by_id(ctx.session_id);
    if (!session) return;
    auto stats = stats_.refresh(*session);
    if (!stats) {
        std::println(stderr, "merge: failed to refresh git stats for {}: {}", ctx.session_name,
                     stats.error().to_string());
    }
}

void MergeService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[schaltwerk] {}", msg);
    }
}
