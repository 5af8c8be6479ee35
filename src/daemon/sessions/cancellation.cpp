#include "sessions/cancellation.hpp"

#include "git/branches.hpp"
#include "git/worktrees.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

CancellationCoordinator::CancellationCoordinator(std::string repo, SessionDb& db,
                                                 ProcessInspector& inspector, bool verbose)
    : repo_(std::move(repo)), db_(db), inspector_(inspector), verbose_(verbose) {}

Result<CancellationResult> CancellationCoordinator::cancel_session(const Session& session,
                                                                   const CancellationConfig& config) {
    if (session.session_state == SessionState::Spec) {
        return std::unexpected(Error::invalid_state(session.name, "spec", "running"));
    }

    log("Cancelling session " + session.name);

    std::error_code ec;
    if (session.worktree_path.empty() || !fs::exists(session.worktree_path, ec)) {
        log("Worktree for " + session.name + " is already gone");
    } else {
        // Uncommitted work is lost on cancel; leave a trace in the log.
        auto dirty = git::has_uncommitted_changes(session.worktree_path);
        if (dirty && *dirty) {
            std::println(stderr, "session: cancelling {} with uncommitted changes", session.name);
        }
    }

    CancellationResult result;

    if (config.terminate_processes) {
        result.terminated_processes = terminate_session_processes(session, config, result.errors);
    }

    result.worktree_removed = remove_session_worktree(session, result.errors);

    // The branch stays checked out while the worktree exists.
    if (config.delete_branch && (result.worktree_removed || !fs::exists(session.worktree_path, ec))) {
        result.branch_deleted = delete_session_branch(session, result.errors);
    }

    auto status = db_.update_session_status(session.id, config.final_status);
    if (!status) return std::unexpected(status.error());

    auto resume = db_.set_resume_allowed(session.id, false);
    if (!resume) {
        result.errors.push_back("Failed to disable resume: " + resume.error().to_string());
    }

    for (const auto& err : result.errors) {
        std::println(stderr, "session: cancel {}: {}", session.name, err);
    }
    return result;
}

std::vector<int> CancellationCoordinator::terminate_session_processes(
    const Session& session, const CancellationConfig& config, std::vector<std::string>& errors) {
    std::error_code ec;
    if (session.worktree_path.empty() || !fs::exists(session.worktree_path, ec)) return {};

    auto pids = inspector_.pids_with_cwd_under(session.worktree_path);
    std::erase(pids, static_cast<int>(::getpid()));
    if (pids.empty()) return {};

    for (int pid : pids) {
        if (!inspector_.send_terminate(pid) && inspector_.is_running(pid)) {
            errors.push_back(std::format("Failed to send SIGTERM to process {}", pid));
        }
    }

    auto deadline = std::chrono::steady_clock::now() + config.terminate_grace;
    auto any_running = [&] {
        return std::ranges::any_of(pids, [this](int pid) { return inspector_.is_running(pid); });
    };
    while (any_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    for (int pid : pids) {
        if (inspector_.is_running(pid) && !inspector_.send_kill(pid)) {
            errors.push_back(std::format("Failed to kill process {}", pid));
        }
    }

    log(std::format("Terminated {} lingering process(es) for {}", pids.size(), session.name));
    return pids;
}

bool CancellationCoordinator::remove_session_worktree(const Session& session,
                                                      std::vector<std::string>& errors) {
    std::error_code ec;
    if (session.worktree_path.empty() || !fs::exists(session.worktree_path, ec)) {
        auto pruned = git::prune_worktrees(repo_);
        if (!pruned) errors.push_back("Failed to prune worktrees: " + pruned.error().to_string());
        return false;
    }

    auto removed = git::remove_worktree(repo_, session.worktree_path);
    if (!removed) {
        errors.push_back("Failed to remove worktree: " + removed.error().to_string());
        return false;
    }
    return true;
}

bool CancellationCoordinator::delete_session_branch(const Session& session,
                                                    std::vector<std::string>& errors) {
    if (!git::branch_exists(repo_, session.branch)) return false;

    auto deleted = git::delete_branch(repo_, session.branch);
    if (!deleted) {
        errors.push_back(std::format("Failed to delete branch '{}': {}", session.branch,
                                     deleted.error().to_string()));
        return false;
    }
    return true;
}

void CancellationCoordinator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[schaltwerk] {}", msg);
    }
}
