#pragma once

#include "errors.hpp"
#include "platform/process_inspector.hpp"
#include "sessions/session.hpp"
#include "storage/session_db.hpp"

#include <chrono>
#include <string>
#include <vector>

struct CancellationConfig {
    bool terminate_processes = true;
    bool delete_branch = true;
    std::chrono::milliseconds terminate_grace{2000};
    // Status recorded once teardown is done. Demoting a session back to a
    // spec reuses the same teardown with SessionStatus::Spec.
    SessionStatus final_status = SessionStatus::Cancelled;
};

struct CancellationResult {
    std::vector<int> terminated_processes;
    bool worktree_removed = false;
    bool branch_deleted = false;
    std::vector<std::string> errors;
};

// Tears down a session's isolation: lingering processes, worktree, branch.
// Each step is best-effort and records its error; only marking the row
// cancelled is fatal.
class CancellationCoordinator {
public:
    CancellationCoordinator(std::string repo, SessionDb& db, ProcessInspector& inspector,
                            bool verbose = false);

    Result<CancellationResult> cancel_session(const Session& session,
                                              const CancellationConfig& config = {});

private:
    std::vector<int> terminate_session_processes(const Session& session,
                                                 const CancellationConfig& config,
                                                 std::vector<std::string>& errors);
    bool remove_session_worktree(const Session& session, std::vector<std::string>& errors);
    bool delete_session_branch(const Session& session, std::vector<std::string>& errors);
    void log(const std::string& msg);

    std::string repo_;
    SessionDb& db_;
    ProcessInspector& inspector_;
    bool verbose_;
};
