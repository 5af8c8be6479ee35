#pragma once

#include "agents/agent_manifest.hpp"
#include "config.hpp"
#include "events/event_sink.hpp"
#include "launch/launch_coordinator.hpp"
#include "launch/terminal_locks.hpp"
#include "merge/merge_service.hpp"
#include "platform/ipc_server.hpp"
#include "platform/process_inspector.hpp"
#include "platform/terminal_backend.hpp"
#include "sessions/git_stats_cache.hpp"
#include "sessions/name_reservation.hpp"
#include "sessions/session_service.hpp"
#include "storage/session_db.hpp"
#include "timed_runner.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct ShutdownReport {
    size_t workers_joined = 0;
    size_t timed_out_tasks = 0;
    size_t dropped_responses = 0;
    bool database_closed = false;

    std::string to_string() const;
};

// Portable daemon logic: dispatches socket commands to worker threads and
// hands their responses back to the event loop.
class DaemonCore : public EventSink {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose, SessionDb& db, ProcessInspector& inspector,
               TerminalBackend& terminals, IpcServer& ipc, NotifyCallback notify);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // Returns {"status":"pending"} when the command was handed to a worker;
    // its response is sent from on_worker_complete().
    nlohmann::json handle_command(int client_fd, const nlohmann::json& cmd);

    // Called on the event loop thread after notify fired.
    void on_worker_complete();

    void remove_client(int fd);

    void emit(EngineEvent event, const nlohmann::json& payload) override;

    const std::string& repository() const { return repo_; }
    size_t workers_in_flight();

    // Idempotent. Joins workers and timed-out tasks, then closes the database.
    ShutdownReport shutdown();

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    void start_worker(int client_fd, Handler handler, nlohmann::json cmd);
    Handler find_handler(const std::string& cmd_str);
    static std::string resolve_repository(const std::string& configured);

    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_create(const nlohmann::json& cmd);
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_set_state(const nlohmann::json& cmd);
    nlohmann::json handle_start_spec(const nlohmann::json& cmd);
    nlohmann::json handle_list(const nlohmann::json& cmd);
    nlohmann::json handle_get(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_mark_reviewed(const nlohmann::json& cmd);
    nlohmann::json handle_unmark_reviewed(const nlohmann::json& cmd);
    nlohmann::json handle_convert_to_spec(const nlohmann::json& cmd);
    nlohmann::json handle_stats(const nlohmann::json& cmd);
    nlohmann::json handle_create_spec(const nlohmann::json& cmd);
    nlohmann::json handle_list_specs(const nlohmann::json& cmd);
    nlohmann::json handle_update_spec(const nlohmann::json& cmd);
    nlohmann::json handle_delete_spec(const nlohmann::json& cmd);
    nlohmann::json handle_create_epic(const nlohmann::json& cmd);
    nlohmann::json handle_list_epics(const nlohmann::json& cmd);
    nlohmann::json handle_delete_epic(const nlohmann::json& cmd);
    nlohmann::json handle_set_epic(const nlohmann::json& cmd);
    nlohmann::json handle_merge_preview(const nlohmann::json& cmd);
    nlohmann::json handle_merge(const nlohmann::json& cmd);
    nlohmann::json handle_update_from_parent(const nlohmann::json& cmd);
    nlohmann::json handle_launch(const nlohmann::json& cmd);
    nlohmann::json handle_branches(const nlohmann::json& cmd);
    nlohmann::json handle_clone(const nlohmann::json& cmd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    std::string repo_;

    SessionDb& db_;
    ProcessInspector& inspector_;
    TerminalBackend& terminals_;
    IpcServer& ipc_;
    NotifyCallback notify_;

    NameReservation reservations_;
    GitStatsCache stats_;
    MergeLocks merge_locks_;
    TerminalLockRegistry terminal_locks_;
    SessionService sessions_;
    MergeService merges_;
    LaunchCoordinator launcher_;

    struct Completion {
        uint64_t worker_id;
        int client_fd;
        nlohmann::json response;
    };

    std::mutex mu_;
    std::map<uint64_t, std::jthread> workers_;
    std::map<uint64_t, int> worker_clients_;
    std::set<uint64_t> orphaned_workers_; // client went away before the response
    std::vector<Completion> completions_;
    std::vector<nlohmann::json> pending_events_;
    uint64_t next_worker_id_ = 1;

    std::set<int> subscribers_;
    std::atomic<bool> shut_down_{false};

    // Declared last so that tasks still running past their deadline are
    // joined before the services they reference are destroyed.
    TimedRunner runner_;
};
