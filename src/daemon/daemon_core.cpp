#include "daemon_core.hpp"

#include "agents/launch_spec.hpp"
#include "git/branches.hpp"
#include "git/clone.hpp"
#include "git/git_command.hpp"
#include "protocol.hpp"

#include <filesystem>
#include <format>
#include <print>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
json result_response(const Result<T>& result, const char* key) {
    if (!result) return error_response(result.error());
    auto resp = ok_response();
    resp[key] = *result;
    return resp;
}

json void_response(const Result<void>& result) {
    if (!result) return error_response(result.error());
    return ok_response();
}

std::string required_string(const json& cmd, const char* key) {
    auto value = cmd.value(key, std::string());
    if (value.empty()) throw std::invalid_argument(std::format("missing '{}'", key));
    return value;
}

} // namespace

std::string ShutdownReport::to_string() const {
    return std::format("joined {} worker(s), {} timed-out task(s), dropped {} response(s), database {}",
                       workers_joined, timed_out_tasks, dropped_responses,
                       database_closed ? "closed" : "was not open");
}

DaemonCore::DaemonCore(Config config, bool verbose, SessionDb& db, ProcessInspector& inspector,
                       TerminalBackend& terminals, IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      repo_(resolve_repository(config_.repository)),
      db_(db), inspector_(inspector), terminals_(terminals), ipc_(ipc),
      notify_(std::move(notify)),
      stats_(db_, config_.stats.stale_after_seconds),
      sessions_(repo_, db_, reservations_, stats_, inspector_, *this,
                SessionSettings{
                    .branch_prefix = config_.branch_prefix,
                    .base_branch = config_.base_branch,
                    .default_agent = config_.default_agent,
                    .skip_permissions = config_.skip_permissions,
                },
                verbose_),
      merges_(repo_, db_, stats_, merge_locks_, runner_,
              std::chrono::seconds(config_.merge.timeout_seconds), verbose_),
      launcher_(terminals_, AgentManifest::builtin(), terminal_locks_, runner_, config_.agents,
                std::chrono::seconds(config_.launch.timeout_seconds), verbose_) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

std::string DaemonCore::resolve_repository(const std::string& configured) {
    std::error_code ec;
    std::string start = configured.empty() ? fs::current_path(ec).string() : configured;

    auto top = git::run(start, {"rev-parse", "--show-toplevel"});
    if (top && top->ok()) return top->first_line();
    return fs::absolute(start, ec).string();
}

bool DaemonCore::init() {
    auto is_repo = git::run(repo_, {"rev-parse", "--git-dir"});
    if (!is_repo || !is_repo->ok()) {
        std::println(stderr, "daemon: {} is not a git repository", repo_);
        return false;
    }

    auto db_path = config_.database_path();
    if (!db_.open(db_path)) {
        std::println(stderr, "daemon: failed to open session database at {}", db_path);
        return false;
    }

    log(std::format("Serving repository {} (database {})", repo_, db_path));
    return true;
}

json DaemonCore::handle_command(int client_fd, const json& cmd) {
    if (!cmd.is_object()) return error_response("invalid JSON request");

    std::string cmd_str = cmd.value("cmd", "");
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "subscribe") {
        subscribers_.insert(client_fd);
        return {{"status", "ok"}, {"message", "subscribed"}};
    }

    auto handler = find_handler(cmd_str);
    if (!handler) return error_response("unknown command: " + cmd_str);
    if (shut_down_.load()) return error_response("daemon is shutting down");

    start_worker(client_fd, std::move(handler), cmd);
    return {{"status", "pending"}};
}

DaemonCore::Handler DaemonCore::find_handler(const std::string& cmd_str) {
    static const std::map<std::string, json (DaemonCore::*)(const json&)> handlers = {
        {"create", &DaemonCore::handle_create},
        {"start", &DaemonCore::handle_start},
        {"set_state", &DaemonCore::handle_set_state},
        {"start_spec", &DaemonCore::handle_start_spec},
        {"list", &DaemonCore::handle_list},
        {"get", &DaemonCore::handle_get},
        {"cancel", &DaemonCore::handle_cancel},
        {"mark_reviewed", &DaemonCore::handle_mark_reviewed},
        {"unmark_reviewed", &DaemonCore::handle_unmark_reviewed},
        {"convert_to_spec", &DaemonCore::handle_convert_to_spec},
        {"stats", &DaemonCore::handle_stats},
        {"create_spec", &DaemonCore::handle_create_spec},
        {"list_specs", &DaemonCore::handle_list_specs},
        {"update_spec", &DaemonCore::handle_update_spec},
        {"delete_spec", &DaemonCore::handle_delete_spec},
        {"create_epic", &DaemonCore::handle_create_epic},
        {"list_epics", &DaemonCore::handle_list_epics},
        {"delete_epic", &DaemonCore::handle_delete_epic},
        {"set_epic", &DaemonCore::handle_set_epic},
        {"merge_preview", &DaemonCore::handle_merge_preview},
        {"merge", &DaemonCore::handle_merge},
        {"update_from_parent", &DaemonCore::handle_update_from_parent},
        {"launch", &DaemonCore::handle_launch},
        {"branches", &DaemonCore::handle_branches},
        {"clone", &DaemonCore::handle_clone},
    };

    auto it = handlers.find(cmd_str);
    if (it == handlers.end()) return nullptr;
    auto method = it->second;
    return [this, method](const json& cmd) { return (this->*method)(cmd); };
}

void DaemonCore::start_worker(int client_fd, Handler handler, json cmd) {
    std::lock_guard lock(mu_);
    uint64_t id = next_worker_id_++;
    worker_clients_[id] = client_fd;

    workers_.emplace(id, std::jthread([this, id, client_fd, handler = std::move(handler),
                                       cmd = std::move(cmd)](std::stop_token) {
        json response;
        try {
            response = handler(cmd);
        } catch (const json::exception& e) {
            response = error_response(std::string("invalid request: ") + e.what());
        } catch (const std::invalid_argument& e) {
            response = error_response(std::string("invalid request: ") + e.what());
        }

        {
            std::lock_guard lock(mu_);
            completions_.push_back({id, client_fd, std::move(response)});
        }
        if (notify_) notify_();
    }));
}

void DaemonCore::on_worker_complete() {
    std::vector<Completion> done;
    std::vector<json> events;
    std::vector<std::jthread> finished;
    std::set<uint64_t> orphaned;
    {
        std::lock_guard lock(mu_);
        done.swap(completions_);
        events.swap(pending_events_);
        for (const auto& c : done) {
            auto it = workers_.find(c.worker_id);
            if (it != workers_.end()) {
                finished.push_back(std::move(it->second));
                workers_.erase(it);
            }
            worker_clients_.erase(c.worker_id);
            if (orphaned_workers_.erase(c.worker_id)) orphaned.insert(c.worker_id);
        }
    }

    for (auto& t : finished) {
        if (t.joinable()) t.join();
    }

    for (const auto& c : done) {
        if (orphaned.contains(c.worker_id)) continue;
        ipc_.send_response(c.client_fd, c.response);
    }

    for (const auto& event : events) {
        for (int fd : subscribers_) ipc_.send_response(fd, event);
    }
}

void DaemonCore::remove_client(int fd) {
    subscribers_.erase(fd);

    std::lock_guard lock(mu_);
    for (const auto& [worker_id, client_fd] : worker_clients_) {
        if (client_fd == fd) orphaned_workers_.insert(worker_id);
    }
}

void DaemonCore::emit(EngineEvent event, const json& payload) {
    {
        std::lock_guard lock(mu_);
        pending_events_.push_back({{"event", std::string(to_string(event))}, {"payload", payload}});
    }
    if (notify_) notify_();
}

size_t DaemonCore::workers_in_flight() {
    std::lock_guard lock(mu_);
    return workers_.size();
}

ShutdownReport DaemonCore::shutdown() {
    ShutdownReport report;
    if (shut_down_.exchange(true)) return report;

    std::map<uint64_t, std::jthread> workers;
    {
        std::lock_guard lock(mu_);
        workers.swap(workers_);
    }
    if (!workers.empty()) log(std::format("Waiting for {} worker(s) to finish...", workers.size()));
    for (auto& [id, t] : workers) {
        if (t.joinable()) t.join();
        report.workers_joined++;
    }

    {
        std::lock_guard lock(mu_);
        report.dropped_responses = completions_.size();
        completions_.clear();
        pending_events_.clear();
        worker_clients_.clear();
        orphaned_workers_.clear();
    }

    report.timed_out_tasks = runner_.pending();
    runner_.join_all();

    report.database_closed = db_.is_open();
    db_.close();
    return report;
}

// --- Handlers (run on worker threads) ---

json DaemonCore::handle_status(const json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"repository", repo_},
        {"pid", static_cast<int>(::getpid())},
        {"workers", workers_in_flight()},
        {"subscribers", subscribers_.size()},
    };
}

json DaemonCore::handle_create(const json& cmd) {
    CreateSessionParams params{
        .name = required_string(cmd, "name"),
        .parent_branch = optional_string(cmd, "parent_branch"),
        .initial_prompt = optional_string(cmd, "prompt"),
        .display_name = optional_string(cmd, "display_name"),
        .as_spec = cmd.value("as_spec", false),
        .was_auto_generated = cmd.value("auto_name", false),
        .custom_branch = optional_string(cmd, "custom_branch"),
        .version_group_id = optional_string(cmd, "version_group_id"),
        .agent_type = optional_string(cmd, "agent"),
        .epic_id = optional_string(cmd, "epic_id"),
    };
    if (cmd.contains("version_number") && !cmd["version_number"].is_null()) {
        params.version_number = cmd["version_number"].get<int>();
    }
    if (cmd.contains("skip_permissions") && !cmd["skip_permissions"].is_null()) {
        params.skip_permissions = cmd["skip_permissions"].get<bool>();
    }
    return result_response(sessions_.create_session(params), "session");
}

json DaemonCore::handle_start(const json& cmd) {
    return result_response(sessions_.start_session(required_string(cmd, "name")), "session");
}

json DaemonCore::handle_set_state(const json& cmd) {
    auto state = parse_session_state(required_string(cmd, "state"));
    if (!state) return error_response(Error::invalid_input("state", "Expected spec, running or reviewed"));
    return void_response(sessions_.transition_state(required_string(cmd, "name"), *state));
}

json DaemonCore::handle_start_spec(const json& cmd) {
    return result_response(
        sessions_.start_spec(required_string(cmd, "name"), optional_string(cmd, "base_branch")), "session");
}

json DaemonCore::handle_list(const json& /*cmd*/) {
    return result_response(sessions_.list_sessions(), "sessions");
}

json DaemonCore::handle_get(const json& cmd) {
    return result_response(sessions_.get_session(required_string(cmd, "name")), "session");
}

json DaemonCore::handle_cancel(const json& cmd) {
    bool delete_branch = !cmd.value("keep_branch", false);
    return result_response(sessions_.cancel_session(required_string(cmd, "name"), delete_branch), "result");
}

json DaemonCore::handle_mark_reviewed(const json& cmd) {
    return result_response(sessions_.mark_reviewed(required_string(cmd, "name")), "ready_to_merge");
}

json DaemonCore::handle_unmark_reviewed(const json& cmd) {
    return void_response(sessions_.unmark_reviewed(required_string(cmd, "name")));
}

json DaemonCore::handle_convert_to_spec(const json& cmd) {
    return result_response(sessions_.convert_to_spec(required_string(cmd, "name")), "spec");
}

json DaemonCore::handle_stats(const json& cmd) {
    return result_response(sessions_.git_stats(required_string(cmd, "name")), "stats");
}

json DaemonCore::handle_create_spec(const json& cmd) {
    return result_response(sessions_.create_spec(required_string(cmd, "name"), cmd.value("content", ""),
                                                 optional_string(cmd, "epic_id"),
                                                 optional_string(cmd, "display_name")),
                           "spec");
}

json DaemonCore::handle_list_specs(const json& /*cmd*/) {
    return result_response(sessions_.list_specs(), "specs");
}

json DaemonCore::handle_update_spec(const json& cmd) {
    return result_response(
        sessions_.update_spec_content(required_string(cmd, "name"), cmd.value("content", "")), "spec");
}

json DaemonCore::handle_delete_spec(const json& cmd) {
    return void_response(sessions_.delete_spec(required_string(cmd, "name")));
}

json DaemonCore::handle_create_epic(const json& cmd) {
    return result_response(sessions_.create_epic(required_string(cmd, "name"), optional_string(cmd, "color")),
                           "epic");
}

json DaemonCore::handle_list_epics(const json& /*cmd*/) {
    return result_response(sessions_.list_epics(), "epics");
}

json DaemonCore::handle_delete_epic(const json& cmd) {
    return void_response(sessions_.delete_epic(required_string(cmd, "id")));
}

json DaemonCore::handle_set_epic(const json& cmd) {
    return void_response(sessions_.set_item_epic(required_string(cmd, "name"), optional_string(cmd, "epic_id")));
}

json DaemonCore::handle_merge_preview(const json& cmd) {
    return result_response(merges_.compute_merge_preview(required_string(cmd, "name")), "preview");
}

json DaemonCore::handle_merge(const json& cmd) {
    auto mode = parse_merge_mode(cmd.value("mode", "squash"));
    if (!mode) return error_response(Error::invalid_input("mode", "Expected squash or reapply"));
    return result_response(
        merges_.apply_merge(required_string(cmd, "name"), *mode, optional_string(cmd, "message")), "outcome");
}

json DaemonCore::handle_update_from_parent(const json& cmd) {
    auto result = merges_.update_session_from_parent(required_string(cmd, "name"));
    auto resp = ok_response();
    resp["result"] = result;
    return resp;
}

json DaemonCore::handle_launch(const json& cmd) {
    AgentLaunchSpec spec;
    std::optional<Session> session;

    if (cmd.contains("command")) {
        spec.shell_command = cmd["command"].get<std::string>();
    } else {
        auto found = sessions_.get_session(required_string(cmd, "name"));
        if (!found) return error_response(found.error());
        if (found->session_state == SessionState::Spec || found->status == SessionStatus::Cancelled) {
            return error_response(Error::invalid_state(found->name, std::string(to_string(found->session_state)),
                                                       "running"));
        }

        auto agent_id = cmd.value("agent", found->original_agent_type.value_or(config_.default_agent));
        const auto* agent = AgentManifest::builtin().find(agent_id);
        if (!agent) return error_response(Error::agent_not_found(agent_id));

        AgentLaunchRequest request{
            .worktree_path = found->worktree_path,
            .skip_permissions = found->original_skip_permissions.value_or(config_.skip_permissions),
        };
        if (auto it = config_.agents.find(agent_id); it != config_.agents.end()) {
            request.binary = it->second.binary;
        }
        if (!cmd.value("resume", false)) request.prompt = found->initial_prompt;

        spec = build_agent_launch_spec(*agent, request);
        session = std::move(*found);
    }

    if (cmd.contains("env")) {
        spec.env_vars = cmd["env"].get<std::map<std::string, std::string>>();
    }

    std::string terminal_id = cmd.value("terminal_id", "");
    if (terminal_id.empty() && session) terminal_id = "session-" + session->name + "-top";

    std::optional<uint16_t> cols, rows;
    if (cmd.contains("cols")) cols = cmd["cols"].get<uint16_t>();
    if (cmd.contains("rows")) rows = cmd["rows"].get<uint16_t>();

    auto launched = launcher_.launch_in_terminal(terminal_id, spec, cols, rows);
    if (!launched) return error_response(launched.error());

    if (session && !session->resume_allowed) {
        auto allowed = db_.set_resume_allowed(session->id, true);
        if (!allowed) {
            std::println(stderr, "launch: failed to enable resume for {}: {}", session->name,
                         allowed.error().to_string());
        }
    }

    auto resp = ok_response();
    resp["terminal_id"] = terminal_id;
    resp["command"] = *launched;
    if (spec.initial_command) resp["initial_command"] = *spec.initial_command;
    return resp;
}

json DaemonCore::handle_branches(const json& /*cmd*/) {
    return result_response(git::list_branches(repo_), "branches");
}

json DaemonCore::handle_clone(const json& cmd) {
    CloneRequest request{
        .remote_url = required_string(cmd, "remote_url"),
        .parent_directory = required_string(cmd, "parent_directory"),
        .folder_name = required_string(cmd, "folder_name"),
    };

    std::vector<std::string> progress;
    auto cloned = git::clone_repository(request, [&](const std::string& line) {
        log("clone: " + line);
        progress.push_back(line);
    });
    if (!cloned) return error_response(cloned.error());

    auto resp = ok_response();
    resp["clone"] = *cloned;
    resp["progress"] = progress;
    return resp;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[schaltwerk] {}", msg);
    }
}
