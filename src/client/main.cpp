#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [args] [options]", prog);
    std::println(stderr, "Sessions:");
    std::println(stderr, "  create <name> [--prompt P] [--parent B] [--branch B] [--agent A] [--spec]");
    std::println(stderr, "  list                              List sessions");
    std::println(stderr, "  get <name>                        Show one session");
    std::println(stderr, "  start <name>                      Materialize a spec session");
    std::println(stderr, "  state <name> <spec|running|reviewed>");
    std::println(stderr, "  cancel <name> [--keep-branch]     Remove worktree and branch");
    std::println(stderr, "  review <name> | unreview <name>   Toggle ready-to-merge");
    std::println(stderr, "  to-spec <name>                    Convert a session back to a spec");
    std::println(stderr, "  stats <name>                      Show diff stats");
    std::println(stderr, "  launch <name> [--resume] [--terminal ID]");
    std::println(stderr, "Specs and epics:");
    std::println(stderr, "  spec-create <name> [--content C]  spec-list  spec-update <name> --content C");
    std::println(stderr, "  spec-delete <name>                spec-start <name> [--parent B]");
    std::println(stderr, "  epic-create <name> [--color C]    epic-list  epic-delete <id>");
    std::println(stderr, "  epic-set <name> [--epic ID]");
    std::println(stderr, "Merging:");
    std::println(stderr, "  preview <name>                    Show what a merge would do");
    std::println(stderr, "  merge <name> [--mode squash|reapply] [--message M]");
    std::println(stderr, "  update <name>                     Rebase the session onto its parent");
    std::println(stderr, "Repository:");
    std::println(stderr, "  branches                          List branches");
    std::println(stderr, "  clone <url> <parent-dir> <folder> Clone a repository");
    std::println(stderr, "Daemon:");
    std::println(stderr, "  status                            Show daemon status");
    std::println(stderr, "  watch                             Stream engine events");
}

struct Args {
    std::vector<std::string> positional;
    std::optional<std::string> prompt, parent, branch, agent, content, color, epic, mode, message, terminal;
    bool spec = false;
    bool keep_branch = false;
    bool resume = false;
};

static Args parse_args(int argc, char* argv[]) {
    Args a;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            return std::nullopt;
        };
        if (arg == "--prompt") a.prompt = next();
        else if (arg == "--parent") a.parent = next();
        else if (arg == "--branch") a.branch = next();
        else if (arg == "--agent") a.agent = next();
        else if (arg == "--content") a.content = next();
        else if (arg == "--color") a.color = next();
        else if (arg == "--epic") a.epic = next();
        else if (arg == "--mode") a.mode = next();
        else if (arg == "--message") a.message = next();
        else if (arg == "--terminal") a.terminal = next();
        else if (arg == "--spec") a.spec = true;
        else if (arg == "--keep-branch") a.keep_branch = true;
        else if (arg == "--resume") a.resume = true;
        else a.positional.push_back(arg);
    }
    return a;
}

static void set_if(json& cmd, const char* key, const std::optional<std::string>& value) {
    if (value) cmd[key] = *value;
}

// Maps a command line onto a daemon request. nullopt: unknown command or
// missing arguments.
static std::optional<json> build_command(const std::string& command, const Args& a) {
    auto need = [&](size_t n) { return a.positional.size() >= n; };
    auto named = [&](const char* cmd) -> std::optional<json> {
        if (!need(1)) return std::nullopt;
        return json{{"cmd", cmd}, {"name", a.positional[0]}};
    };

    if (command == "status") return json{{"cmd", "status"}};
    if (command == "list") return json{{"cmd", "list"}};
    if (command == "branches") return json{{"cmd", "branches"}};
    if (command == "spec-list") return json{{"cmd", "list_specs"}};
    if (command == "epic-list") return json{{"cmd", "list_epics"}};
    if (command == "watch") return json{{"cmd", "subscribe"}};

    if (command == "get") return named("get");
    if (command == "start") return named("start");
    if (command == "review") return named("mark_reviewed");
    if (command == "unreview") return named("unmark_reviewed");
    if (command == "to-spec") return named("convert_to_spec");
    if (command == "stats") return named("stats");
    if (command == "preview") return named("merge_preview");
    if (command == "update") return named("update_from_parent");
    if (command == "spec-delete") return named("delete_spec");

    if (command == "create") {
        auto cmd = named("create");
        if (!cmd) return cmd;
        set_if(*cmd, "prompt", a.prompt);
        set_if(*cmd, "parent_branch", a.parent);
        set_if(*cmd, "custom_branch", a.branch);
        set_if(*cmd, "agent", a.agent);
        set_if(*cmd, "epic_id", a.epic);
        if (a.spec) (*cmd)["as_spec"] = true;
        return cmd;
    }
    if (command == "state") {
        if (!need(2)) return std::nullopt;
        return json{{"cmd", "set_state"}, {"name", a.positional[0]}, {"state", a.positional[1]}};
    }
    if (command == "cancel") {
        auto cmd = named("cancel");
        if (cmd && a.keep_branch) (*cmd)["keep_branch"] = true;
        return cmd;
    }
    if (command == "launch") {
        auto cmd = named("launch");
        if (!cmd) return cmd;
        set_if(*cmd, "terminal_id", a.terminal);
        set_if(*cmd, "agent", a.agent);
        if (a.resume) (*cmd)["resume"] = true;
        return cmd;
    }
    if (command == "spec-create" || command == "spec-update") {
        auto cmd = named(command == "spec-create" ? "create_spec" : "update_spec");
        if (!cmd) return cmd;
        (*cmd)["content"] = a.content.value_or("");
        set_if(*cmd, "epic_id", a.epic);
        return cmd;
    }
    if (command == "spec-start") {
        auto cmd = named("start_spec");
        if (cmd) set_if(*cmd, "base_branch", a.parent);
        return cmd;
    }
    if (command == "epic-create") {
        auto cmd = named("create_epic");
        if (cmd) set_if(*cmd, "color", a.color);
        return cmd;
    }
    if (command == "epic-delete") {
        if (!need(1)) return std::nullopt;
        return json{{"cmd", "delete_epic"}, {"id", a.positional[0]}};
    }
    if (command == "epic-set") {
        auto cmd = named("set_epic");
        if (cmd) set_if(*cmd, "epic_id", a.epic);
        return cmd;
    }
    if (command == "merge") {
        auto cmd = named("merge");
        if (!cmd) return cmd;
        (*cmd)["mode"] = a.mode.value_or("squash");
        set_if(*cmd, "message", a.message);
        return cmd;
    }
    if (command == "clone") {
        if (!need(3)) return std::nullopt;
        return json{{"cmd", "clone"},
                    {"remote_url", a.positional[0]},
                    {"parent_directory", a.positional[1]},
                    {"folder_name", a.positional[2]}};
    }
    return std::nullopt;
}

static void print_session(const json& s) {
    std::println("{:<24} {:<10} {:<10} {}{}", s.value("name", ""), s.value("session_state", ""),
                 s.value("status", ""), s.value("branch", ""),
                 s.value("ready_to_merge", false) ? "  [ready]" : "");
}

static void print_response(const std::string& command, const json& response) {
    if (response.contains("sessions")) {
        for (const auto& s : response["sessions"]) print_session(s);
    } else if (response.contains("specs")) {
        for (const auto& s : response["specs"]) std::println("{}", s.value("name", ""));
    } else if (response.contains("epics")) {
        for (const auto& e : response["epics"]) std::println("{}  {}", e.value("id", ""), e.value("name", ""));
    } else if (response.contains("branches")) {
        for (const auto& b : response["branches"]) std::println("{}", b.get<std::string>());
    } else if (command == "status") {
        std::println("Repository: {}", response.value("repository", ""));
        std::println("Workers in flight: {}", response.value("workers", 0));
    } else if (response.size() > 1) {
        std::println("{}", response.dump(2));
    } else {
        std::println("OK");
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        usage(argv[0]);
        return 0;
    }

    auto cmd = build_command(command, parse_args(argc, argv));
    if (!cmd) {
        std::println(stderr, "Unknown command or missing arguments: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is schaltwerkd running?");
        return 1;
    }

    if (!client.send(*cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // Merges and clones may run for minutes.
    constexpr int RESPONSE_TIMEOUT_MS = 10 * 60 * 1000;

    json response;
    if (!client.recv(response, RESPONSE_TIMEOUT_MS)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "watch") {
        json event;
        while (client.recv(event, -1)) {
            std::println("{} {}", event.value("event", ""), event["payload"].dump());
        }
        return 0;
    }

    print_response(command, response);
    return 0;
}
