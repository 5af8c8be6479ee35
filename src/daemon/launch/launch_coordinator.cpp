#include "launch/launch_coordinator.hpp"

#include "agents/command_parser.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

Result<void> ensure_cwd_access(const std::string& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return std::unexpected(Error::io("ensure_cwd_access", dir, "Directory does not exist"));
    }
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected(Error::io("ensure_cwd_access", dir, "Path is not a directory"));
    }
    if (::access(dir.c_str(), R_OK | X_OK) != 0) {
        return std::unexpected(Error::io("ensure_cwd_access", dir, std::strerror(errno)));
    }
    return {};
}

LaunchCoordinator::LaunchCoordinator(TerminalBackend& terminals, const AgentManifest& manifest,
                                     TerminalLockRegistry& locks, TimedRunner& runner,
                                     std::map<std::string, AgentSettings> agent_settings,
                                     std::chrono::milliseconds timeout, bool verbose)
    : terminals_(terminals), manifest_(manifest), locks_(locks), runner_(runner),
      agent_settings_(std::move(agent_settings)), timeout_(timeout), verbose_(verbose) {}

Result<std::string> LaunchCoordinator::launch_in_terminal(const std::string& terminal_id,
                                                          const AgentLaunchSpec& spec,
                                                          std::optional<uint16_t> cols,
                                                          std::optional<uint16_t> rows) {
    if (terminal_id.empty()) {
        return std::unexpected(Error::invalid_input("terminal_id", "Terminal id cannot be empty"));
    }

    auto mutex = locks_.lock_for(terminal_id);
    std::unique_lock lock(*mutex);

    auto result = runner_.run<Result<std::string>>(timeout_, [this, terminal_id, spec, cols, rows]() {
        return launch_locked(terminal_id, spec, cols, rows);
    });

    if (result) return std::move(*result);

    // The spawn may still complete in the background after this point.
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout_).count();
    std::println(stderr, "launch: terminal {} exceeded {}s, closing it", terminal_id, secs);
    auto closed = terminals_.close_terminal(terminal_id);
    if (!closed) {
        std::println(stderr, "launch: close after timeout failed: {}", closed.error().to_string());
    }
    return std::unexpected(Error::terminal(terminal_id, "launch", std::format(
        "Agent launch exceeded {} seconds and was cancelled. Please retry.", secs)));
}

Result<std::string> LaunchCoordinator::launch_locked(const std::string& terminal_id,
                                                     const AgentLaunchSpec& spec,
                                                     std::optional<uint16_t> cols,
                                                     std::optional<uint16_t> rows) {
    auto parsed = parse_agent_command(spec.shell_command, manifest_);
    if (!parsed) return std::unexpected(parsed.error());

    auto access = ensure_cwd_access(parsed->cwd);
    if (!access) return std::unexpected(access.error());

    auto agent_id = manifest_.agent_id_for(parsed->agent);
    if (!agent_id) return std::unexpected(Error::agent_not_found(parsed->agent));

    const AgentSettings* settings = nullptr;
    if (auto it = agent_settings_.find(*agent_id); it != agent_settings_.end()) settings = &it->second;

    // An explicit path in the command wins over configuration.
    std::string binary = parsed->agent;
    if (parsed->agent.find('/') == std::string::npos) {
        if (settings && !settings->binary.empty()) {
            binary = settings->binary;
        } else {
            auto default_binary = manifest_.default_binary(*agent_id);
            if (!default_binary) return std::unexpected(default_binary.error());
            binary = *default_binary;
        }
    }

    std::map<std::string, std::string> env_map;
    if (settings) env_map = settings->env;
    for (const auto& [key, value] : spec.env_vars) env_map[key] = value;
    EnvVars env(env_map.begin(), env_map.end());

    std::vector<std::string> args;
    if (settings && !settings->cli_args.empty()) {
        auto extra = shell_split(settings->cli_args);
        if (!extra) {
            return std::unexpected(Error::config(std::format("agents.{}.cli_args", *agent_id), extra.error()));
        }
        args = std::move(*extra);
    }
    args.insert(args.end(), parsed->args.begin(), parsed->args.end());

    auto exists = terminals_.terminal_exists(terminal_id);
    if (!exists) return std::unexpected(exists.error());
    if (*exists) {
        log("Closing existing terminal " + terminal_id);
        auto closed = terminals_.close_terminal(terminal_id);
        if (!closed) return std::unexpected(closed.error());
    }

    log(std::format("Launching {} in {} (terminal {})", binary, parsed->cwd, terminal_id));

    Result<void> created;
    if (cols && rows) {
        created = terminals_.create_terminal_with_app_and_size({
            .id = terminal_id,
            .cwd = parsed->cwd,
            .command = binary,
            .args = args,
            .env = env,
            .cols = *cols,
            .rows = *rows,
        });
    } else {
        created = terminals_.create_terminal_with_app(terminal_id, parsed->cwd, binary, args, env);
    }
    if (!created) return std::unexpected(created.error());

    return spec.shell_command;
}

void LaunchCoordinator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[schaltwerk] {}", msg);
    }
}
