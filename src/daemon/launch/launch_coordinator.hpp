#pragma once

#include "agents/agent_manifest.hpp"
#include "agents/launch_spec.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "launch/terminal_locks.hpp"
#include "platform/terminal_backend.hpp"
#include "timed_runner.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Starts agent processes in terminals. Launches into the same terminal id
// are serialized; each launch is bounded by a timeout.
class LaunchCoordinator {
public:
    LaunchCoordinator(TerminalBackend& terminals, const AgentManifest& manifest,
                      TerminalLockRegistry& locks, TimedRunner& runner,
                      std::map<std::string, AgentSettings> agent_settings,
                      std::chrono::milliseconds timeout = std::chrono::seconds(12),
                      bool verbose = false);

    // Returns the shell command that was launched.
    Result<std::string> launch_in_terminal(const std::string& terminal_id, const AgentLaunchSpec& spec,
                                           std::optional<uint16_t> cols = std::nullopt,
                                           std::optional<uint16_t> rows = std::nullopt);

private:
    Result<std::string> launch_locked(const std::string& terminal_id, const AgentLaunchSpec& spec,
                                      std::optional<uint16_t> cols, std::optional<uint16_t> rows);
    void log(const std::string& msg);

    TerminalBackend& terminals_;
    const AgentManifest& manifest_;
    TerminalLockRegistry& locks_;
    TimedRunner& runner_;
    std::map<std::string, AgentSettings> agent_settings_;
    std::chrono::milliseconds timeout_;
    bool verbose_;
};

// Fails with an IoError unless dir is an existing, enterable directory.
Result<void> ensure_cwd_access(const std::string& dir);
