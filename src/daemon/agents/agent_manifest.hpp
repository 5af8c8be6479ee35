#pragma once

#include "errors.hpp"

#include <optional>
#include <string>
#include <vector>

struct AgentDefinition {
    std::string id;
    std::string display_name;
    std::string default_binary;
    std::vector<std::string> default_args;     // always passed
    std::vector<std::string> skip_permissions_args;
    std::string prompt_flag;                   // empty: prompt is positional
    bool prompt_via_stdin = false;             // prompt is piped in with echo
};

// The agent CLIs schaltwerk knows how to launch.
class AgentManifest {
public:
    explicit AgentManifest(std::vector<AgentDefinition> agents);

    static const AgentManifest& builtin();

    const AgentDefinition* find(const std::string& id) const;
    std::vector<std::string> supported_ids() const;
    bool is_supported(const std::string& id) const;

    Result<std::string> default_binary(const std::string& id) const;

    // Maps a command token (claude, /usr/local/bin/claude) to an agent id.
    std::optional<std::string> agent_id_for(const std::string& token) const;

private:
    std::vector<AgentDefinition> agents_;
};
