#include "agents/agent_manifest.hpp"

#include <algorithm>

AgentManifest::AgentManifest(std::vector<AgentDefinition> agents) : agents_(std::move(agents)) {}

const AgentManifest& AgentManifest::builtin() {
    static const AgentManifest manifest({
        {.id = "claude", .display_name = "Claude", .default_binary = "claude",
         .skip_permissions_args = {"--dangerously-skip-permissions"}},
        {.id = "codex", .display_name = "Codex", .default_binary = "codex",
         .default_args = {"--sandbox", "workspace-write"},
         .skip_permissions_args = {"--sandbox", "danger-full-access"}},
        {.id = "gemini", .display_name = "Gemini", .default_binary = "gemini",
         .skip_permissions_args = {"--yolo"}, .prompt_flag = "--prompt-interactive"},
        {.id = "opencode", .display_name = "OpenCode", .default_binary = "opencode",
         .prompt_flag = "--prompt"},
        {.id = "qwen", .display_name = "Qwen", .default_binary = "qwen",
         .skip_permissions_args = {"--yolo"}, .prompt_flag = "--prompt-interactive"},
        {.id = "droid", .display_name = "Droid", .default_binary = "droid"},
        {.id = "amp", .display_name = "Amp", .default_binary = "amp",
         .skip_permissions_args = {"--dangerously-allow-all"}, .prompt_via_stdin = true},
        {.id = "copilot", .display_name = "Copilot", .default_binary = "copilot",
         .skip_permissions_args = {"--allow-all-tools"}},
        {.id = "kilocode", .display_name = "Kilo Code", .default_binary = "kilocode"},
    });
    return manifest;
}

const AgentDefinition* AgentManifest::find(const std::string& id) const {
    auto it = std::ranges::find_if(agents_, [&](const AgentDefinition& a) { return a.id == id; });
    return it != agents_.end() ? &*it : nullptr;
}

std::vector<std::string> AgentManifest::supported_ids() const {
    std::vector<std::string> ids;
    for (const auto& a : agents_) ids.push_back(a.id);
    return ids;
}

bool AgentManifest::is_supported(const std::string& id) const {
    return find(id) != nullptr;
}

Result<std::string> AgentManifest::default_binary(const std::string& id) const {
    auto* agent = find(id);
    if (!agent) return std::unexpected(Error::agent_not_found(id));
    return agent->default_binary;
}

std::optional<std::string> AgentManifest::agent_id_for(const std::string& token) const {
    for (const auto& a : agents_) {
        if (token == a.id || token.ends_with("/" + a.id)) return a.id;
    }
    return std::nullopt;
}
