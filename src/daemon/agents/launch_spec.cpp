#include "agents/launch_spec.hpp"

#include "agents/command_parser.hpp"
#include "git/git_command.hpp"

std::string escape_for_double_quotes(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') out += '\\';
        out += c;
    }
    return out;
}

AgentLaunchSpec build_agent_launch_spec(const AgentDefinition& agent, const AgentLaunchRequest& request) {
    auto binary = git::trim(request.binary);
    if (binary.empty()) binary = agent.default_binary;

    std::string invocation = shell_quote(binary);
    const auto& flags = request.skip_permissions && !agent.skip_permissions_args.empty()
        ? agent.skip_permissions_args : agent.default_args;
    for (const auto& flag : flags) invocation += " " + shell_quote(flag);

    AgentLaunchSpec spec;
    std::string prompt = request.prompt ? git::trim(*request.prompt) : std::string();
    std::string quoted_prompt = "\"" + escape_for_double_quotes(prompt) + "\"";

    std::string command = "cd " + shell_quote(request.worktree_path) + " && ";
    if (prompt.empty()) {
        command += invocation;
    } else if (agent.prompt_via_stdin) {
        command += "echo " + quoted_prompt + " | " + invocation;
        // Launching execs the agent directly, so the piped prompt is replayed.
        spec.initial_command = prompt;
    } else if (!agent.prompt_flag.empty()) {
        command += invocation + " " + agent.prompt_flag + " " + quoted_prompt;
    } else {
        command += invocation + " " + quoted_prompt;
    }

    spec.shell_command = std::move(command);
    return spec;
}
