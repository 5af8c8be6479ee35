#pragma once

#include "agents/agent_manifest.hpp"
#include "errors.hpp"

#include <expected>
#include <string>
#include <vector>

struct ParsedAgentCommand {
    std::string cwd;
    std::string agent; // the command token as written, possibly a path
    std::vector<std::string> args;
};

// Splits "cd <dir> && <agent> <args...>" into its parts. Only agents listed
// in the manifest are accepted.
Result<ParsedAgentCommand> parse_agent_command(const std::string& command,
                                               const AgentManifest& manifest = AgentManifest::builtin());

// Strips one pair of matching quotes around a directory.
std::string normalize_cwd(const std::string& cwd);

// POSIX-shell style word splitting: single quotes, double quotes and
// backslash escapes. Fails on an unterminated quote.
std::expected<std::vector<std::string>, std::string> shell_split(const std::string& text);

// Quotes a word for a POSIX shell when it needs it.
std::string shell_quote(const std::string& word);
