#include "agents/command_parser.hpp"

#include "git/git_command.hpp"

#include <cctype>
#include <format>

namespace {

// Position of the last '|' outside quotes, or npos.
size_t last_unquoted_pipe(const std::string& s) {
    size_t found = std::string::npos;
    char quote = 0;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (quote) {
            if (c == '\\' && quote == '"' && i + 1 < s.size()) i++;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '\\' && i + 1 < s.size()) {
            i++;
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '|') {
            found = i;
        }
    }
    return found;
}

} // namespace

std::string normalize_cwd(const std::string& cwd) {
    auto trimmed = git::trim(cwd);
    if (trimmed.size() >= 2) {
        char first = trimmed.front();
        if ((first == '"' || first == '\'') && trimmed.back() == first) {
            return trimmed.substr(1, trimmed.size() - 2);
        }
    }
    return trimmed;
}

std::expected<std::vector<std::string>, std::string> shell_split(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];

        if (quote == '\'') {
            if (c == '\'') quote = 0;
            else current += c;
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < text.size() &&
                       (text[i + 1] == '"' || text[i + 1] == '\\' || text[i + 1] == '$' ||
                        text[i + 1] == '`')) {
                current += text[++i];
            } else {
                current += c;
            }
            continue;
        }

        if (c == ' ' || c == '\t' || c == '\n') {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\') {
            if (i + 1 < text.size()) current += text[++i];
        } else {
            current += c;
        }
    }

    if (quote) return std::unexpected(std::format("unterminated {} quote", quote));
    if (in_word) words.push_back(std::move(current));
    return words;
}

std::string shell_quote(const std::string& word) {
    if (word.empty()) return "''";
    bool plain = true;
    for (char c : word) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '/' || c == '-' || c == '_' ||
              c == '.' || c == ',' || c == ':' || c == '=' || c == '@' || c == '+')) {
            plain = false;
            break;
        }
    }
    if (plain) return word;

    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

Result<ParsedAgentCommand> parse_agent_command(const std::string& command, const AgentManifest& manifest) {
    auto sep = command.find(" && ");
    if (sep == std::string::npos) {
        return std::unexpected(Error::invalid_input("command", std::format(
            "Invalid command format, expected 'cd <dir> && <agent> ...': {}", command)));
    }

    auto left = git::trim(command.substr(0, sep));
    if (!left.starts_with("cd ")) {
        return std::unexpected(Error::invalid_input("command", std::format(
            "Command must start with 'cd <dir>': {}", command)));
    }

    ParsedAgentCommand parsed;
    parsed.cwd = normalize_cwd(left.substr(3));
    if (parsed.cwd.empty()) {
        return std::unexpected(Error::invalid_input("command", "Command has an empty working directory"));
    }

    auto right = git::trim(command.substr(sep + 4));
    auto pipe = last_unquoted_pipe(right);
    if (pipe != std::string::npos) right = git::trim(right.substr(pipe + 1));

    auto words = shell_split(right);
    if (!words) {
        return std::unexpected(Error::invalid_input("command", "Could not split agent command: " + words.error()));
    }
    if (words->empty()) {
        return std::unexpected(Error::invalid_input("command", "Command names no agent"));
    }

    parsed.agent = words->front();
    if (!manifest.agent_id_for(parsed.agent)) {
        return std::unexpected(Error::invalid_input("command", std::format(
            "Unsupported agent '{}'", parsed.agent)));
    }

    parsed.args.assign(words->begin() + 1, words->end());
    return parsed;
}
