#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class ErrorKind {
    SessionNotFound,
    SessionAlreadyExists,
    WorktreeNotFound,
    WorktreeAlreadyExists,
    GitOperationFailed,
    MergeConflict,
    InvalidSessionState,
    DatabaseError,
    InvalidInput,
    IoError,
    AgentNotFound,
    TerminalNotFound,
    TerminalOperationFailed,
    ConfigError,
};

std::string_view to_string(ErrorKind kind);

// Typed error carried by every engine operation. Which fields are meaningful
// depends on the kind; to_string() renders the user-visible message.
struct Error {
    ErrorKind kind;
    std::string message;
    std::string subject;   // session id, terminal id, agent name, config key
    std::string operation; // git/io/terminal operation
    std::string field;     // invalid input field
    std::string path;      // worktree or io path
    std::string current_state;
    std::string expected_state;
    std::vector<std::string> files;

    std::string to_string() const;

    static Error session_not_found(std::string id);
    static Error session_already_exists(std::string id);
    static Error worktree_not_found(std::string path);
    static Error worktree_already_exists(std::string path);
    static Error git(std::string operation, std::string message);
    static Error merge_conflict(std::vector<std::string> files, std::string message);
    static Error invalid_state(std::string id, std::string current, std::string expected);
    static Error database(std::string message);
    static Error invalid_input(std::string field, std::string message);
    static Error io(std::string operation, std::string path, std::string message);
    static Error agent_not_found(std::string name);
    static Error terminal_not_found(std::string id);
    static Error terminal(std::string id, std::string operation, std::string message);
    static Error config(std::string key, std::string message);
};

template <typename T>
using Result = std::expected<T, Error>;
