#include "errors.hpp"

#include <format>

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SessionNotFound: return "session_not_found";
        case ErrorKind::SessionAlreadyExists: return "session_already_exists";
        case ErrorKind::WorktreeNotFound: return "worktree_not_found";
        case ErrorKind::WorktreeAlreadyExists: return "worktree_already_exists";
        case ErrorKind::GitOperationFailed: return "git_operation_failed";
        case ErrorKind::MergeConflict: return "merge_conflict";
        case ErrorKind::InvalidSessionState: return "invalid_session_state";
        case ErrorKind::DatabaseError: return "database_error";
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::IoError: return "io_error";
        case ErrorKind::AgentNotFound: return "agent_not_found";
        case ErrorKind::TerminalNotFound: return "terminal_not_found";
        case ErrorKind::TerminalOperationFailed: return "terminal_operation_failed";
        case ErrorKind::ConfigError: return "config_error";
    }
    return "unknown";
}

std::string Error::to_string() const {
    switch (kind) {
        case ErrorKind::SessionNotFound:
            return std::format("Session '{}' not found", subject);
        case ErrorKind::SessionAlreadyExists:
            return std::format("Session '{}' already exists", subject);
        case ErrorKind::WorktreeNotFound:
            return std::format("Worktree not found at path: {}", path);
        case ErrorKind::WorktreeAlreadyExists:
            return std::format("Worktree already exists at path: {}", path);
        case ErrorKind::GitOperationFailed:
            return std::format("Git operation '{}' failed: {}", operation, message);
        case ErrorKind::MergeConflict:
            return std::format("Merge conflict in {} file(s): {}", files.size(), message);
        case ErrorKind::InvalidSessionState:
            return std::format("Session '{}' is in state '{}', expected '{}'",
                               subject, current_state, expected_state);
        case ErrorKind::DatabaseError:
            return std::format("Database error: {}", message);
        case ErrorKind::InvalidInput:
            return std::format("Invalid input for field '{}': {}", field, message);
        case ErrorKind::IoError:
            return std::format("I/O error during '{}' on '{}': {}", operation, path, message);
        case ErrorKind::AgentNotFound:
            return std::format("Agent '{}' not found", subject);
        case ErrorKind::TerminalNotFound:
            return std::format("Terminal '{}' not found", subject);
        case ErrorKind::TerminalOperationFailed:
            return std::format("Terminal operation '{}' failed for terminal '{}': {}",
                               operation, subject, message);
        case ErrorKind::ConfigError:
            return std::format("Configuration error for key '{}': {}", subject, message);
    }
    return message;
}

Error Error::session_not_found(std::string id) {
    return {.kind = ErrorKind::SessionNotFound, .subject = std::move(id)};
}

Error Error::session_already_exists(std::string id) {
    return {.kind = ErrorKind::SessionAlreadyExists, .subject = std::move(id)};
}

Error Error::worktree_not_found(std::string path) {
    return {.kind = ErrorKind::WorktreeNotFound, .path = std::move(path)};
}

Error Error::worktree_already_exists(std::string path) {
    return {.kind = ErrorKind::WorktreeAlreadyExists, .path = std::move(path)};
}

Error Error::git(std::string operation, std::string message) {
    return {.kind = ErrorKind::GitOperationFailed, .message = std::move(message),
            .operation = std::move(operation)};
}

Error Error::merge_conflict(std::vector<std::string> files, std::string message) {
    return {.kind = ErrorKind::MergeConflict, .message = std::move(message),
            .files = std::move(files)};
}

Error Error::invalid_state(std::string id, std::string current, std::string expected) {
    return {.kind = ErrorKind::InvalidSessionState, .subject = std::move(id),
            .current_state = std::move(current), .expected_state = std::move(expected)};
}

Error Error::database(std::string message) {
    return {.kind = ErrorKind::DatabaseError, .message = std::move(message)};
}

Error Error::invalid_input(std::string field, std::string message) {
    return {.kind = ErrorKind::InvalidInput, .message = std::move(message),
            .field = std::move(field)};
}

Error Error::io(std::string operation, std::string path, std::string message) {
    return {.kind = ErrorKind::IoError, .message = std::move(message),
            .operation = std::move(operation), .path = std::move(path)};
}

Error Error::agent_not_found(std::string name) {
    return {.kind = ErrorKind::AgentNotFound, .subject = std::move(name)};
}

Error Error::terminal_not_found(std::string id) {
    return {.kind = ErrorKind::TerminalNotFound, .subject = std::move(id)};
}

Error Error::terminal(std::string id, std::string operation, std::string message) {
    return {.kind = ErrorKind::TerminalOperationFailed, .message = std::move(message),
            .subject = std::move(id), .operation = std::move(operation)};
}

Error Error::config(std::string key, std::string message) {
    return {.kind = ErrorKind::ConfigError, .message = std::move(message),
            .subject = std::move(key)};
}
