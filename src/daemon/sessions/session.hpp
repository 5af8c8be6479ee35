#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class SessionStatus { Active, Cancelled, Spec };
enum class SessionState { Spec, Running, Reviewed };

std::string_view to_string(SessionStatus status);
std::string_view to_string(SessionState state);
std::optional<SessionStatus> parse_session_status(std::string_view s);
std::optional<SessionState> parse_session_state(std::string_view s);

// Allowed moves of the lifecycle state machine. Staying in place is allowed.
bool can_transition(SessionState from, SessionState to);

int64_t unix_now();
std::string generate_id();

struct Session {
    std::string id;
    std::string name;
    std::optional<std::string> display_name;
    std::optional<std::string> version_group_id;
    std::optional<int> version_number;
    std::optional<std::string> epic_id;
    std::string repository_path;
    std::string repository_name;
    std::string branch;
    std::string parent_branch;
    std::optional<std::string> original_parent_branch;
    std::string worktree_path;
    SessionStatus status = SessionStatus::Active;
    SessionState session_state = SessionState::Running;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    std::optional<int64_t> last_activity;
    std::optional<std::string> initial_prompt;
    std::optional<std::string> spec_content;
    bool ready_to_merge = false;
    bool resume_allowed = true;
    bool pending_name_generation = false;
    bool was_auto_generated = false;
    std::optional<std::string> original_agent_type;
    std::optional<bool> original_skip_permissions;
};

struct Spec {
    std::string id;
    std::string name;
    std::optional<std::string> display_name;
    std::optional<std::string> epic_id;
    std::string repository_path;
    std::string repository_name;
    std::string content;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

struct Epic {
    std::string id;
    std::string repository_path;
    std::string name;
    std::optional<std::string> color;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};
