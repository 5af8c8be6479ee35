#include "protocol.hpp"

namespace {

template <typename T>
nlohmann::json nullable(const std::optional<T>& value) {
    if (!value) return nullptr;
    return *value;
}

} // namespace

void to_json(nlohmann::json& j, const Session& s) {
    j = {
        {"id", s.id},
        {"name", s.name},
        {"display_name", nullable(s.display_name)},
        {"version_group_id", nullable(s.version_group_id)},
        {"version_number", nullable(s.version_number)},
        {"epic_id", nullable(s.epic_id)},
        {"repository_path", s.repository_path},
        {"repository_name", s.repository_name},
        {"branch", s.branch},
        {"parent_branch", s.parent_branch},
        {"original_parent_branch", nullable(s.original_parent_branch)},
        {"worktree_path", s.worktree_path},
        {"status", std::string(to_string(s.status))},
        {"session_state", std::string(to_string(s.session_state))},
        {"created_at", s.created_at},
        {"updated_at", s.updated_at},
        {"last_activity", nullable(s.last_activity)},
        {"initial_prompt", nullable(s.initial_prompt)},
        {"spec_content", nullable(s.spec_content)},
        {"ready_to_merge", s.ready_to_merge},
        {"resume_allowed", s.resume_allowed},
        {"pending_name_generation", s.pending_name_generation},
        {"was_auto_generated", s.was_auto_generated},
        {"original_agent_type", nullable(s.original_agent_type)},
        {"original_skip_permissions", nullable(s.original_skip_permissions)},
    };
}

void to_json(nlohmann::json& j, const Spec& s) {
    j = {
        {"id", s.id},
        {"name", s.name},
        {"display_name", nullable(s.display_name)},
        {"epic_id", nullable(s.epic_id)},
        {"repository_path", s.repository_path},
        {"repository_name", s.repository_name},
        {"content", s.content},
        {"created_at", s.created_at},
        {"updated_at", s.updated_at},
    };
}

void to_json(nlohmann::json& j, const Epic& e) {
    j = {
        {"id", e.id},
        {"repository_path", e.repository_path},
        {"name", e.name},
        {"color", nullable(e.color)},
        {"created_at", e.created_at},
        {"updated_at", e.updated_at},
    };
}

void to_json(nlohmann::json& j, const GitStats& s) {
    j = {
        {"session_id", s.session_id},
        {"files_changed", s.files_changed},
        {"lines_added", s.lines_added},
        {"lines_removed", s.lines_removed},
        {"has_uncommitted", s.has_uncommitted},
        {"calculated_at", s.calculated_at},
    };
}

void to_json(nlohmann::json& j, const MergePreview& p) {
    j = {
        {"session_branch", p.session_branch},
        {"parent_branch", p.parent_branch},
        {"squash_commands", p.squash_commands},
        {"reapply_commands", p.reapply_commands},
        {"default_commit_message", p.default_commit_message},
        {"has_conflicts", p.has_conflicts},
        {"conflicting_paths", p.conflicting_paths},
        {"is_up_to_date", p.is_up_to_date},
    };
}

void to_json(nlohmann::json& j, const MergeOutcome& o) {
    j = {
        {"session_branch", o.session_branch},
        {"parent_branch", o.parent_branch},
        {"new_commit", o.new_commit},
        {"mode", std::string(to_string(o.mode))},
    };
}

void to_json(nlohmann::json& j, const UpdateSessionFromParentResult& r) {
    j = {
        {"status", std::string(to_string(r.status))},
        {"parent_branch", r.parent_branch},
        {"message", r.message},
        {"conflicting_paths", r.conflicting_paths},
    };
}

void to_json(nlohmann::json& j, const CancellationResult& r) {
    j = {
        {"terminated_processes", r.terminated_processes},
        {"worktree_removed", r.worktree_removed},
        {"branch_deleted", r.branch_deleted},
        {"errors", r.errors},
    };
}

void to_json(nlohmann::json& j, const CloneResult& r) {
    j = {
        {"project_path", r.project_path},
        {"remote_display", r.remote_display},
        {"remote_history", r.remote_history},
    };
}

nlohmann::json ok_response() {
    return {{"status", "ok"}};
}

nlohmann::json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

nlohmann::json error_response(const Error& error) {
    return {
        {"status", "error"},
        {"kind", std::string(to_string(error.kind))},
        {"message", error.to_string()},
    };
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}
