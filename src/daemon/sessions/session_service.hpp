#pragma once

#include "errors.hpp"
#include "events/event_sink.hpp"
#include "git/stats.hpp"
#include "platform/process_inspector.hpp"
#include "sessions/cancellation.hpp"
#include "sessions/git_stats_cache.hpp"
#include "sessions/name_reservation.hpp"
#include "sessions/session.hpp"
#include "storage/session_db.hpp"

#include <optional>
#include <string>
#include <vector>

struct SessionSettings {
    std::string branch_prefix = "schaltwerk";
    std::string base_branch; // empty: detect from the repository
    std::string default_agent = "claude";
    bool skip_permissions = false;
};

struct CreateSessionParams {
    std::string name;
    std::optional<std::string> parent_branch;
    std::optional<std::string> initial_prompt;
    std::optional<std::string> display_name;
    bool as_spec = false;
    bool was_auto_generated = false;
    std::optional<std::string> custom_branch;
    std::optional<std::string> version_group_id;
    std::optional<int> version_number;
    std::optional<std::string> agent_type;
    std::optional<bool> skip_permissions;
    std::optional<std::string> epic_id;
};

// Session lifecycle for one repository: creation, state transitions,
// cancellation, specs and epics.
class SessionService {
public:
    SessionService(std::string repo, SessionDb& db, NameReservation& reservations,
                   GitStatsCache& stats, ProcessInspector& inspector, EventSink& events,
                   SessionSettings settings, bool verbose = false);

    const std::string& repo_path() const { return repo_; }

    Result<Session> create_session(const CreateSessionParams& params);
    // Materializes the worktree of a spec-state session and moves it to Running.
    Result<Session> start_session(const std::string& name);
    Result<void> transition_state(const std::string& name, SessionState target);
    Result<CancellationResult> cancel_session(const std::string& name, bool delete_branch = true);

    // Returns the resulting ready_to_merge flag (false when the worktree is dirty).
    Result<bool> mark_reviewed(const std::string& name);
    Result<void> unmark_reviewed(const std::string& name);
    Result<Spec> convert_to_spec(const std::string& name);

    Result<Session> get_session(const std::string& name);
    Result<std::vector<Session>> list_sessions();
    Result<GitStats> git_stats(const std::string& name);

    Result<Spec> create_spec(const std::string& name, const std::string& content,
                             const std::optional<std::string>& epic_id = std::nullopt,
                             const std::optional<std::string>& display_name = std::nullopt);
    Result<Spec> update_spec_content(const std::string& name, const std::string& content);
    Result<void> delete_spec(const std::string& name);
    Result<std::vector<Spec>> list_specs();
    Result<Session> start_spec(const std::string& name,
                               const std::optional<std::string>& base_branch = std::nullopt);

    Result<Epic> create_epic(const std::string& name, const std::optional<std::string>& color);
    Result<std::vector<Epic>> list_epics();
    Result<void> delete_epic(const std::string& id);
    Result<void> set_item_epic(const std::string& name, const std::optional<std::string>& epic_id);

    Result<std::string> resolve_parent_branch(const std::optional<std::string>& requested);

private:
    Result<Session> create_session_impl(const CreateSessionParams& params,
                                        const std::optional<std::string>& promoting_spec_id);
    Result<std::string> claim_name(const CreateSessionParams& params);
    Result<bool> name_in_use(const std::string& name,
                             const std::optional<std::string>& ignore_spec_id = std::nullopt);
    Result<void> prepare_worktree_path(const std::string& path);
    Result<void> demote_to_spec(const Session& session);
    std::string unique_branch(const std::string& branch) const;
    std::string worktree_path_for(const std::string& name) const;
    std::string repository_name() const;

    void emit_session(EngineEvent event, const Session& session);
    void emit_stats(const Session& session, const GitStats& stats);
    void log(const std::string& msg);

    std::string repo_;
    SessionDb& db_;
    NameReservation& reservations_;
    GitStatsCache& stats_;
    ProcessInspector& inspector_;
    EventSink& events_;
    SessionSettings settings_;
    bool verbose_;
};
