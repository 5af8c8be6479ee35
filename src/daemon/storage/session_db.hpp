#pragma once

#include "errors.hpp"
#include "git/stats.hpp"
#include "sessions/session.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

// Persistent store for sessions, specs, epics and cached git stats. A single
// connection is shared by all worker threads and serialized by mu_.
class SessionDb {
public:
    SessionDb();
    ~SessionDb();

    SessionDb(const SessionDb&) = delete;
    SessionDb& operator=(const SessionDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    // Sessions
    Result<void> insert_session(const Session& session);
    Result<Session> get_session_by_name(const std::string& repo, const std::string& name);
    Result<Session> get_session_by_id(const std::string& id);
    Result<std::vector<Session>> list_sessions(const std::string& repo, bool include_cancelled = false);
    Result<void> delete_session(const std::string& id);
    Result<void> update_session_state(const std::string& id, SessionState state);
    Result<void> update_session_status(const std::string& id, SessionStatus status);
    Result<void> update_ready_to_merge(const std::string& id, bool ready);
    Result<void> set_session_activity(const std::string& id, int64_t timestamp);
    Result<void> set_resume_allowed(const std::string& id, bool allowed);
    Result<void> set_pending_name_generation(const std::string& id, bool pending);
    Result<void> set_session_epic(const std::string& id, const std::optional<std::string>& epic_id);
    Result<void> set_original_settings(const std::string& id, const std::string& agent_type,
                                       bool skip_permissions);

    // Specs
    Result<void> insert_spec(const Spec& spec);
    Result<Spec> get_spec_by_name(const std::string& repo, const std::string& name);
    Result<std::vector<Spec>> list_specs(const std::string& repo);
    Result<void> update_spec_content(const std::string& id, const std::string& content);
    Result<void> set_spec_epic(const std::string& id, const std::optional<std::string>& epic_id);
    Result<void> delete_spec(const std::string& id);

    // Epics
    Result<void> insert_epic(const Epic& epic);
    Result<std::optional<Epic>> get_epic(const std::string& id);
    Result<std::vector<Epic>> list_epics(const std::string& repo);
    // Clears the epic reference on member sessions and specs, then deletes it.
    Result<void> delete_epic(const std::string& id);

    // Git stats cache
    Result<std::optional<GitStats>> get_git_stats(const std::string& session_id);
    Result<void> save_git_stats(const GitStats& stats);

private:
    bool create_tables();
    // Runs a statement that returns no rows; yields the number of changed rows.
    Result<int> execute(const char* sql, const std::function<void(sqlite3_stmt*)>& bind);
    Result<std::vector<Session>> query_sessions(const char* sql,
                                                const std::vector<std::string>& params);

    sqlite3* db_ = nullptr;
    mutable std::mutex mu_;
};
