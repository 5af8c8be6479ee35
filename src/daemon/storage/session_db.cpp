#include "session_db.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* SESSION_COLUMNS =
    "id, name, display_name, version_group_id, version_number, epic_id, "
    "repository_path, repository_name, branch, parent_branch, original_parent_branch, "
    "worktree_path, status, session_state, created_at, updated_at, last_activity, "
    "initial_prompt, spec_content, ready_to_merge, resume_allowed, pending_name_generation, "
    "was_auto_generated, original_agent_type, original_skip_permissions";

constexpr const char* SPEC_COLUMNS =
    "id, name, display_name, epic_id, repository_path, repository_name, content, "
    "created_at, updated_at";

constexpr const char* EPIC_COLUMNS = "id, repository_path, name, color, created_at, updated_at";

// Owns a prepared statement for the duration of one query.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) stmt_ = nullptr;
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& val) {
    sqlite3_bind_text(stmt, idx, val.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_nullable(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& val) {
    if (!val) sqlite3_bind_null(stmt, idx);
    else sqlite3_bind_text(stmt, idx, val->c_str(), -1, SQLITE_TRANSIENT);
}

std::string get_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

std::optional<std::string> get_nullable_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return get_text(stmt, col);
}

std::optional<int64_t> get_nullable_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

Session read_session(sqlite3_stmt* stmt) {
    Session s;
    s.id = get_text(stmt, 0);
    s.name = get_text(stmt, 1);
    s.display_name = get_nullable_text(stmt, 2);
    s.version_group_id = get_nullable_text(stmt, 3);
    if (auto v = get_nullable_int(stmt, 4)) s.version_number = static_cast<int>(*v);
    s.epic_id = get_nullable_text(stmt, 5);
    s.repository_path = get_text(stmt, 6);
    s.repository_name = get_text(stmt, 7);
    s.branch = get_text(stmt, 8);
    s.parent_branch = get_text(stmt, 9);
    s.original_parent_branch = get_nullable_text(stmt, 10);
    s.worktree_path = get_text(stmt, 11);
    s.status = parse_session_status(get_text(stmt, 12)).value_or(SessionStatus::Active);
    s.session_state = parse_session_state(get_text(stmt, 13)).value_or(SessionState::Running);
    s.created_at = sqlite3_column_int64(stmt, 14);
    s.updated_at = sqlite3_column_int64(stmt, 15);
    s.last_activity = get_nullable_int(stmt, 16);
    s.initial_prompt = get_nullable_text(stmt, 17);
    s.spec_content = get_nullable_text(stmt, 18);
    s.ready_to_merge = sqlite3_column_int(stmt, 19) != 0;
    s.resume_allowed = sqlite3_column_int(stmt, 20) != 0;
    s.pending_name_generation = sqlite3_column_int(stmt, 21) != 0;
    s.was_auto_generated = sqlite3_column_int(stmt, 22) != 0;
    s.original_agent_type = get_nullable_text(stmt, 23);
    if (auto v = get_nullable_int(stmt, 24)) s.original_skip_permissions = *v != 0;
    return s;
}

Spec read_spec(sqlite3_stmt* stmt) {
    return Spec{
        .id = get_text(stmt, 0),
        .name = get_text(stmt, 1),
        .display_name = get_nullable_text(stmt, 2),
        .epic_id = get_nullable_text(stmt, 3),
        .repository_path = get_text(stmt, 4),
        .repository_name = get_text(stmt, 5),
        .content = get_text(stmt, 6),
        .created_at = sqlite3_column_int64(stmt, 7),
        .updated_at = sqlite3_column_int64(stmt, 8),
    };
}

Epic read_epic(sqlite3_stmt* stmt) {
    return Epic{
        .id = get_text(stmt, 0),
        .repository_path = get_text(stmt, 1),
        .name = get_text(stmt, 2),
        .color = get_nullable_text(stmt, 3),
        .created_at = sqlite3_column_int64(stmt, 4),
        .updated_at = sqlite3_column_int64(stmt, 5),
    };
}

} // namespace

SessionDb::SessionDb() = default;

SessionDb::~SessionDb() {
    close();
}

bool SessionDb::open(const std::string& path) {
    std::lock_guard lock(mu_);

    if (path != ":memory:") {
        fs::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    return create_tables();
}

void SessionDb::close() {
    std::lock_guard lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SessionDb::is_open() const {
    std::lock_guard lock(mu_);
    return db_ != nullptr;
}

bool SessionDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            display_name TEXT,
            version_group_id TEXT,
            version_number INTEGER,
            epic_id TEXT,
            repository_path TEXT NOT NULL,
            repository_name TEXT NOT NULL,
            branch TEXT NOT NULL,
            parent_branch TEXT NOT NULL,
            original_parent_branch TEXT,
            worktree_path TEXT NOT NULL,
            status TEXT NOT NULL,
            session_state TEXT NOT NULL DEFAULT 'running',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            last_activity INTEGER,
            initial_prompt TEXT,
            spec_content TEXT,
            ready_to_merge BOOLEAN NOT NULL DEFAULT FALSE,
            resume_allowed BOOLEAN NOT NULL DEFAULT TRUE,
            pending_name_generation BOOLEAN NOT NULL DEFAULT FALSE,
            was_auto_generated BOOLEAN NOT NULL DEFAULT FALSE,
            original_agent_type TEXT,
            original_skip_permissions BOOLEAN,
            UNIQUE(repository_path, name)
        );
        CREATE INDEX IF NOT EXISTS idx_sessions_repo ON sessions(repository_path);
        CREATE INDEX IF NOT EXISTS idx_sessions_repo_order
            ON sessions(repository_path, ready_to_merge, last_activity DESC);

        CREATE TABLE IF NOT EXISTS specs (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            display_name TEXT,
            epic_id TEXT,
            repository_path TEXT NOT NULL,
            repository_name TEXT NOT NULL,
            content TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE(repository_path, name)
        );

        CREATE TABLE IF NOT EXISTS epics (
            id TEXT PRIMARY KEY,
            repository_path TEXT NOT NULL,
            name TEXT NOT NULL,
            color TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            UNIQUE(repository_path, name)
        );

        CREATE TABLE IF NOT EXISTS git_stats (
            session_id TEXT PRIMARY KEY,
            files_changed INTEGER NOT NULL,
            lines_added INTEGER NOT NULL,
            lines_removed INTEGER NOT NULL,
            has_uncommitted BOOLEAN NOT NULL,
            calculated_at INTEGER NOT NULL,
            FOREIGN KEY(session_id) REFERENCES sessions(id) ON DELETE CASCADE
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

Result<int> SessionDb::execute(const char* sql, const std::function<void(sqlite3_stmt*)>& bind) {
    if (!db_) return std::unexpected(Error::database("database is not open"));

    Statement stmt(db_, sql);
    if (!stmt) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    bind(stmt.get());
    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        if (sqlite3_extended_errcode(db_) == SQLITE_CONSTRAINT_UNIQUE) {
            return std::unexpected(Error::database(std::format("unique constraint violated: {}",
                                                               sqlite3_errmsg(db_))));
        }
        return std::unexpected(Error::database(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_);
}

Result<std::vector<Session>> SessionDb::query_sessions(const char* sql,
                                                       const std::vector<std::string>& params) {
    if (!db_) return std::unexpected(Error::database("database is not open"));

    Statement stmt(db_, sql);
    if (!stmt) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    for (size_t i = 0; i < params.size(); i++) {
        bind_text(stmt.get(), static_cast<int>(i + 1), params[i]);
    }

    std::vector<Session> sessions;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        sessions.push_back(read_session(stmt.get()));
    }
    if (rc != SQLITE_DONE) return std::unexpected(Error::database(sqlite3_errmsg(db_)));
    return sessions;
}

// --- Sessions ---

Result<void> SessionDb::insert_session(const Session& s) {
    std::lock_guard lock(mu_);
    auto sql = std::format("INSERT INTO sessions ({}) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, "
                           "?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19, ?20, ?21, ?22, ?23, "
                           "?24, ?25)",
                           SESSION_COLUMNS);

    auto res = execute(sql.c_str(), [&s](sqlite3_stmt* stmt) {
        bind_text(stmt, 1, s.id);
        bind_text(stmt, 2, s.name);
        bind_nullable(stmt, 3, s.display_name);
        bind_nullable(stmt, 4, s.version_group_id);
        if (s.version_number) sqlite3_bind_int(stmt, 5, *s.version_number);
        else sqlite3_bind_null(stmt, 5);
        bind_nullable(stmt, 6, s.epic_id);
        bind_text(stmt, 7, s.repository_path);
        bind_text(stmt, 8, s.repository_name);
        bind_text(stmt, 9, s.branch);
        bind_text(stmt, 10, s.parent_branch);
        bind_nullable(stmt, 11, s.original_parent_branch);
        bind_text(stmt, 12, s.worktree_path);
        bind_text(stmt, 13, std::string(to_string(s.status)));
        bind_text(stmt, 14, std::string(to_string(s.session_state)));
        sqlite3_bind_int64(stmt, 15, s.created_at);
        sqlite3_bind_int64(stmt, 16, s.updated_at);
        if (s.last_activity) sqlite3_bind_int64(stmt, 17, *s.last_activity);
        else sqlite3_bind_null(stmt, 17);
        bind_nullable(stmt, 18, s.initial_prompt);
        bind_nullable(stmt, 19, s.spec_content);
        sqlite3_bind_int(stmt, 20, s.ready_to_merge ? 1 : 0);
        sqlite3_bind_int(stmt, 21, s.resume_allowed ? 1 : 0);
        sqlite3_bind_int(stmt, 22, s.pending_name_generation ? 1 : 0);
        sqlite3_bind_int(stmt, 23, s.was_auto_generated ? 1 : 0);
        bind_nullable(stmt, 24, s.original_agent_type);
        if (s.original_skip_permissions) sqlite3_bind_int(stmt, 25, *s.original_skip_permissions ? 1 : 0);
        else sqlite3_bind_null(stmt, 25);
    });
    if (!res) return std::unexpected(res.error());
    return {};
}

Result<Session> SessionDb::get_session_by_name(const std::string& repo, const std::string& name) {
    std::lock_guard lock(mu_);
    auto sql = std::format("SELECT {} FROM sessions WHERE repository_path = ?1 AND name = ?2",
                           SESSION_COLUMNS);
    auto rows = query_sessions(sql.c_str(), {repo, name});
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return std::unexpected(Error::session_not_found(name));
    return std::move(rows->front());
}

Result<Session> SessionDb::get_session_by_id(const std::string& id) {
    std::lock_guard lock(mu_);
    auto sql = std::format("SELECT {} FROM sessions WHERE id = ?1", SESSION_COLUMNS);
    auto rows = query_sessions(sql.c_str(), {id});
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return std::unexpected(Error::session_not_found(id));
    return std::move(rows->front());
}

Result<std::vector<Session>> SessionDb::list_sessions(const std::string& repo, bool include_cancelled) {
    std::lock_guard lock(mu_);
    auto sql = std::format(
        "SELECT {} FROM sessions WHERE repository_path = ?1 {} "
        "ORDER BY ready_to_merge ASC, last_activity DESC, created_at DESC",
        SESSION_COLUMNS, include_cancelled ? "" : "AND status != 'cancelled'");
    return query_sessions(sql.c_str(), {repo});
}

Result<void> SessionDb::delete_session(const std::string& id) {
    std::lock_guard lock(mu_);
    auto res = execute("DELETE FROM sessions WHERE id = ?1",
                       [&id](sqlite3_stmt* stmt) { bind_text(stmt, 1, id); });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::update_session_state(const std::string& id, SessionState state) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE sessions SET session_state = ?2, updated_at = ?3 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           bind_text(stmt, 2, std::string(to_string(state)));
                           sqlite3_bind_int64(stmt, 3, unix_now());
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::update_session_status(const std::string& id, SessionStatus status) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE sessions SET status = ?2, updated_at = ?3 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           bind_text(stmt, 2, std::string(to_string(status)));
                           sqlite3_bind_int64(stmt, 3, unix_now());
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::update_ready_to_merge(const std::string& id, bool ready) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE sessions SET ready_to_merge = ?2, updated_at = ?3 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           sqlite3_bind_int(stmt, 2, ready ? 1 : 0);
                           sqlite3_bind_int64(stmt, 3, unix_now());
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::set_session_activity(const std::string& id, int64_t timestamp) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE sessions SET last_activity = ?2 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           sqlite3_bind_int64(stmt, 2, timestamp);
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::set_resume_allowed(const std::string& id, bool allowed) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE sessions SET resume_allowed = ?2 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           sqlite3_bind_int(stmt, 2, allowed ? 1 : 0);
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::set_pending_name_generation(const std::string& id, bool pending) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE sessions SET pending_name_generation = ?2 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           sqlite3_bind_int(stmt, 2, pending ? 1 : 0);
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::set_session_epic(const std::string& id, const std::optional<std::string>& epic_id) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE sessions SET epic_id = ?2, updated_at = ?3 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           bind_nullable(stmt, 2, epic_id);
                           sqlite3_bind_int64(stmt, 3, unix_now());
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::set_original_settings(const std::string& id, const std::string& agent_type,
                                              bool skip_permissions) {
    std::lock_guard lock(mu_);
    auto res = execute(
        "UPDATE sessions SET original_agent_type = ?2, original_skip_permissions = ?3 WHERE id = ?1",
        [&](sqlite3_stmt* stmt) {
            bind_text(stmt, 1, id);
            bind_text(stmt, 2, agent_type);
            sqlite3_bind_int(stmt, 3, skip_permissions ? 1 : 0);
        });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

// --- Specs ---

Result<void> SessionDb::insert_spec(const Spec& spec) {
    std::lock_guard lock(mu_);
    auto sql = std::format("INSERT INTO specs ({}) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)",
                           SPEC_COLUMNS);
    auto res = execute(sql.c_str(), [&spec](sqlite3_stmt* stmt) {
        bind_text(stmt, 1, spec.id);
        bind_text(stmt, 2, spec.name);
        bind_nullable(stmt, 3, spec.display_name);
        bind_nullable(stmt, 4, spec.epic_id);
        bind_text(stmt, 5, spec.repository_path);
        bind_text(stmt, 6, spec.repository_name);
        bind_text(stmt, 7, spec.content);
        sqlite3_bind_int64(stmt, 8, spec.created_at);
        sqlite3_bind_int64(stmt, 9, spec.updated_at);
    });
    if (!res) return std::unexpected(res.error());
    return {};
}

Result<Spec> SessionDb::get_spec_by_name(const std::string& repo, const std::string& name) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(Error::database("database is not open"));

    auto sql = std::format("SELECT {} FROM specs WHERE repository_path = ?1 AND name = ?2",
                           SPEC_COLUMNS);
    Statement stmt(db_, sql.c_str());
    if (!stmt) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    bind_text(stmt.get(), 1, repo);
    bind_text(stmt.get(), 2, name);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return read_spec(stmt.get());
    if (rc == SQLITE_DONE) return std::unexpected(Error::session_not_found(name));
    return std::unexpected(Error::database(sqlite3_errmsg(db_)));
}

Result<std::vector<Spec>> SessionDb::list_specs(const std::string& repo) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(Error::database("database is not open"));

    auto sql = std::format("SELECT {} FROM specs WHERE repository_path = ?1 ORDER BY updated_at DESC",
                           SPEC_COLUMNS);
    Statement stmt(db_, sql.c_str());
    if (!stmt) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    bind_text(stmt.get(), 1, repo);
    std::vector<Spec> specs;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        specs.push_back(read_spec(stmt.get()));
    }
    if (rc != SQLITE_DONE) return std::unexpected(Error::database(sqlite3_errmsg(db_)));
    return specs;
}

Result<void> SessionDb::update_spec_content(const std::string& id, const std::string& content) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE specs SET content = ?2, updated_at = ?3 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           bind_text(stmt, 2, content);
                           sqlite3_bind_int64(stmt, 3, unix_now());
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::set_spec_epic(const std::string& id, const std::optional<std::string>& epic_id) {
    std::lock_guard lock(mu_);
    auto res = execute("UPDATE specs SET epic_id = ?2, updated_at = ?3 WHERE id = ?1",
                       [&](sqlite3_stmt* stmt) {
                           bind_text(stmt, 1, id);
                           bind_nullable(stmt, 2, epic_id);
                           sqlite3_bind_int64(stmt, 3, unix_now());
                       });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

Result<void> SessionDb::delete_spec(const std::string& id) {
    std::lock_guard lock(mu_);
    auto res = execute("DELETE FROM specs WHERE id = ?1",
                       [&id](sqlite3_stmt* stmt) { bind_text(stmt, 1, id); });
    if (!res) return std::unexpected(res.error());
    if (*res == 0) return std::unexpected(Error::session_not_found(id));
    return {};
}

// --- Epics ---

Result<void> SessionDb::insert_epic(const Epic& epic) {
    std::lock_guard lock(mu_);
    auto sql = std::format("INSERT INTO epics ({}) VALUES (?1, ?2, ?3, ?4, ?5, ?6)", EPIC_COLUMNS);
    auto res = execute(sql.c_str(), [&epic](sqlite3_stmt* stmt) {
        bind_text(stmt, 1, epic.id);
        bind_text(stmt, 2, epic.repository_path);
        bind_text(stmt, 3, epic.name);
        bind_nullable(stmt, 4, epic.color);
        sqlite3_bind_int64(stmt, 5, epic.created_at);
        sqlite3_bind_int64(stmt, 6, epic.updated_at);
    });
    if (!res) return std::unexpected(res.error());
    return {};
}

Result<std::optional<Epic>> SessionDb::get_epic(const std::string& id) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(Error::database("database is not open"));

    auto sql = std::format("SELECT {} FROM epics WHERE id = ?1", EPIC_COLUMNS);
    Statement stmt(db_, sql.c_str());
    if (!stmt) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    bind_text(stmt.get(), 1, id);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return std::optional<Epic>(read_epic(stmt.get()));
    if (rc == SQLITE_DONE) return std::optional<Epic>();
    return std::unexpected(Error::database(sqlite3_errmsg(db_)));
}

Result<std::vector<Epic>> SessionDb::list_epics(const std::string& repo) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(Error::database("database is not open"));

    auto sql = std::format("SELECT {} FROM epics WHERE repository_path = ?1 ORDER BY name ASC",
                           EPIC_COLUMNS);
    Statement stmt(db_, sql.c_str());
    if (!stmt) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    bind_text(stmt.get(), 1, repo);
    std::vector<Epic> epics;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        epics.push_back(read_epic(stmt.get()));
    }
    if (rc != SQLITE_DONE) return std::unexpected(Error::database(sqlite3_errmsg(db_)));
    return epics;
}

Result<void> SessionDb::delete_epic(const std::string& id) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(Error::database("database is not open"));

    if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return std::unexpected(Error::database(sqlite3_errmsg(db_)));
    }

    auto bind_id = [&id](sqlite3_stmt* stmt) { bind_text(stmt, 1, id); };
    auto cleared_sessions = execute("UPDATE sessions SET epic_id = NULL WHERE epic_id = ?1", bind_id);
    auto cleared_specs = cleared_sessions
        ? execute("UPDATE specs SET epic_id = NULL WHERE epic_id = ?1", bind_id)
        : cleared_sessions;
    auto deleted = cleared_specs ? execute("DELETE FROM epics WHERE id = ?1", bind_id) : cleared_specs;

    if (!deleted || *deleted == 0) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        if (!deleted) return std::unexpected(deleted.error());
        return std::unexpected(Error::invalid_input("epic_id", std::format("Epic '{}' not found", id)));
    }

    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        auto err = Error::database(sqlite3_errmsg(db_));
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return std::unexpected(err);
    }
    return {};
}

// --- Git stats ---

Result<std::optional<GitStats>> SessionDb::get_git_stats(const std::string& session_id) {
    std::lock_guard lock(mu_);
    if (!db_) return std::unexpected(Error::database("database is not open"));

    Statement stmt(db_,
                   "SELECT session_id, files_changed, lines_added, lines_removed, has_uncommitted, "
                   "calculated_at FROM git_stats WHERE session_id = ?1");
    if (!stmt) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    bind_text(stmt.get(), 1, session_id);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) return std::optional<GitStats>();
    if (rc != SQLITE_ROW) return std::unexpected(Error::database(sqlite3_errmsg(db_)));

    return std::optional<GitStats>(GitStats{
        .session_id = get_text(stmt.get(), 0),
        .files_changed = sqlite3_column_int64(stmt.get(), 1),
        .lines_added = sqlite3_column_int64(stmt.get(), 2),
        .lines_removed = sqlite3_column_int64(stmt.get(), 3),
        .has_uncommitted = sqlite3_column_int(stmt.get(), 4) != 0,
        .calculated_at = sqlite3_column_int64(stmt.get(), 5),
    });
}

Result<void> SessionDb::save_git_stats(const GitStats& stats) {
    std::lock_guard lock(mu_);
    auto res = execute(
        "INSERT OR REPLACE INTO git_stats (session_id, files_changed, lines_added, lines_removed, "
        "has_uncommitted, calculated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6)",
        [&stats](sqlite3_stmt* stmt) {
            bind_text(stmt, 1, stats.session_id);
            sqlite3_bind_int64(stmt, 2, stats.files_changed);
            sqlite3_bind_int64(stmt, 3, stats.lines_added);
            sqlite3_bind_int64(stmt, 4, stats.lines_removed);
            sqlite3_bind_int(stmt, 5, stats.has_uncommitted ? 1 : 0);
            sqlite3_bind_int64(stmt, 6, stats.calculated_at);
        });
    if (!res) return std::unexpected(res.error());
    return {};
}
