#include "sessions/session_service.hpp"

#include "git/branches.hpp"
#include "git/git_command.hpp"
#include "git/worktrees.hpp"
#include "sessions/finalizer.hpp"

#include <filesystem>
#include <format>
#include <print>
#include <random>

namespace fs = std::filesystem;

namespace {

constexpr int UNIQUE_NAME_ATTEMPTS = 10;

std::string random_suffix(size_t len) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 25);
    std::string out;
    for (size_t i = 0; i < len; i++) out.push_back(static_cast<char>('a' + dist(rng)));
    return out;
}

// Current states a session must be in to move to target.
std::string expected_source(SessionState target) {
    switch (target) {
        case SessionState::Spec: return "running";
        case SessionState::Running: return "spec|reviewed";
        case SessionState::Reviewed: return "running";
    }
    return "running";
}

} // namespace

SessionService::SessionService(std::string repo, SessionDb& db, NameReservation& reservations,
                               GitStatsCache& stats, ProcessInspector& inspector, EventSink& events,
                               SessionSettings settings, bool verbose)
    : repo_(std::move(repo)), db_(db), reservations_(reservations), stats_(stats),
      inspector_(inspector), events_(events), settings_(std::move(settings)), verbose_(verbose) {}

Result<Session> SessionService::create_session(const CreateSessionParams& params) {
    return create_session_impl(params, std::nullopt);
}

Result<Session> SessionService::create_session_impl(const CreateSessionParams& params,
                                                    const std::optional<std::string>& promoting_spec_id) {
    if (!git::is_valid_session_name(params.name)) {
        return std::unexpected(Error::invalid_input(
            "name", "Invalid session name: use only letters, numbers, hyphens, underscores and dots"));
    }

    log(std::format("Creating session '{}' in {}", params.name, repo_));

    auto name = claim_name(params);
    if (!name) return std::unexpected(name.error());
    ReservationGuard reservation(reservations_, repo_, *name);

    // From here on the reservation guarantees no concurrent creator holds this name.
    auto existing = db_.get_session_by_name(repo_, *name);
    if (existing) {
        if (existing->status != SessionStatus::Cancelled) {
            return std::unexpected(Error::session_already_exists(*name));
        }
        auto removed = db_.delete_session(existing->id);
        if (!removed) return std::unexpected(removed.error());
    } else if (existing.error().kind != ErrorKind::SessionNotFound) {
        return std::unexpected(existing.error());
    }

    auto spec = db_.get_spec_by_name(repo_, *name);
    if (spec && spec->id != promoting_spec_id) {
        return std::unexpected(Error::session_already_exists(*name));
    }

    std::string branch = params.custom_branch.value_or(settings_.branch_prefix + "/" + *name);
    if (!git::is_valid_branch_name(branch)) {
        return std::unexpected(Error::invalid_input(
            "branch", "Invalid branch name: branch names must be valid git references"));
    }

    std::string parent;
    if (params.as_spec) {
        auto resolved = resolve_parent_branch(params.parent_branch);
        parent = resolved ? *resolved
                          : params.parent_branch.value_or(settings_.base_branch.empty()
                                                              ? "main" : settings_.base_branch);
    } else {
        if (!git::resolve_commit(repo_, "HEAD")) {
            return std::unexpected(Error::git(
                "create_session", "Repository has no commits; create an initial commit first"));
        }
        auto resolved = resolve_parent_branch(params.parent_branch);
        if (!resolved) return std::unexpected(resolved.error());
        parent = *resolved;
        if (git::branch_exists(repo_, branch)) branch = unique_branch(branch);
    }

    auto now = unix_now();
    Session session{
        .id = generate_id(),
        .name = *name,
        .display_name = params.display_name,
        .version_group_id = params.version_group_id,
        .version_number = params.version_number,
        .epic_id = params.epic_id,
        .repository_path = repo_,
        .repository_name = repository_name(),
        .branch = branch,
        .parent_branch = parent,
        .original_parent_branch = parent,
        .worktree_path = worktree_path_for(*name),
        .status = params.as_spec ? SessionStatus::Spec : SessionStatus::Active,
        .session_state = params.as_spec ? SessionState::Spec : SessionState::Running,
        .created_at = now,
        .updated_at = now,
        .last_activity = std::nullopt,
        .initial_prompt = params.initial_prompt,
        .spec_content = params.as_spec ? params.initial_prompt : std::nullopt,
        .ready_to_merge = false,
        .resume_allowed = true,
        .pending_name_generation = params.was_auto_generated,
        .was_auto_generated = params.was_auto_generated,
        .original_agent_type = params.agent_type.value_or(settings_.default_agent),
        .original_skip_permissions = params.skip_permissions.value_or(settings_.skip_permissions),
    };

    if (!params.as_spec) {
        auto prepared = prepare_worktree_path(session.worktree_path);
        if (!prepared) return std::unexpected(prepared.error());

        auto created = git::create_worktree_from_base(repo_, session.branch,
                                                      session.worktree_path, parent);
        if (!created) return std::unexpected(created.error());
    }

    SessionFinalizer finalizer(db_, stats_, verbose_);
    auto finalized = finalizer.finalize_creation({
        .session = session,
        .compute_git_stats = !params.as_spec,
        .update_activity = true,
    });
    if (!finalized) {
        if (!params.as_spec) {
            auto removed = git::remove_worktree(repo_, session.worktree_path);
            if (!removed) {
                std::println(stderr, "session: rollback of worktree {} failed: {}",
                             session.worktree_path, removed.error().to_string());
            }
            auto deleted = git::delete_branch(repo_, session.branch);
            if (!deleted) {
                std::println(stderr, "session: rollback of branch {} failed: {}",
                             session.branch, deleted.error().to_string());
            }
        }
        return std::unexpected(finalized.error());
    }

    reservation.release();

    emit_session(EngineEvent::SessionAdded, finalized->session);
    if (finalized->git_stats) emit_stats(finalized->session, *finalized->git_stats);

    log(std::format("Created session '{}' on branch {} (parent {})", session.name,
                    session.branch, session.parent_branch));
    return finalized->session;
}

Result<std::string> SessionService::claim_name(const CreateSessionParams& params) {
    if (reservations_.reserve(repo_, params.name)) {
        if (!params.was_auto_generated) return params.name;

        auto taken = name_in_use(params.name);
        if (!taken) {
            reservations_.unreserve(repo_, params.name);
            return std::unexpected(taken.error());
        }
        if (!*taken) return params.name;
        reservations_.unreserve(repo_, params.name);
    } else if (!params.was_auto_generated) {
        return std::unexpected(Error::session_already_exists(params.name));
    }

    for (int attempt = 0; attempt < UNIQUE_NAME_ATTEMPTS; attempt++) {
        auto candidate = params.name + "-" + random_suffix(2);
        if (!reservations_.reserve(repo_, candidate)) continue;

        auto taken = name_in_use(candidate);
        if (taken && !*taken) return candidate;
        reservations_.unreserve(repo_, candidate);
    }
    return std::unexpected(Error::session_already_exists(params.name));
}

Result<bool> SessionService::name_in_use(const std::string& name,
                                         const std::optional<std::string>& ignore_spec_id) {
    auto session = db_.get_session_by_name(repo_, name);
    if (session) {
        if (session->status != SessionStatus::Cancelled) return true;
    } else if (session.error().kind != ErrorKind::SessionNotFound) {
        return std::unexpected(session.error());
    }

    auto spec = db_.get_spec_by_name(repo_, name);
    if (spec) return spec->id != ignore_spec_id;
    if (spec.error().kind != ErrorKind::SessionNotFound) return std::unexpected(spec.error());
    return false;
}

Result<void> SessionService::prepare_worktree_path(const std::string& path) {
    auto pruned = git::prune_worktrees(repo_);
    if (!pruned) return pruned;

    if (git::is_worktree_registered(repo_, path)) {
        return std::unexpected(Error::worktree_already_exists(path));
    }

    std::error_code ec;
    if (fs::exists(path, ec)) {
        log("Removing stale directory at " + path);
        fs::remove_all(path, ec);
        if (ec) return std::unexpected(Error::io("remove_stale_worktree", path, ec.message()));
    }
    return {};
}

std::string SessionService::unique_branch(const std::string& branch) const {
    for (int attempt = 0; attempt < UNIQUE_NAME_ATTEMPTS; attempt++) {
        auto candidate = branch + "-" + random_suffix(2);
        if (!git::branch_exists(repo_, candidate)) return candidate;
    }
    return branch + "-" + random_suffix(6);
}

Result<Session> SessionService::start_session(const std::string& name) {
    auto session = db_.get_session_by_name(repo_, name);
    if (!session) return std::unexpected(session.error());

    if (session->status == SessionStatus::Cancelled) {
        return std::unexpected(Error::invalid_state(name, "cancelled", "spec"));
    }
    if (session->session_state != SessionState::Spec) {
        return std::unexpected(Error::invalid_state(name, std::string(to_string(session->session_state)), "spec"));
    }

    if (!reservations_.reserve(repo_, name)) {
        return std::unexpected(Error::invalid_input("name",
                                                    std::format("Session '{}' is already being started", name)));
    }
    ReservationGuard reservation(reservations_, repo_, name);

    if (!git::resolve_commit(repo_, "HEAD")) {
        return std::unexpected(Error::git(
            "start_session", "Repository has no commits; create an initial commit first"));
    }
    if (!git::branch_exists(repo_, session->parent_branch)) {
        return std::unexpected(Error::invalid_input(
            "parent_branch", std::format("Branch '{}' does not exist", session->parent_branch)));
    }

    auto prepared = prepare_worktree_path(session->worktree_path);
    if (!prepared) return std::unexpected(prepared.error());

    bool new_branch = !git::branch_exists(repo_, session->branch);
    auto created = new_branch
        ? git::create_worktree_from_base(repo_, session->branch, session->worktree_path,
                                         session->parent_branch)
        : git::create_worktree_for_branch(repo_, session->branch, session->worktree_path);
    if (!created) return std::unexpected(created.error());

    auto rollback = [&]() {
        auto removed = git::remove_worktree(repo_, session->worktree_path);
        if (!removed) {
            std::println(stderr, "session: rollback of worktree {} failed: {}",
                         session->worktree_path, removed.error().to_string());
        }
        if (!new_branch) return;
        auto deleted = git::delete_branch(repo_, session->branch);
        if (!deleted) {
            std::println(stderr, "session: rollback of branch {} failed: {}",
                         session->branch, deleted.error().to_string());
        }
    };

    auto status = db_.update_session_status(session->id, SessionStatus::Active);
    if (!status) {
        rollback();
        return std::unexpected(status.error());
    }

    SessionFinalizer finalizer(db_, stats_, verbose_);
    auto transitioned = finalizer.finalize_state_transition(session->id, SessionState::Running);
    if (!transitioned) {
        rollback();
        auto restored = db_.update_session_status(session->id, SessionStatus::Spec);
        if (!restored) {
            std::println(stderr, "session: failed to restore spec status for {}: {}",
                         name, restored.error().to_string());
        }
        return std::unexpected(transitioned.error());
    }

    auto started = db_.get_session_by_id(session->id);
    if (!started) return std::unexpected(started.error());

    auto stats = stats_.refresh(*started);
    if (stats) emit_stats(*started, *stats);
    else std::println(stderr, "session: git stats failed for {}: {}", name, stats.error().to_string());

    events_.emit(EngineEvent::SessionStateChanged,
                 {{"session_name", name}, {"from", "spec"}, {"to", "running"}});
    log(std::format("Started session '{}' in {}", name, started->worktree_path));
    return started;
}

Result<void> SessionService::transition_state(const std::string& name, SessionState target) {
    auto session = db_.get_session_by_name(repo_, name);
    if (!session) return std::unexpected(session.error());

    if (session->status == SessionStatus::Cancelled) {
        return std::unexpected(Error::invalid_state(name, "cancelled", expected_source(target)));
    }

    auto from = session->session_state;
    if (from == target) return {};
    if (!can_transition(from, target)) {
        return std::unexpected(Error::invalid_state(name, std::string(to_string(from)),
                                                    expected_source(target)));
    }

    if (from == SessionState::Spec && target == SessionState::Running) {
        auto started = start_session(name);
        if (!started) return std::unexpected(started.error());
        return {};
    }

    if (target == SessionState::Spec) {
        return demote_to_spec(*session);
    }

    if (target == SessionState::Running) {
        auto cleared = db_.update_ready_to_merge(session->id, false);
        if (!cleared) return cleared;
    }

    SessionFinalizer finalizer(db_, stats_, verbose_);
    auto transitioned = finalizer.finalize_state_transition(session->id, target);
    if (!transitioned) return transitioned;

    events_.emit(EngineEvent::SessionStateChanged,
                 {{"session_name", name}, {"from", std::string(to_string(from))}, {"to", std::string(to_string(target))}});
    return {};
}

Result<void> SessionService::demote_to_spec(const Session& session) {
    CancellationCoordinator coordinator(repo_, db_, inspector_, verbose_);
    CancellationConfig config;
    config.final_status = SessionStatus::Spec;

    auto torn_down = coordinator.cancel_session(session, config);
    if (!torn_down) return std::unexpected(torn_down.error());

    auto cleared = db_.update_ready_to_merge(session.id, false);
    if (!cleared) return cleared;

    SessionFinalizer finalizer(db_, stats_, verbose_);
    auto transitioned = finalizer.finalize_state_transition(session.id, SessionState::Spec);
    if (!transitioned) return transitioned;

    events_.emit(EngineEvent::SessionStateChanged,
                 {{"session_name", session.name},
                  {"from", std::string(to_string(session.session_state))},
                  {"to", "spec"}});
    return {};
}

Result<CancellationResult> SessionService::cancel_session(const std::string& name, bool delete_branch) {
    auto session = db_.get_session_by_name(repo_, name);
    if (!session) return std::unexpected(session.error());

    if (session->status == SessionStatus::Cancelled) {
        return std::unexpected(Error::invalid_state(name, "cancelled", "running"));
    }

    CancellationCoordinator coordinator(repo_, db_, inspector_, verbose_);
    CancellationConfig config;
    config.delete_branch = delete_branch;

    auto result = coordinator.cancel_session(*session, config);
    if (!result) return result;

    emit_session(EngineEvent::SessionRemoved, *session);
    return result;
}

Result<bool> SessionService::mark_reviewed(const std::string& name) {
    auto session = db_.get_session_by_name(repo_, name);
    if (!session) return std::unexpected(session.error());

    if (session->session_state == SessionState::Spec) {
        return std::unexpected(Error::invalid_state(name, "spec", "running"));
    }
    if (session->ready_to_merge) {
        return std::unexpected(Error::invalid_input(
            "name", std::format("Session '{}' is already marked as reviewed", name)));
    }

    auto dirty = git::has_uncommitted_changes(session->worktree_path);
    if (!dirty) return std::unexpected(dirty.error());
    bool ready = !*dirty;

    auto flagged = db_.update_ready_to_merge(session->id, ready);
    if (!flagged) return std::unexpected(flagged.error());

    SessionFinalizer finalizer(db_, stats_, verbose_);
    auto transitioned = finalizer.finalize_state_transition(session->id, SessionState::Reviewed);
    if (!transitioned) return std::unexpected(transitioned.error());

    auto stats = stats_.refresh(*session);
    if (stats) emit_stats(*session, *stats);
    else std::println(stderr, "session: failed to refresh git stats for {}: {}", name, stats.error().to_string());

    events_.emit(EngineEvent::SessionStateChanged,
                 {{"session_name", name}, {"from", std::string(to_string(session->session_state))}, {"to", "reviewed"}});
    return ready;
}

Result<void> SessionService::unmark_reviewed(const std::string& name) {
    auto session = db_.get_session_by_name(repo_, name);
    if (!session) return std::unexpected(session.error());

    auto cleared = db_.update_ready_to_merge(session->id, false);
    if (!cleared) return cleared;

    if (session->session_state != SessionState::Spec) {
        SessionFinalizer finalizer(db_, stats_, verbose_);
        auto transitioned = finalizer.finalize_state_transition(session->id, SessionState::Running);
        if (!transitioned) return transitioned;

        events_.emit(EngineEvent::SessionStateChanged,
                     {{"session_name", name}, {"from", std::string(to_string(session->session_state))}, {"to", "running"}});
    }
    return {};
}

Result<Spec> SessionService::convert_to_spec(const std::string& name) {
    auto session = db_.get_session_by_name(repo_, name);
    if (!session) return std::unexpected(session.error());

    if (session->status == SessionStatus::Cancelled || session->session_state != SessionState::Running) {
        auto current = session->status == SessionStatus::Cancelled
            ? std::string("cancelled") : std::string(to_string(session->session_state));
        return std::unexpected(Error::invalid_state(name, current, "running"));
    }

    auto content = session->spec_content.value_or(session->initial_prompt.value_or(""));

    auto cancelled = cancel_session(name);
    if (!cancelled) return std::unexpected(cancelled.error());

    return create_spec(session->name, content, session->epic_id, session->display_name);
}

Result<Session> SessionService::get_session(const std::string& name) {
    return db_.get_session_by_name(repo_, name);
}

Result<std::vector<Session>> SessionService::list_sessions() {
    return db_.list_sessions(repo_);
}

Result<GitStats> SessionService::git_stats(const std::string& name) {
    auto session = db_.get_session_by_name(repo_, name);
    if (!session) return std::unexpected(session.error());

    if (session->session_state == SessionState::Spec || session->status == SessionStatus::Cancelled) {
        return std::unexpected(Error::invalid_state(name, std::string(to_string(session->session_state)),
                                                    "running"));
    }
    return stats_.get(*session);
}

// --- Specs ---

Result<Spec> SessionService::create_spec(const std::string& name, const std::string& content,
                                         const std::optional<std::string>& epic_id,
                                         const std::optional<std::string>& display_name) {
    if (!git::is_valid_session_name(name)) {
        return std::unexpected(Error::invalid_input(
            "name", "Invalid spec name: use only letters, numbers, hyphens, underscores and dots"));
    }

    if (!reservations_.reserve(repo_, name)) {
        return std::unexpected(Error::session_already_exists(name));
    }
    ReservationGuard reservation(reservations_, repo_, name);

    auto taken = name_in_use(name);
    if (!taken) return std::unexpected(taken.error());
    if (*taken) return std::unexpected(Error::session_already_exists(name));

    auto now = unix_now();
    Spec spec{
        .id = generate_id(),
        .name = name,
        .display_name = display_name,
        .epic_id = epic_id,
        .repository_path = repo_,
        .repository_name = repository_name(),
        .content = content,
        .created_at = now,
        .updated_at = now,
    };

    auto inserted = db_.insert_spec(spec);
    if (!inserted) return std::unexpected(inserted.error());

    events_.emit(EngineEvent::SessionAdded,
                 {{"session_name", name}, {"kind", "spec"}, {"spec_id", spec.id}});
    log("Created spec '" + name + "'");
    return spec;
}

Result<Spec> SessionService::update_spec_content(const std::string& name, const std::string& content) {
    auto spec = db_.get_spec_by_name(repo_, name);
    if (!spec) return std::unexpected(spec.error());

    auto updated = db_.update_spec_content(spec->id, content);
    if (!updated) return std::unexpected(updated.error());

    return db_.get_spec_by_name(repo_, name);
}

Result<void> SessionService::delete_spec(const std::string& name) {
    auto spec = db_.get_spec_by_name(repo_, name);
    if (!spec) return std::unexpected(spec.error());

    auto deleted = db_.delete_spec(spec->id);
    if (!deleted) return deleted;

    events_.emit(EngineEvent::SessionRemoved,
                 {{"session_name", name}, {"kind", "spec"}, {"spec_id", spec->id}});
    return {};
}

Result<std::vector<Spec>> SessionService::list_specs() {
    return db_.list_specs(repo_);
}

Result<Session> SessionService::start_spec(const std::string& name,
                                           const std::optional<std::string>& base_branch) {
    auto spec = db_.get_spec_by_name(repo_, name);
    if (!spec) return std::unexpected(spec.error());

    log("Starting spec '" + name + "'");

    auto session = create_session_impl({
        .name = spec->name,
        .parent_branch = base_branch,
        .initial_prompt = spec->content,
        .display_name = spec->display_name,
        .epic_id = spec->epic_id,
    }, spec->id);
    if (!session) return session;

    if (!spec->display_name) {
        auto pending = db_.set_pending_name_generation(session->id, true);
        if (pending) session->pending_name_generation = true;
        else std::println(stderr, "session: failed to flag name generation for {}: {}",
                          name, pending.error().to_string());
    }

    // Resume stays gated until the agent's first start.
    auto gated = db_.set_resume_allowed(session->id, false);
    if (gated) session->resume_allowed = false;
    else std::println(stderr, "session: failed to gate resume for {}: {}", name, gated.error().to_string());

    auto deleted = db_.delete_spec(spec->id);
    if (!deleted) {
        std::println(stderr, "session: spec {} was started but could not be deleted: {}",
                     name, deleted.error().to_string());
    } else {
        events_.emit(EngineEvent::SessionRemoved,
                     {{"session_name", name}, {"kind", "spec"}, {"spec_id", spec->id}});
    }
    return session;
}

// --- Epics ---

Result<Epic> SessionService::create_epic(const std::string& name, const std::optional<std::string>& color) {
    auto trimmed = git::trim(name);
    if (trimmed.empty()) {
        return std::unexpected(Error::invalid_input("name", "Epic name cannot be empty"));
    }

    auto epics = db_.list_epics(repo_);
    if (!epics) return std::unexpected(epics.error());
    for (const auto& e : *epics) {
        if (e.name == trimmed) {
            return std::unexpected(Error::invalid_input("name", std::format("Epic '{}' already exists", trimmed)));
        }
    }

    auto now = unix_now();
    Epic epic{
        .id = generate_id(),
        .repository_path = repo_,
        .name = trimmed,
        .color = color,
        .created_at = now,
        .updated_at = now,
    };
    auto inserted = db_.insert_epic(epic);
    if (!inserted) return std::unexpected(inserted.error());
    return epic;
}

Result<std::vector<Epic>> SessionService::list_epics() {
    return db_.list_epics(repo_);
}

Result<void> SessionService::delete_epic(const std::string& id) {
    return db_.delete_epic(id);
}

Result<void> SessionService::set_item_epic(const std::string& name, const std::optional<std::string>& epic_id) {
    if (epic_id) {
        auto epic = db_.get_epic(*epic_id);
        if (!epic) return std::unexpected(epic.error());
        if (!*epic || (*epic)->repository_path != repo_) {
            return std::unexpected(Error::invalid_input("epic_id", std::format("Epic '{}' not found", *epic_id)));
        }
    }

    auto session = db_.get_session_by_name(repo_, name);
    if (session && session->status != SessionStatus::Cancelled) {
        return db_.set_session_epic(session->id, epic_id);
    }

    auto spec = db_.get_spec_by_name(repo_, name);
    if (spec) return db_.set_spec_epic(spec->id, epic_id);
    return std::unexpected(Error::session_not_found(name));
}

Result<std::string> SessionService::resolve_parent_branch(const std::optional<std::string>& requested) {
    if (requested) {
        auto branch = git::trim(*requested);
        if (!branch.empty()) {
            if (!git::branch_exists(repo_, branch)) {
                return std::unexpected(Error::invalid_input(
                    "parent_branch", std::format("Branch '{}' does not exist", branch)));
            }
            return branch;
        }
    }

    if (!settings_.base_branch.empty()) {
        if (git::branch_exists(repo_, settings_.base_branch)) return settings_.base_branch;

        // A freshly initialized repository whose default branch has another
        // name gets that branch adopted as the configured base.
        auto branches = git::list_branches(repo_);
        if (branches && branches->size() <= 1) {
            auto ensured = git::ensure_branch_at_head(repo_, settings_.base_branch);
            if (!ensured) return std::unexpected(ensured.error());
            return settings_.base_branch;
        }
    }

    auto current = git::current_branch(repo_);
    if (current && *current != "HEAD" && git::branch_exists(repo_, *current)) return *current;

    for (const char* fallback : {"main", "master"}) {
        if (git::branch_exists(repo_, fallback)) return std::string(fallback);
    }
    return std::unexpected(Error::invalid_input("parent_branch", "Could not determine a base branch"));
}

std::string SessionService::worktree_path_for(const std::string& name) const {
    return (fs::path(repo_) / ".schaltwerk" / "worktrees" / name).string();
}

std::string SessionService::repository_name() const {
    auto p = fs::path(repo_);
    if (!p.has_filename()) p = p.parent_path();
    return p.filename().string();
}

void SessionService::emit_session(EngineEvent event, const Session& session) {
    events_.emit(event, {
        {"session_id", session.id},
        {"session_name", session.name},
        {"branch", session.branch},
        {"parent_branch", session.parent_branch},
        {"worktree_path", session.worktree_path},
        {"state", std::string(to_string(session.session_state))},
    });
}

void SessionService::emit_stats(const Session& session, const GitStats& stats) {
    events_.emit(EngineEvent::GitStatsUpdated, {
        {"session_id", session.id},
        {"session_name", session.name},
        {"files_changed", stats.files_changed},
        {"lines_added", stats.lines_added},
        {"lines_removed", stats.lines_removed},
        {"has_uncommitted", stats.has_uncommitted},
    });
}

void SessionService::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[schaltwerk] {}", msg);
    }
}
