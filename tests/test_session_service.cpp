#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "git/branches.hpp"
#include "git/worktrees.hpp"
#include "git_test_helpers.hpp"
#include "sessions/session_service.hpp"

#include <atomic>
#include <filesystem>
#include <sqlite3.h>
#include <thread>
#include <vector>

using namespace testing;
namespace fs = std::filesystem;

namespace {

struct Fixture {
    TmpRepo repo;
    TmpDir dbdir{"sw_svc"};
    SessionDb db;
    NameReservation reservations;
    GitStatsCache stats{db};
    FakeInspector inspector;
    RecordingSink events;
    SessionService service;

    explicit Fixture(SessionSettings settings = {}, bool with_commit = true)
        : repo(with_commit),
          service(repo.path, db, reservations, stats, inspector, events, std::move(settings)) {
        REQUIRE(db.open(dbdir.path + "/sessions.db"));
    }

    Session create(const std::string& name, std::optional<std::string> prompt = std::nullopt) {
        auto res = service.create_session({.name = name, .initial_prompt = std::move(prompt)});
        INFO((res ? std::string() : res.error().to_string()));
        REQUIRE(res.has_value());
        return *res;
    }
};

} // namespace

TEST_CASE("SessionService creation", "[sessions][service]") {
    Fixture f;

    SECTION("CreatesWorktreeBranchAndRow") {
        auto s = f.create("alpha", "fix the login page");
        REQUIRE(s.branch == "schaltwerk/alpha");
        REQUIRE(s.parent_branch == "main");
        REQUIRE(s.original_parent_branch == "main");
        REQUIRE(s.worktree_path == f.repo.path + "/.schaltwerk/worktrees/alpha");
        REQUIRE(s.session_state == SessionState::Running);
        REQUIRE(s.status == SessionStatus::Active);
        REQUIRE(s.original_agent_type == "claude");
        REQUIRE(s.last_activity.has_value());

        REQUIRE(fs::exists(fs::path(s.worktree_path) / "README.md"));
        REQUIRE(git::current_branch(s.worktree_path).value() == "schaltwerk/alpha");
        REQUIRE(f.db.get_session_by_name(f.repo.path, "alpha")->initial_prompt == "fix the login page");
        REQUIRE(f.events.count(EngineEvent::SessionAdded) == 1);
        REQUIRE(f.events.count(EngineEvent::GitStatsUpdated) == 1);
        REQUIRE(f.reservations.size() == 0);
    }

    SECTION("DuplicateNameIsRejected") {
        f.create("alpha");
        auto dup = f.service.create_session({.name = "alpha"});
        REQUIRE_FALSE(dup.has_value());
        REQUIRE(dup.error().kind == ErrorKind::SessionAlreadyExists);
        REQUIRE(f.reservations.size() == 0);
    }

    SECTION("AutoGeneratedNameGetsSuffix") {
        f.create("alpha");
        auto res = f.service.create_session({.name = "alpha", .was_auto_generated = true});
        REQUIRE(res.has_value());
        REQUIRE(res->name.starts_with("alpha-"));
        REQUIRE(res->name.size() == std::string("alpha-xx").size());
        REQUIRE(res->pending_name_generation);
    }

    SECTION("InvalidNameIsRejected") {
        auto res = f.service.create_session({.name = "../escape"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::InvalidInput);
        REQUIRE(res.error().field == "name");
    }

    SECTION("UnknownParentIsRejected") {
        auto res = f.service.create_session({.name = "alpha", .parent_branch = "nope"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "parent_branch");
        REQUIRE_FALSE(fs::exists(f.repo.path + "/.schaltwerk/worktrees/alpha"));
    }

    SECTION("ExplicitParentIsUsed") {
        git_ok(f.repo.path, {"branch", "develop"});
        auto res = f.service.create_session({.name = "alpha", .parent_branch = "develop"});
        REQUIRE(res.has_value());
        REQUIRE(res->parent_branch == "develop");
    }

    SECTION("ExistingBranchGetsUniqueSuffix") {
        git_ok(f.repo.path, {"branch", "schaltwerk/alpha"});
        auto s = f.create("alpha");
        REQUIRE(s.branch.starts_with("schaltwerk/alpha-"));
        REQUIRE(git::branch_exists(f.repo.path, s.branch));
    }

    SECTION("CustomBranch") {
        auto res = f.service.create_session({.name = "alpha", .custom_branch = "feature/login"});
        REQUIRE(res.has_value());
        REQUIRE(res->branch == "feature/login");

        auto bad = f.service.create_session({.name = "beta", .custom_branch = "bad..name"});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().field == "branch");
    }

    SECTION("StaleDirectoryIsReplaced") {
        write_file(f.repo.path + "/.schaltwerk/worktrees/alpha", "leftover.txt", "x");
        auto s = f.create("alpha");
        REQUIRE_FALSE(fs::exists(fs::path(s.worktree_path) / "leftover.txt"));
    }

    SECTION("CancelledNameCanBeReused") {
        f.create("alpha");
        REQUIRE(f.service.cancel_session("alpha").has_value());
        auto again = f.create("alpha");
        REQUIRE(again.status == SessionStatus::Active);
        REQUIRE(f.db.list_sessions(f.repo.path, true)->size() == 1);
    }

    SECTION("ConcurrentCreatesOfOneNameHaveOneWinner") {
        std::atomic<int> ok{0};
        std::atomic<int> exists{0};
        {
            std::vector<std::jthread> threads;
            for (int i = 0; i < 6; i++) {
                threads.emplace_back([&] {
                    auto res = f.service.create_session({.name = "race"});
                    if (res) ok++;
                    else if (res.error().kind == ErrorKind::SessionAlreadyExists) exists++;
                });
            }
        }
        REQUIRE(ok.load() == 1);
        REQUIRE(exists.load() == 5);
        REQUIRE(f.reservations.size() == 0);
    }

    SECTION("SpecNameBlocksSession") {
        REQUIRE(f.service.create_spec("plan", "# Plan").has_value());
        auto res = f.service.create_session({.name = "plan"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::SessionAlreadyExists);
    }
}

TEST_CASE("SessionService without commits", "[sessions][service]") {
    Fixture f({}, false);

    auto res = f.service.create_session({.name = "alpha"});
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().kind == ErrorKind::GitOperationFailed);

    // Spec-state sessions need no commit.
    auto spec = f.service.create_session({.name = "later", .initial_prompt = "plan", .as_spec = true});
    REQUIRE(spec.has_value());
    REQUIRE(spec->session_state == SessionState::Spec);
}

TEST_CASE("SessionService base branch", "[sessions][service]") {

    SECTION("ConfiguredBaseIsAdoptedInFreshRepository") {
        Fixture f(SessionSettings{.base_branch = "develop"});
        auto s = f.create("alpha");
        REQUIRE(s.parent_branch == "develop");
        REQUIRE(git::branch_exists(f.repo.path, "develop"));
    }

    SECTION("FallsBackToCurrentBranch") {
        Fixture f;
        git_ok(f.repo.path, {"checkout", "-q", "-b", "topic"});
        REQUIRE(f.service.resolve_parent_branch(std::nullopt).value() == "topic");
    }
}

TEST_CASE("SessionService lifecycle", "[sessions][service]") {
    Fixture f;

    SECTION("SpecSessionStartsLater") {
        auto spec = f.service.create_session({.name = "alpha", .initial_prompt = "plan", .as_spec = true});
        REQUIRE(spec.has_value());
        REQUIRE(spec->status == SessionStatus::Spec);
        REQUIRE(spec->spec_content == "plan");
        REQUIRE_FALSE(fs::exists(spec->worktree_path));

        auto started = f.service.start_session("alpha");
        REQUIRE(started.has_value());
        REQUIRE(started->session_state == SessionState::Running);
        REQUIRE(started->status == SessionStatus::Active);
        REQUIRE(fs::exists(started->worktree_path));

        auto again = f.service.start_session("alpha");
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().kind == ErrorKind::InvalidSessionState);
    }

    SECTION("FailedStartRemovesWorktreeAndBranch") {
        auto spec = f.service.create_session({.name = "alpha", .initial_prompt = "plan", .as_spec = true});
        REQUIRE(spec.has_value());

        // A second connection makes activating the session fail inside SQLite.
        sqlite3* raw = nullptr;
        REQUIRE(sqlite3_open((f.dbdir.path + "/sessions.db").c_str(), &raw) == SQLITE_OK);
        const char* trigger =
            "CREATE TRIGGER refuse_activation BEFORE UPDATE OF status ON sessions "
            "WHEN NEW.status = 'active' BEGIN SELECT RAISE(ABORT, 'activation refused'); END";
        REQUIRE(sqlite3_exec(raw, trigger, nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(raw);

        auto started = f.service.start_session("alpha");
        REQUIRE_FALSE(started.has_value());
        REQUIRE_FALSE(fs::exists(spec->worktree_path));
        REQUIRE_FALSE(git::branch_exists(f.repo.path, spec->branch));
        REQUIRE(f.db.get_session_by_name(f.repo.path, "alpha")->status == SessionStatus::Spec);
    }

    SECTION("MarkReviewedOnCleanWorktree") {
        f.create("alpha");
        auto ready = f.service.mark_reviewed("alpha");
        REQUIRE(ready.has_value());
        REQUIRE(*ready);

        auto row = f.db.get_session_by_name(f.repo.path, "alpha");
        REQUIRE(row->session_state == SessionState::Reviewed);
        REQUIRE(row->ready_to_merge);

        auto twice = f.service.mark_reviewed("alpha");
        REQUIRE_FALSE(twice.has_value());
        REQUIRE(twice.error().kind == ErrorKind::InvalidInput);
    }

    SECTION("MarkReviewedWithDirtyWorktreeIsNotReady") {
        auto s = f.create("alpha");
        write_file(s.worktree_path, "wip.txt", "x\n");
        REQUIRE_FALSE(f.service.mark_reviewed("alpha").value());
        REQUIRE(f.db.get_session_by_name(f.repo.path, "alpha")->session_state == SessionState::Reviewed);
    }

    SECTION("UnmarkReviewedReturnsToRunning") {
        f.create("alpha");
        REQUIRE(f.service.mark_reviewed("alpha").has_value());
        REQUIRE(f.service.unmark_reviewed("alpha").has_value());

        auto row = f.db.get_session_by_name(f.repo.path, "alpha");
        REQUIRE(row->session_state == SessionState::Running);
        REQUIRE_FALSE(row->ready_to_merge);
    }

    SECTION("TransitionRules") {
        f.create("alpha");
        REQUIRE(f.service.transition_state("alpha", SessionState::Running).has_value());
        REQUIRE(f.service.transition_state("alpha", SessionState::Reviewed).has_value());

        auto bad = f.service.transition_state("alpha", SessionState::Spec);
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().kind == ErrorKind::InvalidSessionState);
        REQUIRE(bad.error().current_state == "reviewed");

        REQUIRE(f.service.transition_state("alpha", SessionState::Running).has_value());
        REQUIRE_FALSE(f.db.get_session_by_name(f.repo.path, "alpha")->ready_to_merge);
    }

    SECTION("DemoteToSpecTearsDownWorktree") {
        auto s = f.create("alpha");
        REQUIRE(f.service.transition_state("alpha", SessionState::Spec).has_value());

        auto row = f.db.get_session_by_name(f.repo.path, "alpha");
        REQUIRE(row->session_state == SessionState::Spec);
        REQUIRE(row->status == SessionStatus::Spec);
        REQUIRE_FALSE(fs::exists(s.worktree_path));

        // And back again.
        REQUIRE(f.service.transition_state("alpha", SessionState::Running).has_value());
        REQUIRE(fs::exists(s.worktree_path));
    }

    SECTION("CancelEmitsRemovalAndRefusesTwice") {
        auto s = f.create("alpha");
        auto res = f.service.cancel_session("alpha");
        REQUIRE(res.has_value());
        REQUIRE(res->worktree_removed);
        REQUIRE_FALSE(fs::exists(s.worktree_path));
        REQUIRE(f.events.count(EngineEvent::SessionRemoved) == 1);
        REQUIRE(f.service.list_sessions()->empty());

        auto twice = f.service.cancel_session("alpha");
        REQUIRE_FALSE(twice.has_value());
        REQUIRE(twice.error().kind == ErrorKind::InvalidSessionState);
    }

    SECTION("ConvertToSpecKeepsPrompt") {
        f.create("alpha", "implement search");
        auto spec = f.service.convert_to_spec("alpha");
        REQUIRE(spec.has_value());
        REQUIRE(spec->content == "implement search");
        REQUIRE(f.db.get_session_by_name(f.repo.path, "alpha")->status == SessionStatus::Cancelled);
        REQUIRE(f.service.list_specs()->size() == 1);
    }

    SECTION("StatsRequireRunningSession") {
        auto s = f.create("alpha");
        write_file(s.worktree_path, "a.txt", "1\n2\n");
        auto stats = f.service.git_stats("alpha");
        REQUIRE(stats.has_value());
        REQUIRE(stats->lines_added == 2);

        REQUIRE(f.service.create_session({.name = "beta", .as_spec = true}).has_value());
        auto spec_stats = f.service.git_stats("beta");
        REQUIRE_FALSE(spec_stats.has_value());
        REQUIRE(spec_stats.error().kind == ErrorKind::InvalidSessionState);
    }
}

TEST_CASE("SessionService specs and epics", "[sessions][service]") {
    Fixture f;

    SECTION("SpecCrud") {
        REQUIRE(f.service.create_spec("plan", "# v1").has_value());
        REQUIRE(f.service.update_spec_content("plan", "# v2")->content == "# v2");
        REQUIRE(f.service.list_specs()->size() == 1);

        auto dup = f.service.create_spec("plan", "# again");
        REQUIRE_FALSE(dup.has_value());
        REQUIRE(dup.error().kind == ErrorKind::SessionAlreadyExists);

        REQUIRE(f.service.delete_spec("plan").has_value());
        REQUIRE(f.service.list_specs()->empty());
    }

    SECTION("StartSpecPromotesToSession") {
        REQUIRE(f.service.create_spec("plan", "# Build it").has_value());
        auto s = f.service.start_spec("plan");
        REQUIRE(s.has_value());
        REQUIRE(s->session_state == SessionState::Running);
        REQUIRE(s->initial_prompt == "# Build it");
        REQUIRE_FALSE(s->resume_allowed);
        REQUIRE(s->pending_name_generation);
        REQUIRE(fs::exists(s->worktree_path));
        REQUIRE(f.service.list_specs()->empty());
    }

    SECTION("Epics") {
        auto epic = f.service.create_epic("  Billing ", "#00ff00");
        REQUIRE(epic.has_value());
        REQUIRE(epic->name == "Billing");

        auto dup = f.service.create_epic("Billing", std::nullopt);
        REQUIRE_FALSE(dup.has_value());
        REQUIRE(dup.error().kind == ErrorKind::InvalidInput);
        REQUIRE_FALSE(f.service.create_epic("   ", std::nullopt).has_value());

        f.create("alpha");
        REQUIRE(f.service.set_item_epic("alpha", epic->id).has_value());
        REQUIRE(f.db.get_session_by_name(f.repo.path, "alpha")->epic_id == epic->id);

        REQUIRE(f.service.create_spec("plan", "").has_value());
        REQUIRE(f.service.set_item_epic("plan", epic->id).has_value());

        auto unknown = f.service.set_item_epic("alpha", std::string("nope"));
        REQUIRE_FALSE(unknown.has_value());
        REQUIRE(unknown.error().field == "epic_id");

        REQUIRE(f.service.delete_epic(epic->id).has_value());
        REQUIRE_FALSE(f.db.get_session_by_name(f.repo.path, "alpha")->epic_id.has_value());
        REQUIRE(f.service.list_epics()->empty());
    }

    SECTION("SetEpicOnUnknownItem") {
        auto res = f.service.set_item_epic("ghost", std::nullopt);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::SessionNotFound);
    }
}
