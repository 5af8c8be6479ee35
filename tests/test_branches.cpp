#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "git/branches.hpp"
#include "git_test_helpers.hpp"

using namespace testing;

TEST_CASE("Name validation", "[git][branches]") {

    SECTION("SessionNames") {
        REQUIRE(git::is_valid_session_name("fix-login"));
        REQUIRE(git::is_valid_session_name("feature_2.1"));
        REQUIRE(git::is_valid_session_name("_hidden"));
        REQUIRE_FALSE(git::is_valid_session_name(""));
        REQUIRE_FALSE(git::is_valid_session_name("-leading-dash"));
        REQUIRE_FALSE(git::is_valid_session_name(".dot"));
        REQUIRE_FALSE(git::is_valid_session_name("has space"));
        REQUIRE_FALSE(git::is_valid_session_name("slash/name"));
        REQUIRE_FALSE(git::is_valid_session_name(std::string(101, 'a')));
        REQUIRE(git::is_valid_session_name(std::string(100, 'a')));
    }

    SECTION("BranchNames") {
        REQUIRE(git::is_valid_branch_name("schaltwerk/fix-login"));
        REQUIRE(git::is_valid_branch_name("release-1.0"));
        REQUIRE_FALSE(git::is_valid_branch_name(""));
        REQUIRE_FALSE(git::is_valid_branch_name("a..b"));
        REQUIRE_FALSE(git::is_valid_branch_name("back\\slash"));
        REQUIRE_FALSE(git::is_valid_branch_name("with space"));
    }
}

TEST_CASE("Branch operations", "[git][branches]") {
    TmpRepo repo;

    SECTION("ListBranchesIsSortedAndUnique") {
        git_ok(repo.path, {"branch", "zeta"});
        git_ok(repo.path, {"branch", "alpha"});

        auto branches = git::list_branches(repo.path);
        REQUIRE(branches.has_value());
        REQUIRE(*branches == std::vector<std::string>{"alpha", "main", "zeta"});
    }

    SECTION("ListBranchesOnUnbornRepository") {
        TmpRepo empty(false);
        auto branches = git::list_branches(empty.path);
        REQUIRE(branches.has_value());
        REQUIRE(*branches == std::vector<std::string>{"main"});
    }

    SECTION("BranchExists") {
        REQUIRE(git::branch_exists(repo.path, "main"));
        REQUIRE_FALSE(git::branch_exists(repo.path, "missing"));
        REQUIRE_FALSE(git::branch_exists(repo.path, ""));
    }

    SECTION("DeleteBranch") {
        git_ok(repo.path, {"branch", "doomed"});
        REQUIRE(git::delete_branch(repo.path, "doomed").has_value());
        REQUIRE_FALSE(git::branch_exists(repo.path, "doomed"));

        auto missing = git::delete_branch(repo.path, "doomed");
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().kind == ErrorKind::GitOperationFailed);
    }

    SECTION("RenameRefusesExistingTarget") {
        git_ok(repo.path, {"branch", "one"});
        git_ok(repo.path, {"branch", "two"});
        REQUIRE_FALSE(git::rename_branch(repo.path, "one", "two").has_value());
        REQUIRE(git::rename_branch(repo.path, "one", "three").has_value());
        REQUIRE(git::branch_exists(repo.path, "three"));
        REQUIRE_FALSE(git::branch_exists(repo.path, "one"));
    }

    SECTION("CurrentBranchAndDetachedHead") {
        REQUIRE(git::current_branch(repo.path).value() == "main");
        git_ok(repo.path, {"checkout", "-q", "--detach"});
        REQUIRE(git::current_branch(repo.path).value() == "HEAD");
    }

    SECTION("ResolveCommit") {
        REQUIRE(git::resolve_commit(repo.path, "main").value() == head_of(repo.path));
        REQUIRE_FALSE(git::resolve_commit(repo.path, "nope").has_value());
    }

    SECTION("EnsureBranchAtHeadRenamesLoneBranch") {
        REQUIRE(git::ensure_branch_at_head(repo.path, "trunk").has_value());
        REQUIRE(git::current_branch(repo.path).value() == "trunk");
        REQUIRE_FALSE(git::branch_exists(repo.path, "main"));
    }

    SECTION("EnsureBranchAtHeadIsIdempotent") {
        auto head = head_of(repo.path);
        for (int i = 0; i < 2; i++) {
            REQUIRE(git::ensure_branch_at_head(repo.path, "trunk").has_value());
            REQUIRE(git::current_branch(repo.path).value() == "trunk");
            REQUIRE(git::resolve_commit(repo.path, "trunk").value() == head);
        }
    }

    SECTION("EnsureBranchAtHeadChecksOutExisting") {
        auto head = head_of(repo.path);
        git_ok(repo.path, {"branch", "develop"});
        REQUIRE(git::ensure_branch_at_head(repo.path, "develop").has_value());
        REQUIRE(git::current_branch(repo.path).value() == "develop");
        REQUIRE(git::resolve_commit(repo.path, "develop").value() == head);
        REQUIRE(git::branch_exists(repo.path, "main"));
    }

    SECTION("EnsureBranchAtHeadFromDetachedHead") {
        auto head = head_of(repo.path);
        git_ok(repo.path, {"checkout", "-q", "--detach"});
        REQUIRE(git::current_branch(repo.path).value() == "HEAD");

        REQUIRE(git::ensure_branch_at_head(repo.path, "trunk").has_value());
        REQUIRE(git::current_branch(repo.path).value() == "trunk");
        REQUIRE(git::resolve_commit(repo.path, "trunk").value() == head);
        REQUIRE(git::branch_exists(repo.path, "main"));
    }

    SECTION("EnsureBranchAtHeadFailsWithoutCommits") {
        TmpRepo empty(false);
        auto res = git::ensure_branch_at_head(empty.path, "trunk");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::GitOperationFailed);
    }
}
