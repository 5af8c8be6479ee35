#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "git_test_helpers.hpp"
#include "platform/linux/procfs_inspector.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace testing;

namespace {

// Child parked in dir until signalled; reaped on destruction.
struct ChildInDir {
    pid_t pid = -1;

    explicit ChildInDir(const std::string& dir) {
        pid = ::fork();
        REQUIRE(pid >= 0);
        if (pid == 0) {
            if (::chdir(dir.c_str()) != 0) ::_exit(1);
            while (true) ::pause();
        }
    }

    ~ChildInDir() {
        if (pid > 0) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
        }
    }

    ChildInDir(const ChildInDir&) = delete;
    ChildInDir& operator=(const ChildInDir&) = delete;
};

bool contains(const std::vector<int>& pids, int pid) {
    return std::find(pids.begin(), pids.end(), pid) != pids.end();
}

// The child's chdir races the parent's first look at /proc.
std::vector<int> wait_for_pid_under(const ProcfsInspector& inspector, const std::string& dir, int pid) {
    std::vector<int> pids;
    for (int i = 0; i < 100; i++) {
        pids = inspector.pids_with_cwd_under(dir);
        if (contains(pids, pid)) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pids;
}

} // namespace

TEST_CASE("Procfs inspector", "[platform][procfs]") {
    ProcfsInspector inspector;

    SECTION("OwnProcess") {
        REQUIRE(inspector.is_running(::getpid()));
        auto cmdline = inspector.read_cmdline(::getpid());
        REQUIRE(cmdline.has_value());
        REQUIRE_FALSE(cmdline->empty());
    }

    SECTION("InvalidPids") {
        REQUIRE_FALSE(inspector.is_running(0));
        REQUIRE_FALSE(inspector.is_running(-5));
        REQUIRE_FALSE(inspector.send_terminate(0));
        REQUIRE_FALSE(inspector.send_kill(-1));
    }

    SECTION("FindsProcessesBelowDirectory") {
        TmpDir root{"sw_procfs"};
        std::filesystem::create_directories(root.path + "/nested/deeper");
        TmpDir other{"sw_procfs_other"};

        ChildInDir child(root.path + "/nested/deeper");
        auto under = wait_for_pid_under(inspector, root.path, child.pid);
        REQUIRE(contains(under, child.pid));

        // Trailing slash names the same directory.
        REQUIRE(contains(inspector.pids_with_cwd_under(root.path + "/"), child.pid));
        REQUIRE_FALSE(contains(inspector.pids_with_cwd_under(other.path), child.pid));
    }

    SECTION("SiblingWithSharedPrefixIsNotMatched") {
        TmpDir root{"sw_procfs_prefix"};
        std::filesystem::create_directories(root.path + "/alpha-2");
        std::filesystem::create_directories(root.path + "/alpha");

        ChildInDir child(root.path + "/alpha-2");
        wait_for_pid_under(inspector, root.path + "/alpha-2", child.pid);
        REQUIRE_FALSE(contains(inspector.pids_with_cwd_under(root.path + "/alpha"), child.pid));
    }

    SECTION("TerminatedChildStopsRunning") {
        TmpDir dir{"sw_procfs_term"};
        ChildInDir child(dir.path);
        REQUIRE(inspector.is_running(child.pid));

        REQUIRE(inspector.send_terminate(child.pid));
        // Unreaped, the child lingers as a zombie.
        bool stopped = false;
        for (int i = 0; i < 100 && !stopped; i++) {
            stopped = !inspector.is_running(child.pid);
            if (!stopped) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        REQUIRE(stopped);
    }
}
