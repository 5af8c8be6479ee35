#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "git_test_helpers.hpp"
#include "launch/launch_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace testing;
using namespace std::chrono_literals;

namespace {

// Records every call; create can be slowed down to exercise timeouts and
// serialization.
class MockTerminals : public TerminalBackend {
public:
    struct Created {
        CreateTerminalParams params;
        bool sized = false;
    };

    std::chrono::milliseconds create_delay{0};
    bool fail_create = false;

    Result<bool> terminal_exists(const std::string& id) override {
        std::lock_guard lock(mu_);
        return live_.contains(id);
    }

    Result<void> close_terminal(const std::string& id) override {
        std::lock_guard lock(mu_);
        live_.erase(id);
        closed_.push_back(id);
        return {};
    }

    Result<void> create_terminal_with_app(const std::string& id, const std::string& cwd,
                                          const std::string& command,
                                          const std::vector<std::string>& args,
                                          const EnvVars& env) override {
        return create({.id = id, .cwd = cwd, .command = command, .args = args, .env = env}, false);
    }

    Result<void> create_terminal_with_app_and_size(const CreateTerminalParams& params) override {
        return create(params, true);
    }

    std::vector<Created> created() const {
        std::lock_guard lock(mu_);
        return created_;
    }

    std::vector<std::string> closed() const {
        std::lock_guard lock(mu_);
        return closed_;
    }

    int max_concurrent() const { return max_concurrent_.load(); }

    std::set<std::string> live() const {
        std::lock_guard lock(mu_);
        return live_;
    }

    int duplicates() const {
        std::lock_guard lock(mu_);
        return duplicates_;
    }

    void add_live(const std::string& id) {
        std::lock_guard lock(mu_);
        live_.insert(id);
    }

private:
    Result<void> create(const CreateTerminalParams& params, bool sized) {
        int now = ++in_flight_;
        int seen = max_concurrent_.load();
        while (now > seen && !max_concurrent_.compare_exchange_weak(seen, now)) {}

        if (create_delay.count() > 0) std::this_thread::sleep_for(create_delay);
        --in_flight_;

        if (fail_create) return std::unexpected(Error::terminal(params.id, "create", "pty allocation failed"));

        std::lock_guard lock(mu_);
        // A real backend would now hold two terminals under one id.
        if (live_.contains(params.id)) ++duplicates_;
        live_.insert(params.id);
        created_.push_back({params, sized});
        return {};
    }

    mutable std::mutex mu_;
    std::set<std::string> live_;
    std::vector<Created> created_;
    std::vector<std::string> closed_;
    int duplicates_ = 0;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_concurrent_{0};
};

struct LaunchFixture {
    TmpDir worktree{"sw_launch"};
    MockTerminals terminals;
    TerminalLockRegistry locks;
    TimedRunner runner;

    LaunchCoordinator coordinator(std::map<std::string, AgentSettings> settings = {},
                                  std::chrono::milliseconds timeout = 5s) {
        return LaunchCoordinator(terminals, AgentManifest::builtin(), locks, runner, std::move(settings), timeout);
    }

    AgentLaunchSpec spec(const std::string& agent_cmd) const {
        return {.shell_command = "cd " + worktree.path + " && " + agent_cmd};
    }
};

} // namespace

TEST_CASE("Working directory access", "[launch]") {
    TmpDir dir{"sw_cwd"};
    REQUIRE(ensure_cwd_access(dir.path).has_value());

    auto missing = ensure_cwd_access(dir.path + "/missing");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::IoError);

    write_file(dir.path, "file.txt", "x");
    REQUIRE_FALSE(ensure_cwd_access(dir.path + "/file.txt").has_value());
}

TEST_CASE("Launch coordinator", "[launch]") {
    LaunchFixture f;

    SECTION("CreatesTerminalWithParsedCommand") {
        auto coord = f.coordinator();
        auto res = coord.launch_in_terminal("session-alpha-top", f.spec("claude --dangerously-skip-permissions \"go\""));
        REQUIRE(res.has_value());
        REQUIRE(*res == "cd " + f.worktree.path + " && claude --dangerously-skip-permissions \"go\"");

        auto created = f.terminals.created();
        REQUIRE(created.size() == 1);
        REQUIRE(created[0].params.id == "session-alpha-top");
        REQUIRE(created[0].params.cwd == f.worktree.path);
        REQUIRE(created[0].params.command == "claude");
        REQUIRE(created[0].params.args == std::vector<std::string>{"--dangerously-skip-permissions", "go"});
        REQUIRE_FALSE(created[0].sized);
    }

    SECTION("SizedLaunch") {
        auto coord = f.coordinator();
        REQUIRE(coord.launch_in_terminal("t1", f.spec("claude"), 120, 40).has_value());
        auto created = f.terminals.created();
        REQUIRE(created.size() == 1);
        REQUIRE(created[0].sized);
        REQUIRE(created[0].params.cols == 120);
        REQUIRE(created[0].params.rows == 40);
    }

    SECTION("ExistingTerminalIsReplaced") {
        f.terminals.add_live("t1");
        auto coord = f.coordinator();
        REQUIRE(coord.launch_in_terminal("t1", f.spec("claude")).has_value());
        REQUIRE(f.terminals.closed() == std::vector<std::string>{"t1"});
        REQUIRE(f.terminals.created().size() == 1);
    }

    SECTION("ConfiguredBinaryEnvAndArgs") {
        std::map<std::string, AgentSettings> settings;
        settings["claude"] = AgentSettings{
            .binary = "/opt/claude/bin/claude",
            .env = {{"ANTHROPIC_LOG", "debug"}, {"SHARED", "config"}},
            .cli_args = "--model 'opus 4'",
        };
        auto coord = f.coordinator(settings);

        auto spec = f.spec("claude \"go\"");
        spec.env_vars["SHARED"] = "spec";
        REQUIRE(coord.launch_in_terminal("t1", spec).has_value());

        auto created = f.terminals.created();
        REQUIRE(created.size() == 1);
        REQUIRE(created[0].params.command == "/opt/claude/bin/claude");
        REQUIRE(created[0].params.args == std::vector<std::string>{"--model", "opus 4", "go"});
        REQUIRE(created[0].params.env == EnvVars{{"ANTHROPIC_LOG", "debug"}, {"SHARED", "spec"}});
    }

    SECTION("ExplicitPathWinsOverConfiguredBinary") {
        std::map<std::string, AgentSettings> settings;
        settings["claude"] = AgentSettings{.binary = "/opt/claude/bin/claude"};
        auto coord = f.coordinator(settings);
        REQUIRE(coord.launch_in_terminal("t1", f.spec("/usr/bin/claude")).has_value());
        REQUIRE(f.terminals.created()[0].params.command == "/usr/bin/claude");
    }

    SECTION("BadCliArgsIsConfigError") {
        std::map<std::string, AgentSettings> settings;
        settings["claude"] = AgentSettings{.cli_args = "--model \"unterminated"};
        auto coord = f.coordinator(settings);
        auto res = coord.launch_in_terminal("t1", f.spec("claude"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::ConfigError);
    }

    SECTION("EmptyTerminalId") {
        auto coord = f.coordinator();
        auto res = coord.launch_in_terminal("", f.spec("claude"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().field == "terminal_id");
    }

    SECTION("MissingWorkingDirectory") {
        auto coord = f.coordinator();
        auto res = coord.launch_in_terminal("t1", {.shell_command = "cd " + f.worktree.path + "/gone && claude"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::IoError);
        REQUIRE(f.terminals.created().empty());
    }

    SECTION("BackendFailurePropagates") {
        f.terminals.fail_create = true;
        auto coord = f.coordinator();
        auto res = coord.launch_in_terminal("t1", f.spec("claude"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TerminalOperationFailed);
    }

    SECTION("TimeoutClosesTerminal") {
        f.terminals.create_delay = 400ms;
        auto coord = f.coordinator({}, 100ms);
        auto res = coord.launch_in_terminal("t1", f.spec("claude"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TerminalOperationFailed);
        REQUIRE(res.error().message.find("Please retry") != std::string::npos);
        REQUIRE(f.terminals.closed() == std::vector<std::string>{"t1"});
        f.runner.join_all();
    }

    SECTION("SameTerminalLaunchesAreSerialized") {
        f.terminals.create_delay = 50ms;
        auto coord = f.coordinator();

        std::vector<std::thread> threads;
        std::atomic<int> ok{0};
        for (int i = 0; i < 4; i++) {
            threads.emplace_back([&] {
                if (coord.launch_in_terminal("shared", f.spec("claude"))) ++ok;
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(ok.load() == 4);
        REQUIRE(f.terminals.max_concurrent() == 1);
        REQUIRE(f.terminals.created().size() == 4);
        REQUIRE(f.terminals.duplicates() == 0);
        REQUIRE(f.terminals.live() == std::set<std::string>{"shared"});
        REQUIRE(f.locks.size() == 1);
    }

    SECTION("DifferentTerminalsRunConcurrently") {
        f.terminals.create_delay = 200ms;
        auto coord = f.coordinator();

        std::vector<std::thread> threads;
        std::atomic<int> ok{0};
        for (int i = 0; i < 3; i++) {
            threads.emplace_back([&, i] {
                if (coord.launch_in_terminal("t" + std::to_string(i), f.spec("claude"))) ++ok;
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(ok.load() == 3);
        REQUIRE(f.terminals.max_concurrent() > 1);
        REQUIRE(f.locks.size() == 3);
    }
}
