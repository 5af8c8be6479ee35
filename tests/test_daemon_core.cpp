#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "daemon_core.hpp"
#include "git_test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace testing;
using json = nlohmann::json;

namespace {

// Collects what the daemon would have written to each client.
class FakeIpc : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_commands(int, std::vector<json>&) override { return ReadStatus::Ok; }
    bool send_response(int client_fd, const json& response) override {
        std::lock_guard lock(mu_);
        sent_[client_fd].push_back(response);
        return true;
    }
    void close_client(int) override {}

    std::vector<json> sent(int client_fd) {
        std::lock_guard lock(mu_);
        return sent_[client_fd];
    }

private:
    std::mutex mu_;
    std::map<int, std::vector<json>> sent_;
};

class RecordingTerminals : public TerminalBackend {
public:
    Result<bool> terminal_exists(const std::string& id) override {
        std::lock_guard lock(mu);
        return live.contains(id);
    }
    Result<void> close_terminal(const std::string& id) override {
        std::lock_guard lock(mu);
        live.erase(id);
        return {};
    }
    Result<void> create_terminal_with_app(const std::string& id, const std::string& cwd,
                                          const std::string& command,
                                          const std::vector<std::string>& args,
                                          const EnvVars& env) override {
        return create_terminal_with_app_and_size({.id = id, .cwd = cwd, .command = command, .args = args, .env = env});
    }
    Result<void> create_terminal_with_app_and_size(const CreateTerminalParams& params) override {
        std::lock_guard lock(mu);
        live.insert(params.id);
        created.push_back(params);
        return {};
    }

    std::mutex mu;
    std::set<std::string> live;
    std::vector<CreateTerminalParams> created;
};

struct DaemonFixture {
    TmpRepo repo;
    TmpDir dbdir{"sw_daemon"};
    SessionDb db;
    FakeInspector inspector;
    RecordingTerminals terminals;
    FakeIpc ipc;
    std::atomic<int> notified{0};
    std::unique_ptr<DaemonCore> core;

    DaemonFixture() {
        Config config;
        config.repository = repo.path;
        config.database = dbdir.path + "/sessions.db";
        core = std::make_unique<DaemonCore>(config, false, db, inspector, terminals, ipc,
                                            [this] { notified++; });
        REQUIRE(core->init());
    }

    // Sends cmd as client fd and drives completions until its response lands.
    json call(int fd, const json& cmd) {
        auto before = ipc.sent(fd).size();
        auto immediate = core->handle_command(fd, cmd);
        if (immediate["status"] != "pending") return immediate;

        for (int i = 0; i < 1000; i++) {
            core->on_worker_complete();
            auto sent = ipc.sent(fd);
            for (size_t k = before; k < sent.size(); k++) {
                if (!sent[k].contains("event")) return sent[k];
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        FAIL("no response for " << cmd.dump());
        return {};
    }
};

} // namespace

TEST_CASE("DaemonCore dispatch", "[daemon]") {
    DaemonFixture f;

    SECTION("StatusIsAnsweredInline") {
        auto resp = f.core->handle_command(1, {{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["repository"] == f.repo.path);
        REQUIRE(f.core->workers_in_flight() == 0);
    }

    SECTION("UnknownCommand") {
        auto resp = f.core->handle_command(1, {{"cmd", "explode"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"].get<std::string>().find("explode") != std::string::npos);
    }

    SECTION("NonObjectRequest") {
        auto resp = f.core->handle_command(1, json());
        REQUIRE(resp["status"] == "error");
    }

    SECTION("MissingParameter") {
        auto resp = f.call(1, {{"cmd", "get"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"].get<std::string>().find("name") != std::string::npos);
    }

    SECTION("CreateGetList") {
        auto created = f.call(1, {{"cmd", "create"}, {"name", "alpha"}, {"prompt", "fix login"}});
        INFO(created.dump());
        REQUIRE(created["status"] == "ok");
        REQUIRE(created["session"]["branch"] == "schaltwerk/alpha");
        REQUIRE(created["session"]["session_state"] == "running");

        auto got = f.call(1, {{"cmd", "get"}, {"name", "alpha"}});
        REQUIRE(got["session"]["initial_prompt"] == "fix login");

        auto listed = f.call(1, {{"cmd", "list"}});
        REQUIRE(listed["sessions"].size() == 1);

        auto missing = f.call(1, {{"cmd", "get"}, {"name", "ghost"}});
        REQUIRE(missing["status"] == "error");
        REQUIRE(missing["kind"] == "session_not_found");
    }

    SECTION("BadStateValue") {
        f.call(1, {{"cmd", "create"}, {"name", "alpha"}});
        auto resp = f.call(1, {{"cmd", "set_state"}, {"name", "alpha"}, {"state", "done"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "invalid_input");
    }

    SECTION("SpecLifecycle") {
        REQUIRE(f.call(1, {{"cmd", "create_spec"}, {"name", "plan"}, {"content", "# plan"}})["status"] == "ok");
        REQUIRE(f.call(1, {{"cmd", "list_specs"}})["specs"].size() == 1);

        auto started = f.call(1, {{"cmd", "start_spec"}, {"name", "plan"}});
        INFO(started.dump());
        REQUIRE(started["status"] == "ok");
        REQUIRE(started["session"]["session_state"] == "running");
        REQUIRE(f.call(1, {{"cmd", "list_specs"}})["specs"].empty());
    }

    SECTION("ReviewAndMerge") {
        auto created = f.call(1, {{"cmd", "create"}, {"name", "alpha"}});
        auto worktree = created["session"]["worktree_path"].get<std::string>();
        commit_file(worktree, "feature.txt", "feature\n", "feature work");

        auto reviewed = f.call(1, {{"cmd", "mark_reviewed"}, {"name", "alpha"}});
        REQUIRE(reviewed["ready_to_merge"] == true);

        auto preview = f.call(1, {{"cmd", "merge_preview"}, {"name", "alpha"}});
        REQUIRE(preview["preview"]["parent_branch"] == "main");
        REQUIRE(preview["preview"]["is_up_to_date"] == false);

        auto bad_mode = f.call(1, {{"cmd", "merge"}, {"name", "alpha"}, {"mode", "octopus"}});
        REQUIRE(bad_mode["kind"] == "invalid_input");

        auto merged = f.call(1, {{"cmd", "merge"}, {"name", "alpha"}, {"mode", "squash"}, {"message", "Land alpha"}});
        INFO(merged.dump());
        REQUIRE(merged["status"] == "ok");
        REQUIRE(merged["outcome"]["new_commit"] == head_of(f.repo.path, "main"));
    }

    SECTION("UpdateFromParentReportsStatus") {
        f.call(1, {{"cmd", "create"}, {"name", "alpha"}});
        auto resp = f.call(1, {{"cmd", "update_from_parent"}, {"name", "alpha"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["result"]["status"] == "already_up_to_date");
    }

    SECTION("LaunchBuildsCommandFromSession") {
        f.call(1, {{"cmd", "create"}, {"name", "alpha"}, {"prompt", "go"}});
        auto resp = f.call(1, {{"cmd", "launch"}, {"name", "alpha"}});
        INFO(resp.dump());
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["terminal_id"] == "session-alpha-top");

        std::lock_guard lock(f.terminals.mu);
        REQUIRE(f.terminals.created.size() == 1);
        REQUIRE(f.terminals.created[0].command == "claude");
        REQUIRE(f.terminals.created[0].args == std::vector<std::string>{"go"});
    }

    SECTION("LaunchResumeOmitsPrompt") {
        f.call(1, {{"cmd", "create"}, {"name", "alpha"}, {"prompt", "go"}});
        auto resp = f.call(1, {{"cmd", "launch"}, {"name", "alpha"}, {"resume", true}, {"terminal_id", "t9"}});
        REQUIRE(resp["terminal_id"] == "t9");

        std::lock_guard lock(f.terminals.mu);
        REQUIRE(f.terminals.created[0].args.empty());
    }

    SECTION("LaunchRefusesSpec") {
        f.call(1, {{"cmd", "create_spec"}, {"name", "plan"}, {"content", "x"}});
        auto resp = f.call(1, {{"cmd", "launch"}, {"name", "plan"}});
        REQUIRE(resp["status"] == "error");
    }

    SECTION("Branches") {
        git_ok(f.repo.path, {"branch", "develop"});
        auto resp = f.call(1, {{"cmd", "branches"}});
        REQUIRE(resp["branches"] == json::array({"develop", "main"}));
    }
}

TEST_CASE("DaemonCore events and clients", "[daemon]") {
    DaemonFixture f;

    SECTION("SubscribersReceiveEvents") {
        REQUIRE(f.core->handle_command(7, {{"cmd", "subscribe"}})["status"] == "ok");
        f.call(1, {{"cmd", "create"}, {"name", "alpha"}});
        f.core->on_worker_complete();

        bool saw_added = false;
        for (const auto& msg : f.ipc.sent(7)) {
            if (msg.value("event", "") == "session_added") saw_added = true;
        }
        REQUIRE(saw_added);

        // Non-subscribers only see their own responses.
        for (const auto& msg : f.ipc.sent(1)) REQUIRE_FALSE(msg.contains("event"));
    }

    SECTION("ResponseForDepartedClientIsDropped") {
        auto resp = f.core->handle_command(3, {{"cmd", "list"}});
        REQUIRE(resp["status"] == "pending");
        f.core->remove_client(3);

        for (int i = 0; i < 200 && f.core->workers_in_flight() > 0; i++) {
            f.core->on_worker_complete();
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(f.core->workers_in_flight() == 0);
        REQUIRE(f.ipc.sent(3).empty());
    }

    SECTION("ShutdownIsIdempotent") {
        f.core->handle_command(1, {{"cmd", "list"}});
        auto report = f.core->shutdown();
        REQUIRE(report.workers_joined == 1);
        REQUIRE(report.database_closed);
        REQUIRE_FALSE(f.db.is_open());

        auto again = f.core->shutdown();
        REQUIRE(again.workers_joined == 0);
        REQUIRE_FALSE(again.database_closed);

        auto refused = f.core->handle_command(1, {{"cmd", "list"}});
        REQUIRE(refused["status"] == "error");
    }
}
