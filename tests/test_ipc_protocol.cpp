#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "protocol.hpp"

#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/sw_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server sockets are non-blocking, so poll briefly for data to arrive.
std::vector<json> read_until(UnixSocketServer& server, int fd, size_t count) {
    std::vector<json> cmds;
    for (int i = 0; i < 200 && cmds.size() < count; ++i) {
        if (server.read_commands(fd, cmds) == ReadStatus::Closed) break;
        if (cmds.size() < count) std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return cmds;
}

// Raw socket for sending bytes the client class would never produce.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    REQUIRE(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    return fd;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        {
            UnixSocketServer server;
            REQUIRE(server.start(sock_path));
            REQUIRE(std::filesystem::exists(sock_path));
            auto perms = std::filesystem::status(sock_path).permissions();
            REQUIRE((perms & std::filesystem::perms::others_all) == std::filesystem::perms::none);
            server.stop();
            REQUIRE_FALSE(std::filesystem::exists(sock_path));
        }
    }

    SECTION("PathTooLong") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'x') + ".sock"));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"command", "status"}}));
        auto received = read_until(server, client_fd, 1);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0]["command"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"sessions", 2}}));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["status"] == "ok");
        REQUIRE(client_resp["sessions"] == 2);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("PipelinedCommands") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"command", "get"}, {"seq", i}}));
        }
        auto received = read_until(server, client_fd, 5);
        REQUIRE(received.size() == 5);
        for (int i = 0; i < 5; ++i) REQUIRE(received[i]["seq"] == i);

        // Several responses in one read are split back into messages.
        for (int i = 0; i < 3; ++i) {
            REQUIRE(server.send_response(client_fd, {{"seq", i}}));
        }
        for (int i = 0; i < 3; ++i) {
            json resp;
            REQUIRE(client.recv(resp, 1000));
            REQUIRE(resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MalformedLineIsNull") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string bytes = "not json\n\n{\"command\":\"list\"}\n{\"partial\":";
        REQUIRE(::write(raw, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));

        auto received = read_until(server, client_fd, 2);
        REQUIRE(received.size() == 2);
        REQUIRE(received[0].is_null());
        REQUIRE(received[1]["command"] == "list");

        // The partial line completes on the next read.
        std::string rest = "true}\n";
        REQUIRE(::write(raw, rest.data(), rest.size()) == static_cast<ssize_t>(rest.size()));
        auto more = read_until(server, client_fd, 1);
        REQUIRE(more.size() == 1);
        REQUIRE(more[0]["partial"] == true);

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        // Server should detect disconnect
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<json> cmds;
        REQUIRE(server.read_commands(client_fd, cmds) == ReadStatus::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ConnectWithoutServer") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path + ".missing"));
    }

    SECTION("RecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        json resp;
        REQUIRE_FALSE(client.recv(resp, 20));
        client.close();
        server.stop();
    }
}

TEST_CASE("Protocol encoding", "[ipc][protocol]") {

    SECTION("ErrorResponseCarriesKind") {
        auto resp = error_response(Error::session_not_found("alpha"));
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["kind"] == "session_not_found");
        REQUIRE(resp["message"] == "Session 'alpha' not found");

        auto plain = error_response("Unknown command: nope");
        REQUIRE(plain["status"] == "error");
        REQUIRE_FALSE(plain.contains("kind"));
        REQUIRE(ok_response() == json{{"status", "ok"}});
    }

    SECTION("SessionFieldsAndNulls") {
        Session s{
            .id = "id-1",
            .name = "alpha",
            .repository_path = "/repo",
            .repository_name = "repo",
            .branch = "schaltwerk/alpha",
            .parent_branch = "main",
            .worktree_path = "/repo/.schaltwerk/worktrees/alpha",
            .session_state = SessionState::Reviewed,
            .ready_to_merge = true,
        };
        json j = s;
        REQUIRE(j["name"] == "alpha");
        REQUIRE(j["status"] == "active");
        REQUIRE(j["session_state"] == "reviewed");
        REQUIRE(j["ready_to_merge"] == true);
        REQUIRE(j["display_name"].is_null());
        REQUIRE(j["last_activity"].is_null());
    }

    SECTION("UpdateResultStatusName") {
        UpdateSessionFromParentResult r{
            .status = UpdateFromParentStatus::HasConflicts,
            .parent_branch = "main",
            .message = "conflicts",
            .conflicting_paths = {"a.txt"},
        };
        json j = r;
        REQUIRE(j["status"] == "has_conflicts");
        REQUIRE(j["conflicting_paths"] == json::array({"a.txt"}));
    }

    SECTION("OptionalString") {
        json params = {{"name", "alpha"}, {"prompt", nullptr}};
        REQUIRE(optional_string(params, "name") == "alpha");
        REQUIRE_FALSE(optional_string(params, "prompt").has_value());
        REQUIRE_FALSE(optional_string(params, "missing").has_value());
    }
}
