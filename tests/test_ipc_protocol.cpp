#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/dp_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll briefly for data to arrive.
std::vector<json> read_some(UnixSocketServer& server, int fd, size_t want = 1) {
    std::vector<json> cmds;
    for (int i = 0; i < 200 && cmds.size() < want; ++i) {
        REQUIRE(server.read_commands(fd, cmds));
        if (cmds.size() < want) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return cmds;
}

// A bare stream socket, for sending bytes the client would never frame.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST_CASE("IPC line framing", "[ipc]") {

    SECTION("CompleteLinesOnly") {
        std::string buf = "{\"cmd\":\"status\"}\n{\"cmd\":\"ab";
        auto cmds = UnixSocketServer::take_lines(buf);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "status");
        REQUIRE(buf == "{\"cmd\":\"ab");

        buf += "ort\"}\n";
        cmds = UnixSocketServer::take_lines(buf);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "abort");
        REQUIRE(buf.empty());
    }

    SECTION("BlankLinesSkipped") {
        std::string buf = "\n\n{\"cmd\":\"pause\"}\n\n";
        auto cmds = UnixSocketServer::take_lines(buf);
        REQUIRE(cmds.size() == 1);
    }

    SECTION("GarbageBecomesEmptyCommand") {
        std::string buf = "hello there\n[1,2]\n";
        auto cmds = UnixSocketServer::take_lines(buf);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0] == json{{"cmd", ""}});
        REQUIRE(cmds[1] == json{{"cmd", ""}});
    }

    SECTION("NonStringCommandBlanked") {
        std::string buf = "{\"cmd\":5,\"limit\":3}\n{\"task\":\"x\"}\n";
        auto cmds = UnixSocketServer::take_lines(buf);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0]["cmd"] == "");
        REQUIRE(cmds[0]["limit"] == 3);
        REQUIRE(cmds[1]["cmd"] == "");
    }
}

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));

        struct stat st{};
        REQUIRE(::stat(sock_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);

        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("PathTooLong") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'x') + ".sock"));

        UnixSocketClient client;
        REQUIRE_FALSE(client.connect("/tmp/" + std::string(200, 'x') + ".sock"));
    }

    SECTION("ConnectWithoutServer") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect("/tmp/dp_test_no_such_daemon.sock"));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "run"}, {"task", "open a terminal"}}));

        auto cmds = read_some(server, client_fd);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "run");
        REQUIRE(cmds[0]["task"] == "open a terminal");

        REQUIRE(server.send_response(client_fd, {{"status", "queued"}, {"id", 1}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["status"] == "queued");
        REQUIRE(resp["id"] == 1);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ResponsesArrivingTogether") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Several lines may arrive in one read on the client side
        for (int i = 0; i < 3; ++i) {
            REQUIRE(server.send_response(client_fd, {{"event", "thought"}, {"seq", i}}));
        }
        for (int i = 0; i < 3; ++i) {
            json ev;
            REQUIRE(client.recv(ev, 1000));
            REQUIRE(ev["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MultipleCommands") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "steer"}, {"seq", i}}));
        }

        auto cmds = read_some(server, client_fd, 5);
        REQUIRE(cmds.size() == 5);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(cmds[i]["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("RecvTimeout") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json resp;
        REQUIRE_FALSE(client.recv(resp, 20));

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Client closes connection
        client.close();

        // Server should detect disconnect (read returns false)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(client_fd, cmds));

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("OversizedLineDropsClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // No newline: the server keeps buffering until the limit
        std::string blob = "{\"cmd\":\"steer\",\"text\":\"" + std::string(80 * 1024, 'a');
        REQUIRE(::send(raw, blob.data(), blob.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(blob.size()));

        bool connected = true;
        std::vector<json> cmds;
        for (int i = 0; i < 1000 && connected; ++i) {
            connected = server.read_commands(client_fd, cmds);
        }
        REQUIRE_FALSE(connected);
        REQUIRE(cmds.empty());

        server.close_client(client_fd);
        ::close(raw);
        server.stop();
    }
}
