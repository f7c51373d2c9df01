#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;
using ReadStatus = IpcServer::ReadStatus;

namespace {

std::string tmp_socket_path() {
    return "/tmp/dw_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls a non-blocking server read until something other than Incomplete.
ReadStatus read_with_retry(UnixSocketServer& server, int fd, json& out) {
    auto status = ReadStatus::Incomplete;
    for (int i = 0; i < 200 && status == ReadStatus::Incomplete; ++i) {
        status = server.read_command(fd, out);
        if (status == ReadStatus::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return status;
}

int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void raw_send(int fd, const std::string& data) {
    REQUIRE(::send(fd, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size()));
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "count"}, {"app_id", "firefox"}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Command);
        REQUIRE(received["cmd"] == "count");
        REQUIRE(received["app_id"] == "firefox");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"count", 2}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["count"] == 2);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("PartialLineIsIncomplete") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, R"({"cmd":)");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Incomplete);

        raw_send(raw, "\"status\"}\n");
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["cmd"] == "status");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("PipelinedCommands") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"seq\":1}\n{\"seq\":2}\n");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["seq"] == 1);
        REQUIRE(server.has_buffered_command(client_fd));

        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["seq"] == 2);
        REQUIRE_FALSE(server.has_buffered_command(client_fd));

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("MultipleMessages") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "status"}, {"seq", i}}));

            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Command);
            REQUIRE(received["seq"] == i);

            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            json resp;
            REQUIRE(client.recv(resp, 1000));
            REQUIRE(resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("GarbageClosesClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_send(raw, "not json\n");

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);

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

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("RecvTimesOut") {
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
}
