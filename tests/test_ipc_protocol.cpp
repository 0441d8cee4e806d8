#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/meetcap_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking; poll until something complete arrives.
std::optional<std::vector<json>> read_some(UnixSocketServer& server, int fd) {
    for (int i = 0; i < 100; ++i) {
        auto got = server.read_commands(fd);
        if (!got || !got->empty()) return got;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return std::vector<json>{};
}

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

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("SecondServerRefusedWhileFirstListens") {
        UnixSocketServer first;
        REQUIRE(first.start(sock_path));

        UnixSocketServer second;
        REQUIRE_FALSE(second.start(sock_path));

        // The first server's socket is untouched.
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
    }

    SECTION("StaleSocketReplaced") {
        // A bound socket nobody listens on, as left behind by a crash.
        int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        ::close(fd);
        REQUIRE(std::filesystem::exists(sock_path));

        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(server.accept_client() >= 0);
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));

        auto received = read_some(server, client_fd);
        REQUIRE(received.has_value());
        REQUIRE(received->size() == 1);
        REQUIRE((*received)[0]["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["state"] == "idle");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("SeveralMessagesInOneRead") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 3; ++i) {
            REQUIRE(client.send({{"cmd", "status"}, {"seq", i}}));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        std::vector<json> all;
        while (all.size() < 3) {
            auto got = read_some(server, client_fd);
            REQUIRE(got.has_value());
            REQUIRE_FALSE(got->empty());
            all.insert(all.end(), got->begin(), got->end());
        }
        for (int i = 0; i < 3; ++i) REQUIRE(all[i]["seq"] == i);

        // Event lines sent back to back come out one per recv().
        for (int i = 0; i < 3; ++i) {
            REQUIRE(server.send_response(client_fd, {{"event", "store_changed"}, {"seq", i}}));
        }
        for (int i = 0; i < 3; ++i) {
            json msg;
            REQUIRE(client.recv(msg, 1000));
            REQUIRE(msg["seq"] == i);
        }

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("PartialMessageIsBuffered") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string first = R"({"cmd": "sho)";
        std::string second = "w\", \"id\": \"x\"}\n";

        REQUIRE(::send(raw, first.data(), first.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(first.size()));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        auto got = server.read_commands(client_fd);
        REQUIRE(got.has_value());
        REQUIRE(got->empty());

        REQUIRE(::send(raw, second.data(), second.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(second.size()));
        got = read_some(server, client_fd);
        REQUIRE(got.has_value());
        REQUIRE(got->size() == 1);
        REQUIRE((*got)[0]["cmd"] == "show");
        REQUIRE((*got)[0]["id"] == "x");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("MalformedMessageDropsClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string junk = "{not json}\n";
        ::send(raw, junk.data(), junk.size(), MSG_NOSIGNAL);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        REQUIRE_FALSE(server.read_commands(client_fd).has_value());

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
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        REQUIRE_FALSE(server.read_commands(client_fd).has_value());

        server.close_client(client_fd);
        server.stop();
    }
}
