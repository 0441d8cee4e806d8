#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <unordered_map>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    // Fails without touching the path if another daemon still accepts on it.
    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    std::optional<std::vector<nlohmann::json>> read_commands(int client_fd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    static constexpr size_t max_line = 1 << 20;

    static bool endpoint_in_use(const std::string& socket_path);

    int server_fd_ = -1;
    std::string socket_path_;

    // Bytes after the last newline, per connected client.
    std::unordered_map<int, std::string> pending_;
};
