#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = 30000) override;
    void close() override;

private:
    bool pop_line(nlohmann::json& response, bool& ok);

    int fd_ = -1;
    std::string pending_; // bytes after the last complete line
};
