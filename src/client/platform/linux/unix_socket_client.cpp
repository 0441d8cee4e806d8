#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    pending_.clear();
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

bool UnixSocketClient::pop_line(nlohmann::json& response, bool& ok) {
    auto pos = pending_.find('\n');
    if (pos == std::string::npos) return false;

    std::string line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);
    try {
        response = nlohmann::json::parse(line);
        ok = true;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: bad response: {}", e.what());
        ok = false;
    }
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return false;

    bool ok = false;
    if (pop_line(response, ok)) return ok;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    while (true) {
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n <= 0) return false;

        pending_.append(tmp, static_cast<size_t>(n));
        if (pop_line(response, ok)) return ok;
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
