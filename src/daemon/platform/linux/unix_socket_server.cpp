#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

namespace {

bool make_address(const std::string& socket_path, sockaddr_un& addr) {
    addr = {};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

} // namespace

bool UnixSocketServer::endpoint_in_use(const std::string& socket_path) {
    sockaddr_un addr;
    if (!make_address(socket_path, addr)) return false;

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    bool live = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return live;
}

bool UnixSocketServer::start(const std::string& socket_path) {
    sockaddr_un addr;
    if (!make_address(socket_path, addr)) {
        std::println(stderr, "ipc: socket path too long: {}", socket_path);
        return false;
    }

    if (endpoint_in_use(socket_path)) {
        std::println(stderr, "ipc: another daemon is listening on {}", socket_path);
        return false;
    }

    // Stale socket from a daemon that did not shut down cleanly.
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Transcripts are private; only the owning user may connect.
    ::chmod(socket_path.c_str(), 0600);

    if (::listen(server_fd_, 8) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    socket_path_ = socket_path;
    return true;
}

void UnixSocketServer::stop() {
    for (auto& [fd, buf] : pending_) {
        ::close(fd);
    }
    pending_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    pending_[fd];
    return fd;
}

std::optional<std::vector<nlohmann::json>> UnixSocketServer::read_commands(int client_fd) {
    auto it = pending_.find(client_fd);
    if (it == pending_.end()) return std::nullopt;
    auto& pending = it->second;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n == 0) return std::nullopt;
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::vector<nlohmann::json>{};
        }
        return std::nullopt;
    }

    pending.append(buf, static_cast<size_t>(n));

    std::vector<nlohmann::json> out;
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, pos);
        pending.erase(0, pos + 1);
        if (line.empty()) continue;

        try {
            out.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::exception& e) {
            std::println(stderr, "ipc: bad message from fd {}: {}", client_fd, e.what());
            return std::nullopt;
        }
    }

    if (pending.size() > max_line) {
        std::println(stderr, "ipc: message from fd {} too long", client_fd);
        return std::nullopt;
    }

    return out;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
                if (::poll(&pfd, 1, 1000) > 0) continue;
            }
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    pending_.erase(client_fd);
}
