#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Single-threaded epoll loop that owns DaemonCore. Other threads hand work to it
// through post(); posted closures run on the loop thread in FIFO order.
class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    // Thread-safe.
    void post(std::function<void()> task);

private:
    void run_posted();
    void drain_until_idle();
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    UnixSocketServer ipc_server_;

    // Declared before core_: its worker threads may post() until it is destroyed.
    std::mutex post_mutex_;
    std::vector<std::function<void()>> posted_;

    // Portable business logic
    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int wake_fd_ = -1;

    std::atomic<bool> running_{false};
};
