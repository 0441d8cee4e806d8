#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void fork_or_exit(const char* stage) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "daemon: {} fork failed: {}", stage, std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);
}

void redirect(int target, const char* path, int flags) {
    int fd = open(path, flags | O_CLOEXEC, 0600);
    if (fd < 0) fd = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (fd < 0) return;
    dup2(fd, target);
    close(fd);
}

} // namespace

void daemonize(const std::string& log_path) {
    // Create the log directory while errors can still reach the terminal.
    if (!log_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(log_path).parent_path(), ec);
        if (ec) {
            std::println(stderr, "daemon: cannot create log directory for {}: {}",
                         log_path, ec.message());
        }
    }

    fork_or_exit("first");
    setsid();
    fork_or_exit("second");

    umask(077);

    std::fflush(stdout);
    std::fflush(stderr);
    redirect(STDIN_FILENO, "/dev/null", O_RDONLY);
    redirect(STDOUT_FILENO, "/dev/null", O_WRONLY);
    redirect(STDERR_FILENO, log_path.empty() ? "/dev/null" : log_path.c_str(),
             O_WRONLY | O_CREAT | O_APPEND);
}

} // namespace platform
