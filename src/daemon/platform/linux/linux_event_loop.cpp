#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/pipewire_audio_source.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      core_(config_, verbose_, ipc_server_,
            // AudioSourceFactory
            [buffer_seconds = config_.audio.buffer_seconds](TranscriptionBackend& backend)
                -> std::unique_ptr<AudioSource> {
                return std::make_unique<PipeWireAudioSource>(backend, buffer_seconds);
            },
            // Dispatcher
            [this](std::function<void()> task) { post(std::move(task)); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool LinuxEventLoop::init() {
    // Posted-work notification; must exist before anything can post.
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Core init (backend, diarization, store)
    if (!core_.init()) return false;

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(wake_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == wake_fd_) {
                run_posted();
                continue;
            }

            handle_client(fd);
        }
    }

    // A meeting in progress is stopped and processed to completion before exit.
    core_.shutdown();
    drain_until_idle();
    core_.flush();
    ipc_server_.stop();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::post(std::function<void()> task) {
    {
        std::lock_guard lock(post_mutex_);
        posted_.push_back(std::move(task));
    }
    uint64_t val = 1;
    ::write(wake_fd_, &val, sizeof(val));
}

void LinuxEventLoop::run_posted() {
    uint64_t val;
    ::read(wake_fd_, &val, sizeof(val));

    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard lock(post_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) task();
}

void LinuxEventLoop::drain_until_idle() {
    while (!core_.is_idle()) {
        pollfd pfd{.fd = wake_fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "poll error: {}", std::strerror(errno));
            return;
        }
        run_posted();
    }
}

void LinuxEventLoop::handle_client(int fd) {
    auto commands = ipc_server_.read_commands(fd);
    if (!commands) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        core_.remove_client(fd);
        ipc_server_.close_client(fd);
        return;
    }

    for (auto& cmd : *commands) {
        if (auto response = core_.handle_command(fd, cmd)) {
            ipc_server_.send_response(fd, *response);
        }
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
