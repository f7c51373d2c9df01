#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      tracker_(config_, SessionEnvironment::from_process(), verbose_),
      core_(config_, verbose_, tracker_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxEventLoop::init() {
    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd. Blocked before the poll thread starts so
    // it inherits the mask and signals are only seen here.
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

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    // Starts the poll thread
    core_.init();

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
                if (::read(signal_fd_, &info, sizeof(info)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "signalfd read failed: {}", std::strerror(errno));
                }
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    do {
        nlohmann::json cmd;
        auto status = ipc_server_.read_command(fd, cmd);

        if (status == IpcServer::ReadStatus::Incomplete) return;

        if (status == IpcServer::ReadStatus::Closed) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            return;
        }

        std::string cmd_str;
        if (cmd.is_object() && cmd.contains("cmd") && cmd["cmd"].is_string()) {
            cmd_str = cmd["cmd"].get<std::string>();
        }
        auto response = core_.handle_command(cmd_str, cmd);
        if (!ipc_server_.send_response(fd, response)) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            return;
        }
    } while (ipc_server_.has_buffered_command(fd));
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dockwatch] {}", msg);
    }
}
