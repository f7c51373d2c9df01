#pragma once

#include <cstring>
#include <functional>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

// Listens on a Unix socket and hands each accepted connection to `handler`
// on a background thread, standing in for a compositor's IPC socket.
class FakeSocketServer {
public:
    using Handler = std::function<void(int fd)>;

    FakeSocketServer(std::string path, Handler handler, int connections = 1)
        : path_(std::move(path)) {
        ::unlink(path_.c_str());
        listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        ok_ = listen_fd_ >= 0 &&
              ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
              ::listen(listen_fd_, 4) == 0;

        if (ok_) {
            thread_ = std::thread([this, handler = std::move(handler), connections] {
                for (int i = 0; i < connections; ++i) {
                    int fd = ::accept(listen_fd_, nullptr, nullptr);
                    if (fd < 0) return;
                    handler(fd);
                    ::close(fd);
                }
            });
        }
    }

    ~FakeSocketServer() {
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
            ::close(listen_fd_);
        }
        if (thread_.joinable()) thread_.join();
        ::unlink(path_.c_str());
    }

    FakeSocketServer(const FakeSocketServer&) = delete;
    FakeSocketServer& operator=(const FakeSocketServer&) = delete;

    bool ok() const { return ok_; }
    const std::string& path() const { return path_; }

    static bool read_exact(int fd, char* buf, size_t len) {
        size_t total = 0;
        while (total < len) {
            ssize_t n = ::recv(fd, buf + total, len - total, 0);
            if (n <= 0) return false;
            total += static_cast<size_t>(n);
        }
        return true;
    }

    static void write_all(int fd, const std::string& data) {
        size_t total = 0;
        while (total < data.size()) {
            ssize_t n = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
            if (n <= 0) return;
            total += static_cast<size_t>(n);
        }
    }

private:
    std::string path_;
    int listen_fd_ = -1;
    bool ok_ = false;
    std::thread thread_;
};
