#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

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
    ssize_t sent = ::send(fd_, msg.data(), msg.size(), MSG_NOSIGNAL);
    return sent == static_cast<ssize_t>(msg.size());
}

bool UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return false;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        auto pos = pending_.find('\n');
        if (pos != std::string::npos) {
            std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            try {
                response = nlohmann::json::parse(line);
                return true;
            } catch (const nlohmann::json::exception&) {
                return false;
            }
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n <= 0) return false;
        pending_.append(tmp, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
