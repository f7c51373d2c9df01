#include "backend/unix_stream.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixStream::UnixStream(std::chrono::milliseconds timeout)
    : deadline_(std::chrono::steady_clock::now() + timeout) {}

UnixStream::~UnixStream() {
    if (fd_ >= 0) ::close(fd_);
}

std::expected<void, PollError> UnixStream::connect(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("invalid socket path '{}'", path)});
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("socket: {}", std::strerror(errno))});
    }

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("connect {}: {}", path, std::strerror(err))});
    }
    return {};
}

std::expected<void, PollError> UnixStream::write_all(std::string_view data) {
    size_t sent_total = 0;
    while (sent_total < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent_total, data.size() - sent_total, MSG_NOSIGNAL);
        if (n > 0) {
            sent_total += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_for(POLLOUT)) {
                return std::unexpected(PollError{PollErrorKind::Protocol, "write timed out"});
            }
            continue;
        }
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("send: {}", std::strerror(errno))});
    }
    return {};
}

std::expected<void, PollError> UnixStream::read_exact(char* buf, size_t len) {
    size_t read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd_, buf + read_total, len - read_total, 0);
        if (n > 0) {
            read_total += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            return std::unexpected(PollError{
                PollErrorKind::Protocol,
                std::format("short read: got {} of {} bytes", read_total, len)});
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait_for(POLLIN)) {
                return std::unexpected(PollError{PollErrorKind::Protocol, "read timed out"});
            }
            continue;
        }
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("recv: {}", std::strerror(errno))});
    }
    return {};
}

std::expected<std::string, PollError> UnixStream::read_to_end(size_t max_bytes) {
    std::string out;
    char tmp[8192];
    while (true) {
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n > 0) {
            out.append(tmp, static_cast<size_t>(n));
            if (out.size() > max_bytes) {
                return std::unexpected(PollError{PollErrorKind::Protocol, "response too large"});
            }
            continue;
        }
        if (n == 0) return out;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (!wait_for(POLLIN)) {
                return std::unexpected(PollError{PollErrorKind::Protocol, "read timed out"});
            }
            continue;
        }
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("recv: {}", std::strerror(errno))});
    }
}

bool UnixStream::wait_for(short events) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_ - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return false;

        pollfd pfd{.fd = fd_, .events = events, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;
        // POLLHUP/POLLERR: let the next recv/send report what happened.
        return true;
    }
}
