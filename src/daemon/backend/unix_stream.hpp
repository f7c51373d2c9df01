#pragma once

#include "backend/backend.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

// Client end of a compositor IPC socket. Every operation shares one
// deadline fixed at construction, so a stalled peer costs at most `timeout`
// per poll.
class UnixStream {
public:
    explicit UnixStream(std::chrono::milliseconds timeout);
    ~UnixStream();

    UnixStream(const UnixStream&) = delete;
    UnixStream& operator=(const UnixStream&) = delete;

    std::expected<void, PollError> connect(const std::string& path);
    std::expected<void, PollError> write_all(std::string_view data);
    std::expected<void, PollError> read_exact(char* buf, size_t len);

    // Read until the peer closes. Fails if more than `max_bytes` arrive.
    std::expected<std::string, PollError> read_to_end(size_t max_bytes);

private:
    // Wait for `events` on fd_ until the deadline. False on timeout or error.
    bool wait_for(short events);

    int fd_ = -1;
    std::chrono::steady_clock::time_point deadline_;
};
