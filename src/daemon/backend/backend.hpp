#pragma once

#include "tracker/environment.hpp"
#include "tracker/window_record.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>

struct Config;

enum class PollErrorKind {
    Connection,  // transport could not be opened or peer unreachable
    Protocol,    // reply received but malformed, short, or timed out
};

struct PollError {
    PollErrorKind kind;
    std::string message;
};

std::string describe(const PollError& err);

using PollResult = std::expected<WindowSnapshot, PollError>;

class WindowBackend {
public:
    virtual ~WindowBackend() = default;
    virtual BackendKind kind() const = 0;
    // One request/response cycle against the compositor.
    virtual PollResult poll() = 0;
};

// Returns nullptr for BackendKind::Unknown.
std::unique_ptr<WindowBackend> make_backend(BackendKind kind, const SessionEnvironment& env,
                                            const Config& config);
