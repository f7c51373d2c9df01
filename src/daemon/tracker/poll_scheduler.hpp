#pragma once

#include "backend/backend.hpp"
#include "tracker/window_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

// Drives one backend on a fixed interval from a dedicated thread and
// publishes each successful poll into the registry it owns. A failed poll
// leaves the registry as it was.
class PollScheduler {
public:
    enum class TickOutcome {
        NoBackend,  // unsupported session, nothing to do
        Skipped,    // another poll still in flight
        Replaced,   // registry updated
        Failed,     // backend error, registry untouched
        Discarded,  // completed after stop(), result dropped
    };

    struct Stats {
        uint64_t polls_ok = 0;
        uint64_t polls_failed = 0;
        uint64_t ticks_skipped = 0;
        std::string last_error;
    };

    // `backend` may be null (BackendKind::Unknown).
    PollScheduler(std::unique_ptr<WindowBackend> backend, std::chrono::milliseconds interval,
                  bool verbose = false);
    ~PollScheduler();

    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;

    // No-op if already running. The first poll happens immediately.
    void start();

    // Wakes and joins the poll thread. A poll in flight finishes but its
    // result is discarded. The registry keeps the last snapshot.
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }

    // One poll on the calling thread.
    TickOutcome tick();

    WindowRegistry& registry() { return registry_; }
    const WindowRegistry& registry() const { return registry_; }

    bool has_backend() const { return backend_ != nullptr; }
    Stats stats() const;

private:
    void run(std::stop_token st);
    void log(const std::string& msg);

    std::unique_ptr<WindowBackend> backend_;
    WindowRegistry registry_;
    std::chrono::milliseconds interval_;
    bool verbose_;

    std::mutex poll_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_;

    std::mutex lifecycle_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;
};
