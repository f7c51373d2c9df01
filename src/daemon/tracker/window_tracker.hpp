#pragma once

#include "config.hpp"
#include "tracker/environment.hpp"
#include "tracker/poll_scheduler.hpp"

#include <memory>
#include <string>
#include <vector>

// Entry point for consumers: picks the backend once at construction and
// answers window queries from the last good poll. Queries never block on I/O.
class WindowTracker {
public:
    WindowTracker(const Config& config, const SessionEnvironment& env, bool verbose = false);

    // For tests and embedders that build their own backend.
    WindowTracker(BackendKind kind, std::unique_ptr<WindowBackend> backend,
                  std::chrono::milliseconds interval, bool verbose = false);

    WindowTracker(const WindowTracker&) = delete;
    WindowTracker& operator=(const WindowTracker&) = delete;

    void start() { scheduler_.start(); }
    void stop() { scheduler_.stop(); }
    bool is_running() const { return scheduler_.running(); }

    BackendKind get_backend_kind() const { return kind_; }

    int get_window_count(const std::string& app_id) const;
    std::vector<WindowRecord> get_windows_for_app(const std::string& app_id) const;
    std::vector<WindowRecord> get_all_windows() const;
    void set_window_count(const std::string& app_id, int count);

    const WindowRegistry& registry() const { return scheduler_.registry(); }
    PollScheduler& scheduler() { return scheduler_; }
    const PollScheduler& scheduler() const { return scheduler_; }

private:
    static BackendKind choose_kind(const Config& config, const SessionEnvironment& env);

    BackendKind kind_;
    PollScheduler scheduler_;
};
