#include "tracker/window_tracker.hpp"

#include <print>

WindowTracker::WindowTracker(const Config& config, const SessionEnvironment& env, bool verbose)
    : kind_(choose_kind(config, env)),
      scheduler_(make_backend(kind_, env, config),
                 std::chrono::milliseconds(config.tracker.poll_interval_ms), verbose) {
    if (verbose) {
        std::println(stderr, "[dockwatch] window backend: {}", to_string(kind_));
    }
}

WindowTracker::WindowTracker(BackendKind kind, std::unique_ptr<WindowBackend> backend,
                             std::chrono::milliseconds interval, bool verbose)
    : kind_(kind), scheduler_(std::move(backend), interval, verbose) {}

BackendKind WindowTracker::choose_kind(const Config& config, const SessionEnvironment& env) {
    if (config.tracker.backend == "auto") return detect_backend(env);

    if (auto forced = backend_kind_from_string(config.tracker.backend)) return *forced;

    std::println(stderr, "[dockwatch] unknown tracker.backend '{}', detecting",
                 config.tracker.backend);
    return detect_backend(env);
}

int WindowTracker::get_window_count(const std::string& app_id) const {
    return scheduler_.registry().get_window_count(app_id);
}

std::vector<WindowRecord> WindowTracker::get_windows_for_app(const std::string& app_id) const {
    return scheduler_.registry().get_windows_for_app(app_id);
}

std::vector<WindowRecord> WindowTracker::get_all_windows() const {
    return scheduler_.registry().get_all_windows();
}

void WindowTracker::set_window_count(const std::string& app_id, int count) {
    scheduler_.registry().set_window_count(app_id, count);
}
