#include "daemon_core.hpp"

#include <climits>
#include <cstdint>
#include <format>
#include <print>

namespace {

nlohmann::json to_json(const WindowRecord& w) {
    return {
        {"id", w.id},
        {"title", w.title},
        {"app_id", w.app_id},
        {"focused", w.is_focused},
    };
}

nlohmann::json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, WindowTracker& tracker)
    : config_(std::move(config)), verbose_(verbose), tracker_(tracker) {}

void DaemonCore::init() {
    tracker_.start();
    log(std::format("Tracking windows via {} (every {} ms)",
                    to_string(tracker_.get_backend_kind()), config_.tracker.poll_interval_ms));
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    try {
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "count") return handle_count(cmd);
        if (cmd_str == "windows") return handle_windows(cmd);
        if (cmd_str == "set_count") return handle_set_count(cmd);
        if (cmd_str == "pinned") return handle_pinned(cmd);
    } catch (const nlohmann::json::exception& e) {
        return error(std::string("bad arguments: ") + e.what());
    }
    return error("unknown command");
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    auto stats = tracker_.scheduler().stats();
    return {
        {"status", "ok"},
        {"backend", std::string(to_string(tracker_.get_backend_kind()))},
        {"running", tracker_.is_running()},
        {"windows", tracker_.get_all_windows().size()},
        {"generation", tracker_.registry().generation()},
        {"polls_ok", stats.polls_ok},
        {"polls_failed", stats.polls_failed},
        {"ticks_skipped", stats.ticks_skipped},
        {"last_error", stats.last_error},
    };
}

nlohmann::json DaemonCore::handle_count(const nlohmann::json& cmd) {
    auto app_id = cmd.value("app_id", "");
    if (app_id.empty()) return error("missing app_id");
    return {{"status", "ok"}, {"app_id", app_id}, {"count", tracker_.get_window_count(app_id)}};
}

nlohmann::json DaemonCore::handle_windows(const nlohmann::json& cmd) {
    auto app_id = cmd.value("app_id", "");
    auto windows = app_id.empty() ? tracker_.get_all_windows()
                                  : tracker_.get_windows_for_app(app_id);

    nlohmann::json resp = {{"status", "ok"}, {"windows", nlohmann::json::array()}};
    for (const auto& w : windows) {
        resp["windows"].push_back(to_json(w));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_set_count(const nlohmann::json& cmd) {
    auto app_id = cmd.value("app_id", "");
    if (app_id.empty()) return error("missing app_id");
    if (!cmd.contains("count") || !cmd["count"].is_number_integer()) {
        return error("missing count");
    }

    const auto& value = cmd["count"];
    bool in_range = value.is_number_unsigned()
                        ? value.get<uint64_t>() <= static_cast<uint64_t>(INT_MAX)
                        : value.get<int64_t>() >= INT_MIN && value.get<int64_t>() <= INT_MAX;
    if (!in_range) return error("count out of range");

    int count = static_cast<int>(value.get<int64_t>());
    tracker_.set_window_count(app_id, count);
    log(std::format("Window count for {} set to {}", app_id, count));
    return {{"status", "ok"}};
}

nlohmann::json DaemonCore::handle_pinned(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}, {"apps", nlohmann::json::array()}};
    for (const auto& app : config_.pinned) {
        int count = tracker_.get_window_count(app);
        resp["apps"].push_back({{"app_id", app}, {"count", count}, {"running", count > 0}});
    }
    return resp;
}

void DaemonCore::shutdown() {
    tracker_.stop();
    log("Window tracking stopped");
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dockwatch] {}", msg);
    }
}
