#pragma once

#include "config.hpp"
#include "tracker/window_tracker.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Answers dock UI commands from the tracker's registry. Owns no I/O.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose, WindowTracker& tracker);

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    void init();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void shutdown();

private:
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_count(const nlohmann::json& cmd);
    nlohmann::json handle_windows(const nlohmann::json& cmd);
    nlohmann::json handle_set_count(const nlohmann::json& cmd);
    nlohmann::json handle_pinned(const nlohmann::json& cmd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    WindowTracker& tracker_;
};
