#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Tracker {
        std::string backend = "auto"; // "auto", "kde", "gnome", "hyprland", "sway", "none"
        uint32_t poll_interval_ms = 2000;
        uint32_t poll_timeout_ms = 1000;
    } tracker;

    struct Kde {
        // queryWindowInfo is KWin's interactive picker on stock builds.
        bool query_window_info = false;
        uint32_t script_wait_ms = 500;
    } kde;

    // Launch commands pinned to the dock, reported by the "pinned" command.
    std::vector<std::string> pinned;

    static Config load(const std::string& path);
    static Config load_default();
};
