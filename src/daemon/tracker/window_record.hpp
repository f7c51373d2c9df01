#pragma once

#include <map>
#include <string>
#include <vector>

struct WindowRecord {
    std::string id;       // backend-scoped, e.g. Hyprland "0x55d0c1a2b3c0" or Sway con id
    std::string title;    // window title
    std::string app_id;   // Wayland app_id or X11 class (e.g. "firefox", "Firefox-esr")
    bool is_focused = false;

    bool operator==(const WindowRecord&) const = default;
};

// Keys are lower-cased app ids. A zero count is never stored.
using AppWindowCounts = std::map<std::string, int>;

// Result of one successful poll.
struct WindowSnapshot {
    std::vector<WindowRecord> windows;
    AppWindowCounts counts;

    // Build a snapshot whose counts are aggregated from `windows`.
    static WindowSnapshot from_windows(std::vector<WindowRecord> windows);
};

std::string lowercase(std::string s);
