#pragma once

#include <optional>
#include <string>
#include <string_view>

enum class BackendKind { KDE, GNOME, Hyprland, Sway, Unknown };

std::string_view to_string(BackendKind kind);

// Parse a config value ("kde", "gnome", "hyprland", "sway", "none").
// Returns nullopt for "auto" and for anything unrecognised.
std::optional<BackendKind> backend_kind_from_string(std::string_view name);

// Session markers relevant to backend selection.
struct SessionEnvironment {
    std::string hyprland_signature;  // $HYPRLAND_INSTANCE_SIGNATURE
    std::string sway_socket;         // $SWAYSOCK
    std::string current_desktop;     // $XDG_CURRENT_DESKTOP
    std::string session_desktop;     // $XDG_SESSION_DESKTOP
    std::string runtime_dir;         // $XDG_RUNTIME_DIR

    static SessionEnvironment from_process();
};

// Compositor-specific markers win over desktop names, since some sessions
// export several of them at once.
BackendKind detect_backend(const SessionEnvironment& env);
