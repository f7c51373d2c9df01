#include "tracker/environment.hpp"

#include "tracker/window_record.hpp"

#include <cstdlib>

namespace {

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string{};
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

std::string_view to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::KDE: return "kde";
        case BackendKind::GNOME: return "gnome";
        case BackendKind::Hyprland: return "hyprland";
        case BackendKind::Sway: return "sway";
        case BackendKind::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<BackendKind> backend_kind_from_string(std::string_view name) {
    auto n = lowercase(std::string(name));
    if (n == "kde") return BackendKind::KDE;
    if (n == "gnome") return BackendKind::GNOME;
    if (n == "hyprland") return BackendKind::Hyprland;
    if (n == "sway") return BackendKind::Sway;
    if (n == "none") return BackendKind::Unknown;
    return std::nullopt;
}

SessionEnvironment SessionEnvironment::from_process() {
    return SessionEnvironment{
        .hyprland_signature = env_or_empty("HYPRLAND_INSTANCE_SIGNATURE"),
        .sway_socket = env_or_empty("SWAYSOCK"),
        .current_desktop = env_or_empty("XDG_CURRENT_DESKTOP"),
        .session_desktop = env_or_empty("XDG_SESSION_DESKTOP"),
        .runtime_dir = env_or_empty("XDG_RUNTIME_DIR"),
    };
}

BackendKind detect_backend(const SessionEnvironment& env) {
    if (!env.hyprland_signature.empty()) return BackendKind::Hyprland;
    if (!env.sway_socket.empty()) return BackendKind::Sway;

    auto desktop = lowercase(env.current_desktop);
    auto session = lowercase(env.session_desktop);

    if (contains(desktop, "kde") || contains(desktop, "plasma") ||
        contains(session, "kde") || contains(session, "plasma")) {
        return BackendKind::KDE;
    }
    if (contains(desktop, "gnome") || contains(session, "gnome")) {
        return BackendKind::GNOME;
    }
    return BackendKind::Unknown;
}
