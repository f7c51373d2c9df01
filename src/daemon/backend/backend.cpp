#include "backend/backend.hpp"

#include "backend/gnome_backend.hpp"
#include "backend/hyprland_backend.hpp"
#include "backend/kde_backend.hpp"
#include "backend/sway_backend.hpp"
#include "config.hpp"

std::string describe(const PollError& err) {
    switch (err.kind) {
        case PollErrorKind::Connection: return "connection failure: " + err.message;
        case PollErrorKind::Protocol: return "protocol failure: " + err.message;
    }
    return err.message;
}

std::unique_ptr<WindowBackend> make_backend(BackendKind kind, const SessionEnvironment& env,
                                            const Config& config) {
    std::chrono::milliseconds timeout(config.tracker.poll_timeout_ms);

    switch (kind) {
        case BackendKind::KDE:
            return std::make_unique<KdeBackend>(
                env.runtime_dir, timeout,
                config.kde.query_window_info,
                std::chrono::milliseconds(config.kde.script_wait_ms));
        case BackendKind::GNOME:
            return std::make_unique<GnomeBackend>(timeout);
        case BackendKind::Hyprland:
            return std::make_unique<HyprlandBackend>(
                env.hyprland_signature, env.runtime_dir, timeout);
        case BackendKind::Sway:
            return std::make_unique<SwayBackend>(env.sway_socket, timeout);
        case BackendKind::Unknown:
            return nullptr;
    }
    return nullptr;
}
