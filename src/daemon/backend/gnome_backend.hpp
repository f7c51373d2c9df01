#pragma once

#include "backend/backend.hpp"
#include "backend/dbus_util.hpp"

#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

// org.gnome.Shell.Introspect.GetWindows -> a{ta{sv}}
class GnomeBackend : public WindowBackend {
public:
    explicit GnomeBackend(std::chrono::milliseconds timeout);

    BackendKind kind() const override { return BackendKind::GNOME; }
    PollResult poll() override;

    using WindowEntry = std::pair<uint64_t, dbus::PropertyBag>;

    // Windows without a string "app-id" (or "wm-class") are dropped.
    static WindowSnapshot build_snapshot(const std::vector<WindowEntry>& entries);

private:
    static int read_windows(sd_bus_message* m, std::vector<WindowEntry>& out);

    std::chrono::milliseconds timeout_;
};
