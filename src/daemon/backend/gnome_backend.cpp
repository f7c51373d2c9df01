#include "backend/gnome_backend.hpp"

#include <cstring>
#include <format>

namespace {

constexpr dbus::MethodTarget GET_WINDOWS{
    "org.gnome.Shell.Introspect",
    "/org/gnome/Shell/Introspect",
    "org.gnome.Shell.Introspect",
    "GetWindows",
};

} // namespace

GnomeBackend::GnomeBackend(std::chrono::milliseconds timeout) : timeout_(timeout) {}

PollResult GnomeBackend::poll() {
    auto bus = dbus::open_session_bus();
    if (!bus) return std::unexpected(bus.error());

    auto reply = dbus::call(bus->get(), GET_WINDOWS, timeout_);
    if (!reply) return std::unexpected(reply.error().to_poll_error());

    std::vector<WindowEntry> entries;
    int r = read_windows(reply->get(), entries);
    if (r < 0) {
        return std::unexpected(PollError{
            PollErrorKind::Protocol,
            std::format("malformed GetWindows reply: {}", std::strerror(-r))});
    }
    return build_snapshot(entries);
}

int GnomeBackend::read_windows(sd_bus_message* m, std::vector<WindowEntry>& out) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{ta{sv}}");
    if (r < 0) return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "ta{sv}")) > 0) {
        uint64_t id = 0;
        r = sd_bus_message_read_basic(m, SD_BUS_TYPE_UINT64, &id);
        if (r < 0) return r;

        dbus::PropertyBag props;
        r = dbus::read_property_bag(m, props);
        if (r < 0) return r;

        r = sd_bus_message_exit_container(m);
        if (r < 0) return r;

        out.emplace_back(id, std::move(props));
    }
    if (r < 0) return r;

    return sd_bus_message_exit_container(m);
}

WindowSnapshot GnomeBackend::build_snapshot(const std::vector<WindowEntry>& entries) {
    std::vector<WindowRecord> windows;
    windows.reserve(entries.size());

    for (const auto& [id, props] : entries) {
        auto app_id = dbus::string_property(props, "app-id");
        if (!app_id || app_id->empty()) app_id = dbus::string_property(props, "wm-class");
        if (!app_id || app_id->empty()) continue;

        windows.push_back(WindowRecord{
            .id = std::to_string(id),
            .title = dbus::string_property(props, "title").value_or(""),
            .app_id = std::move(*app_id),
            .is_focused = dbus::bool_property(props, "has-focus").value_or(false),
        });
    }
    return WindowSnapshot::from_windows(std::move(windows));
}
