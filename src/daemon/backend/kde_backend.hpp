#pragma once

#include "backend/backend.hpp"
#include "backend/dbus_util.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

// KWin has no stable window-list call. When enabled, the backend first tries
// org.kde.KWin.queryWindowInfo and accepts it only if it answers with a list
// of windows (aa{sv}). Otherwise it loads a short KWin script that reports
// the window list back to us through callDBus() on an object registered on
// our own bus connection.
class KdeBackend : public WindowBackend {
public:
    KdeBackend(std::string runtime_dir, std::chrono::milliseconds timeout,
               bool try_query_window_info, std::chrono::milliseconds script_wait);

    BackendKind kind() const override { return BackendKind::KDE; }
    PollResult poll() override;

    static constexpr const char* PLUGIN_NAME = "dockwatch_window_report";
    static constexpr const char* REPORT_PATH = "/org/dockwatch/KWinReport";
    static constexpr const char* REPORT_INTERFACE = "org.dockwatch.KWinReport";

    // Script source that reports to `bus_name` at REPORT_PATH.
    static std::string report_script(std::string_view bus_name);

    // Parse the JSON array the script sends: [{id, title, app_id, focused}].
    static PollResult parse_report(std::string_view json);

    // queryWindowInfo property bags -> records (resourceClass, caption, uuid, active).
    static WindowSnapshot records_from_bags(const std::vector<dbus::PropertyBag>& bags);

    bool query_window_info_enabled() const { return try_query_window_info_; }

    using QueryReply = std::expected<std::vector<dbus::PropertyBag>, dbus::CallError>;

    struct QueryDecision {
        enum class Action {
            Use,       // `result` holds the full window set
            FallBack,  // enumerate through the script instead
            Fail,      // KWin is not on the bus; `result` holds the error
        };
        Action action = Action::FallBack;
        bool disable = false;  // stop calling queryWindowInfo this session
        PollResult result;
    };

    // Decide what to do with a queryWindowInfo outcome. `signature` is the
    // reply's body signature; `reply` holds the bags only for "aa{sv}".
    // A single a{sv} bag describes one picked window, never the window set.
    static QueryDecision classify_query_reply(const QueryReply& reply, std::string_view signature);

private:
    struct Report {
        bool received = false;
        std::string payload;
    };

    PollResult poll_query_window_info(sd_bus* bus, bool& fall_back);
    PollResult poll_script(sd_bus* bus);
    std::expected<void, PollError> run_script(sd_bus* bus, int script_id);
    std::expected<void, PollError> unload_script(sd_bus* bus);
    std::string script_path() const;

    static int on_report(sd_bus_message* m, void* userdata, sd_bus_error* ret_error);

    std::string runtime_dir_;
    std::chrono::milliseconds timeout_;
    bool try_query_window_info_;
    std::chrono::milliseconds script_wait_;
};
