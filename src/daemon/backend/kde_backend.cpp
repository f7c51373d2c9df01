#include "backend/kde_backend.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr dbus::MethodTarget QUERY_WINDOW_INFO{
    "org.kde.KWin", "/KWin", "org.kde.KWin", "queryWindowInfo"};
constexpr dbus::MethodTarget LOAD_SCRIPT{
    "org.kde.KWin", "/Scripting", "org.kde.kwin.Scripting", "loadScript"};
constexpr dbus::MethodTarget UNLOAD_SCRIPT{
    "org.kde.KWin", "/Scripting", "org.kde.kwin.Scripting", "unloadScript"};

// Placeholders are substituted by report_script().
constexpr std::string_view SCRIPT_TEMPLATE = R"JS(
(function () {
    var list = workspace.windowList ? workspace.windowList() : workspace.clientList();
    var out = [];
    for (var i = 0; i < list.length; i++) {
        var w = list[i];
        if (!w.normalWindow || w.skipTaskbar) continue;
        var app = String(w.resourceClass || w.resourceName || "");
        if (app.length === 0) continue;
        out.push({
            id: String(w.internalId),
            title: String(w.caption || ""),
            app_id: app,
            focused: w.active === true
        });
    }
    callDBus("@SERVICE@", "@PATH@", "@INTERFACE@", "Report", JSON.stringify(out));
})();
)JS";

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

} // namespace

KdeBackend::KdeBackend(std::string runtime_dir, std::chrono::milliseconds timeout,
                       bool try_query_window_info, std::chrono::milliseconds script_wait)
    : runtime_dir_(std::move(runtime_dir)), timeout_(timeout),
      try_query_window_info_(try_query_window_info), script_wait_(script_wait) {}

PollResult KdeBackend::poll() {
    auto bus = dbus::open_session_bus();
    if (!bus) return std::unexpected(bus.error());

    if (try_query_window_info_) {
        bool fall_back = false;
        auto result = poll_query_window_info(bus->get(), fall_back);
        if (result || !fall_back) return result;
    }
    return poll_script(bus->get());
}

PollResult KdeBackend::poll_query_window_info(sd_bus* bus, bool& fall_back) {
    QueryReply bags = std::vector<dbus::PropertyBag>{};
    std::string sig;

    auto reply = dbus::call(bus, QUERY_WINDOW_INFO, timeout_);
    if (!reply) {
        bags = std::unexpected(reply.error());
    } else {
        sd_bus_message* m = reply->get();
        const char* raw_sig = sd_bus_message_get_signature(m, 1);
        sig = raw_sig ? raw_sig : "";

        if (sig == "aa{sv}") {
            int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "a{sv}");
            while (r >= 0) {
                r = sd_bus_message_at_end(m, 0);
                if (r != 0) break;
                dbus::PropertyBag bag;
                r = dbus::read_property_bag(m, bag);
                if (r >= 0) bags->push_back(std::move(bag));
            }
            if (r >= 0) r = sd_bus_message_exit_container(m);
            if (r < 0) {
                bags = std::unexpected(dbus::CallError{
                    {}, std::format("malformed queryWindowInfo reply: {}", std::strerror(-r)), r});
            }
        }
    }

    auto decision = classify_query_reply(bags, sig);
    if (decision.disable) {
        try_query_window_info_ = false;
        std::println(stderr, "[dockwatch] kde: queryWindowInfo unusable ({}), "
                             "using the KWin script from now on",
                     describe(decision.result.error()));
    }
    fall_back = decision.action == QueryDecision::Action::FallBack;
    return std::move(decision.result);
}

KdeBackend::QueryDecision KdeBackend::classify_query_reply(const QueryReply& reply,
                                                           std::string_view signature) {
    using Action = QueryDecision::Action;

    if (!reply) {
        const auto& err = reply.error();
        if (err.name == SD_BUS_ERROR_SERVICE_UNKNOWN ||
            err.name == SD_BUS_ERROR_NAME_HAS_NO_OWNER) {
            // KWin itself is absent; the script path would fail the same way.
            return {Action::Fail, false, std::unexpected(err.to_poll_error())};
        }
        // Unknown method, a timeout (KWin waiting for a click), or garbage.
        return {Action::FallBack, true, std::unexpected(err.to_poll_error())};
    }

    if (signature != "aa{sv}") {
        return {Action::FallBack, true,
                std::unexpected(PollError{
                    PollErrorKind::Protocol,
                    std::format("queryWindowInfo returned '{}', not a window list", signature)})};
    }

    auto snapshot = records_from_bags(*reply);
    if (snapshot.windows.empty() && !reply->empty()) {
        return {Action::FallBack, false,
                std::unexpected(PollError{PollErrorKind::Protocol,
                                          "queryWindowInfo reported no usable window"})};
    }
    return {Action::Use, false, std::move(snapshot)};
}

PollResult KdeBackend::poll_script(sd_bus* bus) {
    const char* unique_name = nullptr;
    int r = sd_bus_get_unique_name(bus, &unique_name);
    if (r < 0) {
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("no unique bus name: {}", std::strerror(-r))});
    }

    static const sd_bus_vtable report_vtable[] = {
        SD_BUS_VTABLE_START(0),
        SD_BUS_METHOD("Report", "s", "", &KdeBackend::on_report, SD_BUS_VTABLE_UNPRIVILEGED),
        SD_BUS_VTABLE_END,
    };

    Report report;
    sd_bus_slot* raw_slot = nullptr;
    r = sd_bus_add_object_vtable(bus, &raw_slot, REPORT_PATH, REPORT_INTERFACE,
                                 report_vtable, &report);
    if (r < 0) {
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         std::format("cannot export report object: {}",
                                                     std::strerror(-r))});
    }
    dbus::SlotPtr slot(raw_slot);

    auto path = script_path();
    {
        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
        std::ofstream f(path, std::ios::trunc);
        if (!f.is_open()) {
            return std::unexpected(PollError{PollErrorKind::Connection,
                                             "cannot write KWin script to " + path});
        }
        f << report_script(unique_name);
    }

    // A previous poll may have been interrupted before unloading.
    if (auto cleaned = unload_script(bus); !cleaned) {
        std::error_code ec;
        fs::remove(path, ec);
        return std::unexpected(cleaned.error());
    }

    auto loaded = dbus::call(bus, LOAD_SCRIPT, timeout_, "ss", path.c_str(), PLUGIN_NAME);
    if (!loaded) {
        std::error_code ec;
        fs::remove(path, ec);
        return std::unexpected(loaded.error().to_poll_error());
    }

    int32_t script_id = -1;
    r = sd_bus_message_read_basic(loaded->get(), SD_BUS_TYPE_INT32, &script_id);
    PollResult result = std::unexpected(PollError{PollErrorKind::Protocol, "script not loaded"});

    if (r < 0 || script_id < 0) {
        result = std::unexpected(PollError{PollErrorKind::Protocol,
                                           std::format("loadScript returned {}", script_id)});
    } else if (auto ran = run_script(bus, script_id); !ran) {
        result = std::unexpected(ran.error());
    } else {
        auto deadline = std::chrono::steady_clock::now() + script_wait_;
        while (!report.received) {
            r = sd_bus_process(bus, nullptr);
            if (r < 0) break;
            if (r > 0) continue;

            auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) break;

            r = sd_bus_wait(bus, static_cast<uint64_t>(remaining.count()));
            if (r < 0 && r != -EINTR) break;
        }

        if (report.received) {
            result = parse_report(report.payload);
        } else if (r < 0) {
            result = std::unexpected(PollError{PollErrorKind::Connection,
                                               std::format("bus error while waiting: {}",
                                                           std::strerror(-r))});
        } else {
            result = std::unexpected(PollError{PollErrorKind::Protocol,
                                               "KWin script did not report in time"});
        }
    }

    if (auto unloaded = unload_script(bus); !unloaded) {
        // The report is still valid; the next poll unloads before loading.
        std::println(stderr, "[dockwatch] kde: {}", describe(unloaded.error()));
    }
    std::error_code ec;
    fs::remove(path, ec);
    return result;
}

std::expected<void, PollError> KdeBackend::run_script(sd_bus* bus, int script_id) {
    // KWin 6 exports scripts under /Scripting/Script<id>, KWin 5 under /<id>.
    auto kwin6_path = std::format("/Scripting/Script{}", script_id);
    auto kwin5_path = std::format("/{}", script_id);

    dbus::CallError last;
    for (const auto& path : {kwin6_path, kwin5_path}) {
        dbus::MethodTarget run{"org.kde.KWin", path.c_str(), "org.kde.kwin.Script", "run"};
        auto reply = dbus::call(bus, run, timeout_);
        if (reply) return {};
        last = reply.error();
        if (!last.unknown_object() && !last.unknown_method()) break;
    }
    return std::unexpected(last.to_poll_error());
}

std::expected<void, PollError> KdeBackend::unload_script(sd_bus* bus) {
    // The boolean reply is false when the plugin was not loaded; both are fine.
    auto reply = dbus::call(bus, UNLOAD_SCRIPT, timeout_, "s", PLUGIN_NAME);
    if (!reply) return std::unexpected(reply.error().to_poll_error());
    return {};
}

std::string KdeBackend::script_path() const {
    fs::path base = runtime_dir_.empty() ? fs::temp_directory_path() : fs::path(runtime_dir_);
    return (base / "dockwatch" / std::format("kwin-window-report-{}.js", ::getpid())).string();
}

int KdeBackend::on_report(sd_bus_message* m, void* userdata, sd_bus_error* /*ret_error*/) {
    auto* report = static_cast<Report*>(userdata);

    const char* payload = nullptr;
    int r = sd_bus_message_read_basic(m, SD_BUS_TYPE_STRING, &payload);
    if (r < 0) return r;

    report->payload = payload ? payload : "";
    report->received = true;
    return sd_bus_reply_method_return(m, "");
}

std::string KdeBackend::report_script(std::string_view bus_name) {
    std::string script(SCRIPT_TEMPLATE);
    replace_all(script, "@SERVICE@", bus_name);
    replace_all(script, "@PATH@", REPORT_PATH);
    replace_all(script, "@INTERFACE@", REPORT_INTERFACE);
    return script;
}

PollResult KdeBackend::parse_report(std::string_view payload) {
    std::vector<WindowRecord> windows;
    try {
        auto list = json::parse(payload);
        if (!list.is_array()) {
            return std::unexpected(PollError{PollErrorKind::Protocol,
                                             "KWin report is not a JSON array"});
        }
        for (const auto& w : list) {
            if (!w.is_object()) continue;
            auto app_id = w.value("app_id", "");
            if (app_id.empty()) continue;
            windows.push_back(WindowRecord{
                .id = w.value("id", ""),
                .title = w.value("title", ""),
                .app_id = std::move(app_id),
                .is_focused = w.value("focused", false),
            });
        }
    } catch (const json::exception& e) {
        return std::unexpected(PollError{PollErrorKind::Protocol,
                                         std::string("JSON parse error: ") + e.what()});
    }
    return WindowSnapshot::from_windows(std::move(windows));
}

WindowSnapshot KdeBackend::records_from_bags(const std::vector<dbus::PropertyBag>& bags) {
    std::vector<WindowRecord> windows;
    for (const auto& bag : bags) {
        auto app_id = dbus::string_property(bag, "resourceClass");
        if (!app_id || app_id->empty()) app_id = dbus::string_property(bag, "resourceName");
        if (!app_id || app_id->empty()) continue;

        windows.push_back(WindowRecord{
            .id = dbus::string_property(bag, "uuid").value_or(""),
            .title = dbus::string_property(bag, "caption").value_or(""),
            .app_id = std::move(*app_id),
            .is_focused = dbus::bool_property(bag, "active").value_or(false),
        });
    }
    return WindowSnapshot::from_windows(std::move(windows));
}
