#include "backend/hyprland_backend.hpp"

#include "backend/unix_stream.hpp"
#include "backend/utf8.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

HyprlandBackend::HyprlandBackend(std::string signature, std::string runtime_dir,
                                 std::chrono::milliseconds timeout)
    : signature_(std::move(signature)), runtime_dir_(std::move(runtime_dir)),
      timeout_(timeout) {}

std::vector<std::string> HyprlandBackend::socket_paths(const std::string& signature,
                                                       const std::string& runtime_dir) {
    std::vector<std::string> paths;
    if (signature.empty()) return paths;
    if (!runtime_dir.empty()) {
        paths.push_back((fs::path(runtime_dir) / "hypr" / signature / ".socket.sock").string());
    }
    paths.push_back((fs::path("/tmp/hypr") / signature / ".socket.sock").string());
    return paths;
}

PollResult HyprlandBackend::poll() {
    auto paths = socket_paths(signature_, runtime_dir_);
    if (paths.empty()) {
        return std::unexpected(PollError{PollErrorKind::Connection,
                                         "$HYPRLAND_INSTANCE_SIGNATURE not set"});
    }

    // The socket accepts one request per connection and closes after replying.
    PollError last_error{PollErrorKind::Connection, "no Hyprland socket for " + signature_};
    for (const auto& path : paths) {
        std::error_code ec;
        if (paths.size() > 1 && !fs::exists(path, ec)) continue;

        UnixStream stream(timeout_);
        if (auto r = stream.connect(path); !r) {
            last_error = r.error();
            continue;
        }
        if (auto r = stream.write_all(CLIENTS_REQUEST); !r) return std::unexpected(r.error());

        auto body = stream.read_to_end(MAX_RESPONSE);
        if (!body) return std::unexpected(body.error());
        return parse_clients(*body);
    }
    return std::unexpected(last_error);
}

PollResult HyprlandBackend::parse_clients(std::string_view body) {
    if (body.empty()) {
        return std::unexpected(PollError{PollErrorKind::Protocol, "empty clients reply"});
    }

    std::vector<WindowRecord> windows;
    try {
        auto clients = json::parse(replace_invalid_utf8(body));
        if (!clients.is_array()) {
            return std::unexpected(PollError{PollErrorKind::Protocol,
                                             "clients reply is not a JSON array"});
        }

        for (const auto& c : clients) {
            if (!c.is_object() || !c.contains("address") || !c.contains("class")) {
                return std::unexpected(PollError{PollErrorKind::Protocol,
                                                 "client entry without address or class"});
            }
            auto app_id = c["class"].get<std::string>();
            if (app_id.empty()) continue;  // unmapped or still initialising

            windows.push_back(WindowRecord{
                .id = c["address"].get<std::string>(),
                .title = c.value("title", ""),
                .app_id = std::move(app_id),
                .is_focused = c.value("focusHistoryID", -1) == 0,
            });
        }
    } catch (const json::exception& e) {
        return std::unexpected(PollError{PollErrorKind::Protocol,
                                         std::string("JSON parse error: ") + e.what()});
    }

    return WindowSnapshot::from_windows(std::move(windows));
}
