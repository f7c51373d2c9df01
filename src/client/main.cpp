#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [args]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                   Show backend and poll statistics");
    std::println(stderr, "  count APP                Number of open windows for APP");
    std::println(stderr, "  windows [APP]            List windows, optionally only APP's");
    std::println(stderr, "  set-count APP N          Override APP's window count (0 clears)");
    std::println(stderr, "  pinned                   Window counts for pinned apps");
}

static bool parse_int(const std::string& s, int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    // Build command JSON
    json cmd;
    if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else if (command == "count" && argc >= 3) {
        cmd = {{"cmd", "count"}, {"app_id", argv[2]}};
    } else if (command == "windows") {
        cmd = {{"cmd", "windows"}};
        if (argc >= 3) cmd["app_id"] = argv[2];
    } else if (command == "set-count" && argc >= 4) {
        int count = 0;
        if (!parse_int(argv[3], count)) {
            std::println(stderr, "Invalid count: {}", argv[3]);
            return 1;
        }
        cmd = {{"cmd", "set_count"}, {"app_id", argv[2]}, {"count", count}};
    } else if (command == "pinned") {
        cmd = {{"cmd", "pinned"}};
    } else {
        std::println(stderr, "Unknown or incomplete command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is dockwatchd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("Backend: {}", response.value("backend", "unknown"));
        std::println("Running: {}", response.value("running", false) ? "yes" : "no");
        std::println("Windows: {}", response.value("windows", 0));
        std::println("Polls: {} ok, {} failed, {} skipped",
                     response.value("polls_ok", 0), response.value("polls_failed", 0),
                     response.value("ticks_skipped", 0));
        auto last_error = response.value("last_error", "");
        if (!last_error.empty()) std::println("Last error: {}", last_error);
    } else if (command == "count") {
        std::println("{}", response.value("count", 0));
    } else if (command == "windows") {
        for (const auto& w : response.value("windows", json::array())) {
            std::println("{}{} [{}] {}", w.value("focused", false) ? "*" : " ",
                         w.value("app_id", ""), w.value("id", ""), w.value("title", ""));
        }
    } else if (command == "pinned") {
        for (const auto& app : response.value("apps", json::array())) {
            std::println("{:<24} {}", app.value("app_id", ""), app.value("count", 0));
        }
    } else if (status == "ok") {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
