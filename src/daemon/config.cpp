#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Keeps `field` unless `j` holds an integer that fits in uint32_t.
void read_u32(const json& j, const char* key, uint32_t& field) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (v.is_number_unsigned() && v.get<uint64_t>() <= UINT32_MAX) {
        field = static_cast<uint32_t>(v.get<uint64_t>());
        return;
    }
    std::println(stderr, "config: {} must be a non-negative integer, keeping {}", key, field);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("tracker")) {
            auto& t = j["tracker"];
            if (t.contains("backend")) cfg.tracker.backend = t["backend"].get<std::string>();
            read_u32(t, "poll_interval_ms", cfg.tracker.poll_interval_ms);
            read_u32(t, "poll_timeout_ms", cfg.tracker.poll_timeout_ms);
        }

        if (j.contains("kde")) {
            auto& k = j["kde"];
            if (k.contains("query_window_info")) cfg.kde.query_window_info = k["query_window_info"].get<bool>();
            read_u32(k, "script_wait_ms", cfg.kde.script_wait_ms);
        }

        if (j.contains("pinned")) {
            cfg.pinned = j["pinned"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    // A zero interval would spin the poll thread.
    cfg.tracker.poll_interval_ms = std::max<uint32_t>(cfg.tracker.poll_interval_ms, 100);
    cfg.tracker.poll_timeout_ms = std::max<uint32_t>(cfg.tracker.poll_timeout_ms, 10);

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
