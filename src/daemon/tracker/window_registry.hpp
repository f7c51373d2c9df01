#pragma once

#include "tracker/window_record.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Last successfully polled window state. The record set and the count map
// are always replaced together under one lock, so readers never see counts
// derived from a different poll than the records.
class WindowRegistry {
public:
    WindowRegistry() = default;

    WindowRegistry(const WindowRegistry&) = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;

    // Swap in a complete poll result.
    void replace(WindowSnapshot snapshot);

    // Exact match first, then case-insensitive containment either way
    // ("firefox" matches "Firefox-esr"). Returns 0 if nothing matches.
    int get_window_count(const std::string& app_id) const;

    // Records matching `app_id` by the same rule, in poll order.
    std::vector<WindowRecord> get_windows_for_app(const std::string& app_id) const;

    std::vector<WindowRecord> get_all_windows() const;

    // External override. `count <= 0` erases the entry.
    void set_window_count(const std::string& app_id, int count);

    size_t count_entries() const;
    AppWindowCounts counts() const;

    // Number of successful replace() calls so far.
    uint64_t generation() const;

private:
    static bool fuzzy_match(const std::string& stored_lower, const std::string& query_lower);

    mutable std::mutex mutex_;
    std::vector<WindowRecord> windows_;
    AppWindowCounts counts_;
    uint64_t generation_ = 0;
};
