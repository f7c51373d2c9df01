#include "tracker/window_registry.hpp"

#include <utility>

void WindowRegistry::replace(WindowSnapshot snapshot) {
    std::erase_if(snapshot.counts, [](const auto& kv) { return kv.second <= 0; });

    std::lock_guard lock(mutex_);
    windows_ = std::move(snapshot.windows);
    counts_ = std::move(snapshot.counts);
    ++generation_;
}

int WindowRegistry::get_window_count(const std::string& app_id) const {
    if (app_id.empty()) return 0;

    std::lock_guard lock(mutex_);
    if (auto it = counts_.find(app_id); it != counts_.end()) {
        return it->second;
    }

    auto query = lowercase(app_id);
    for (const auto& [key, count] : counts_) {
        if (fuzzy_match(key, query)) return count;
    }
    return 0;
}

std::vector<WindowRecord> WindowRegistry::get_windows_for_app(const std::string& app_id) const {
    std::vector<WindowRecord> result;
    if (app_id.empty()) return result;

    auto query = lowercase(app_id);
    std::lock_guard lock(mutex_);
    for (const auto& w : windows_) {
        if (fuzzy_match(lowercase(w.app_id), query)) {
            result.push_back(w);
        }
    }
    return result;
}

std::vector<WindowRecord> WindowRegistry::get_all_windows() const {
    std::lock_guard lock(mutex_);
    return windows_;
}

void WindowRegistry::set_window_count(const std::string& app_id, int count) {
    if (app_id.empty()) return;

    auto key = lowercase(app_id);
    std::lock_guard lock(mutex_);
    if (count <= 0) {
        counts_.erase(key);
    } else {
        counts_[key] = count;
    }
}

size_t WindowRegistry::count_entries() const {
    std::lock_guard lock(mutex_);
    return counts_.size();
}

AppWindowCounts WindowRegistry::counts() const {
    std::lock_guard lock(mutex_);
    return counts_;
}

uint64_t WindowRegistry::generation() const {
    std::lock_guard lock(mutex_);
    return generation_;
}

bool WindowRegistry::fuzzy_match(const std::string& stored_lower, const std::string& query_lower) {
    if (stored_lower.empty()) return false;
    return stored_lower == query_lower ||
           stored_lower.find(query_lower) != std::string::npos ||
           query_lower.find(stored_lower) != std::string::npos;
}
