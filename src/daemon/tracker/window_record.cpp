#include "tracker/window_record.hpp"

#include <algorithm>
#include <cctype>

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

WindowSnapshot WindowSnapshot::from_windows(std::vector<WindowRecord> windows) {
    WindowSnapshot snap;
    for (const auto& w : windows) {
        if (w.app_id.empty()) continue;
        snap.counts[lowercase(w.app_id)]++;
    }
    snap.windows = std::move(windows);
    return snap;
}
