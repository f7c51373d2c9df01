#include <catch2/catch_test_macros.hpp>

#include "tracker/window_registry.hpp"

namespace {

WindowSnapshot firefox_and_kitty() {
    return WindowSnapshot::from_windows({
        {"1", "Mozilla Firefox", "Firefox-esr", true},
        {"2", "Private Browsing", "Firefox-esr", false},
        {"3", "~/src", "kitty", false},
    });
}

} // namespace

TEST_CASE("WindowRegistry", "[registry]") {
    WindowRegistry registry;

    SECTION("InitiallyEmpty") {
        REQUIRE(registry.get_all_windows().empty());
        REQUIRE(registry.count_entries() == 0);
        REQUIRE(registry.get_window_count("firefox") == 0);
        REQUIRE(registry.generation() == 0);
    }

    SECTION("SetCountRoundTrip") {
        registry.set_window_count("x", 5);
        REQUIRE(registry.get_window_count("x") == 5);
    }

    SECTION("ZeroCountRemovesEntry") {
        registry.set_window_count("x", 5);
        REQUIRE(registry.count_entries() == 1);
        registry.set_window_count("x", 0);
        REQUIRE(registry.get_window_count("x") == 0);
        REQUIRE(registry.count_entries() == 0);
    }

    SECTION("CaseInsensitiveMatch") {
        registry.set_window_count("Firefox", 2);
        REQUIRE(registry.get_window_count("firefox") == 2);
        REQUIRE(registry.get_window_count("FIREFOX") == 2);
        REQUIRE(registry.get_window_count("Firefox") == 2);
    }

    SECTION("SubstringMatchEitherWay") {
        registry.replace(firefox_and_kitty());
        // Launcher command shorter than the window class.
        REQUIRE(registry.get_window_count("firefox") == 2);
        // Launcher command longer than the window class.
        REQUIRE(registry.get_window_count("/usr/bin/kitty") == 1);
        REQUIRE(registry.get_window_count("chromium") == 0);
    }

    SECTION("EmptyQueryMatchesNothing") {
        registry.replace(firefox_and_kitty());
        REQUIRE(registry.get_window_count("") == 0);
        REQUIRE(registry.get_windows_for_app("").empty());
    }

    SECTION("WindowsForAppKeepPollOrder") {
        registry.replace(firefox_and_kitty());
        auto windows = registry.get_windows_for_app("FIREFOX");
        REQUIRE(windows.size() == 2);
        REQUIRE(windows[0].id == "1");
        REQUIRE(windows[1].id == "2");
    }

    SECTION("ReplaceIsWholesale") {
        registry.replace(firefox_and_kitty());
        registry.set_window_count("manual", 3);

        registry.replace(WindowSnapshot::from_windows({{"9", "Files", "nautilus", false}}));
        REQUIRE(registry.get_all_windows().size() == 1);
        REQUIRE(registry.get_window_count("firefox") == 0);
        REQUIRE(registry.get_window_count("manual") == 0);
        REQUIRE(registry.get_window_count("nautilus") == 1);
        REQUIRE(registry.generation() == 2);
    }

    SECTION("CountsOnlySnapshot") {
        WindowSnapshot snap;
        snap.counts = {{"dolphin", 2}, {"ghost", 0}};
        registry.replace(std::move(snap));
        REQUIRE(registry.get_window_count("dolphin") == 2);
        REQUIRE(registry.count_entries() == 1);
        REQUIRE(registry.get_all_windows().empty());
    }
}
