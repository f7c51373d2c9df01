#include <catch2/catch_test_macros.hpp>

#include "tracker/environment.hpp"

TEST_CASE("Backend detection", "[environment]") {

    SECTION("NoMarkersIsUnknown") {
        REQUIRE(detect_backend(SessionEnvironment{}) == BackendKind::Unknown);
    }

    SECTION("HyprlandSignature") {
        SessionEnvironment env;
        env.hyprland_signature = "abc_123";
        REQUIRE(detect_backend(env) == BackendKind::Hyprland);
    }

    SECTION("SwaySocket") {
        SessionEnvironment env;
        env.sway_socket = "/run/user/1000/sway-ipc.1000.1234.sock";
        REQUIRE(detect_backend(env) == BackendKind::Sway);
    }

    SECTION("HyprlandWinsOverSway") {
        SessionEnvironment env;
        env.hyprland_signature = "abc";
        env.sway_socket = "/run/sway.sock";
        REQUIRE(detect_backend(env) == BackendKind::Hyprland);
    }

    SECTION("CompositorMarkerWinsOverDesktopName") {
        SessionEnvironment env;
        env.sway_socket = "/run/sway.sock";
        env.current_desktop = "KDE";
        REQUIRE(detect_backend(env) == BackendKind::Sway);
    }

    SECTION("KdeAndPlasmaNames") {
        SessionEnvironment env;
        env.current_desktop = "KDE";
        REQUIRE(detect_backend(env) == BackendKind::KDE);

        env.current_desktop.clear();
        env.session_desktop = "plasmawayland";
        REQUIRE(detect_backend(env) == BackendKind::KDE);
    }

    SECTION("GnomeCaseInsensitive") {
        SessionEnvironment env;
        env.current_desktop = "ubuntu:GNOME";
        REQUIRE(detect_backend(env) == BackendKind::GNOME);
    }

    SECTION("KdeCheckedBeforeGnome") {
        SessionEnvironment env;
        env.current_desktop = "GNOME";
        env.session_desktop = "plasma";
        REQUIRE(detect_backend(env) == BackendKind::KDE);
    }

    SECTION("OtherDesktopIsUnknown") {
        SessionEnvironment env;
        env.current_desktop = "XFCE";
        REQUIRE(detect_backend(env) == BackendKind::Unknown);
    }
}

TEST_CASE("Backend names", "[environment]") {
    REQUIRE(to_string(BackendKind::Hyprland) == "hyprland");
    REQUIRE(to_string(BackendKind::Unknown) == "unknown");

    REQUIRE(backend_kind_from_string("Sway") == BackendKind::Sway);
    REQUIRE(backend_kind_from_string("none") == BackendKind::Unknown);
    REQUIRE_FALSE(backend_kind_from_string("auto").has_value());
    REQUIRE_FALSE(backend_kind_from_string("weston").has_value());
}
