#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/dockwatch";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/dockwatch";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/dockwatch.sock";
    return "/tmp/dockwatch.sock";
}

} // namespace platform
