#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/dockwatch, or ~/.config/dockwatch. Empty if neither is known.
std::string config_dir();

// $XDG_RUNTIME_DIR/dockwatch.sock, or /tmp/dockwatch.sock.
std::string ipc_endpoint();

} // namespace platform
