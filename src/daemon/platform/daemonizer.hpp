#pragma once

namespace platform {

// Detach from the terminal: double fork, new session, stdio to /dev/null.
void daemonize();

} // namespace platform
