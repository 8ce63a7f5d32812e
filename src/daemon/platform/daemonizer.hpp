#pragma once

namespace platform {

// Detach from the terminal. Only the grandchild returns.
void daemonize();

} // namespace platform
