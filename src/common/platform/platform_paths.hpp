#pragma once

#include <string>

namespace platform {

// Per-user directories; empty when neither XDG nor HOME is set.
std::string config_dir();
std::string data_dir();

// Where the daemon listens and the client connects.
std::string ipc_endpoint();

} // namespace platform
