#pragma once

#include <string>

namespace platform {

// Per-user config directory, empty if $HOME is unset.
std::string config_dir();

// Per-user data directory (task journal), empty if $HOME is unset.
std::string data_dir();

// Control socket path.
std::string ipc_endpoint();

} // namespace platform
