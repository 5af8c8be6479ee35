#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/schaltwerk, empty when no home directory is known.
std::string config_dir();
// $XDG_DATA_HOME/schaltwerk, empty when no home directory is known.
std::string data_dir();
// Where terminal output logs are written.
std::string terminals_dir();
// Unix socket path shared by the daemon and the client. SCHALTWERK_SOCKET
// overrides the default.
std::string ipc_endpoint();

} // namespace platform
