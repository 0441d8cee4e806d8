#pragma once

#include <string>

namespace platform {

// Empty when neither the XDG variable nor HOME is set.
std::string config_dir();
std::string data_dir();

// Where the detached daemon appends stderr. Empty when data_dir() is.
std::string daemon_log_file();

// Unix socket path the daemon listens on and the client connects to.
std::string ipc_endpoint();

} // namespace platform
