#pragma once

#include <string>

namespace platform {

// Detach from the terminal. Returns only in the daemon process, which has umask
// 077 and stderr appended to log_path (or /dev/null if log_path is empty or
// cannot be opened). A fork failure exits the calling process with status 1.
void daemonize(const std::string& log_path);

} // namespace platform
