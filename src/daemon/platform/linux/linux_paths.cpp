#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/meetcap";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/meetcap";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/meetcap";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/meetcap";
}

std::string daemon_log_file() {
    auto dir = data_dir();
    if (dir.empty()) return {};
    return dir + "/meetcapd.log";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/meetcap.sock";
    return "/tmp/meetcap.sock";
}

} // namespace platform
