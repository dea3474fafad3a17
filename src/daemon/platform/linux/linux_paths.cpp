#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

namespace {

std::string xdg_dir(const char* xdg_var, const char* home_suffix) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/panetoast";
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + home_suffix + "/panetoast";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    const char* override_path = std::getenv("PANETOAST_SOCKET");
    if (override_path && *override_path) return override_path;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/panetoast.sock";
    return "/tmp/panetoast-" + std::to_string(::getuid()) + ".sock";
}

std::string data_file(const std::string& name) {
    auto dir = data_dir();
    if (dir.empty()) dir = "/tmp/panetoast-" + std::to_string(::getuid());
    return dir + "/" + name;
}

} // namespace platform
