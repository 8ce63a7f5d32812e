#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string xdg_dir(const char* var, const char* home_suffix) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/scribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + home_suffix + "/scribe";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/scribe.sock";
    return "/tmp/scribe.sock";
}

} // namespace platform
