#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

std::string xdg_dir(const char* var, const char* home_fallback) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/deskpilot";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + home_fallback + "/deskpilot";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string ipc_endpoint() {
    if (const char* explicit_path = std::getenv("DESKPILOT_SOCKET"); explicit_path && *explicit_path) {
        return explicit_path;
    }
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/deskpilot.sock";
    return "/tmp/deskpilot.sock";
}

} // namespace platform
