#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* kAppDir = "/scribed";

// XDG base directories must be absolute; anything else falls back to the
// HOME-relative default.
std::string base_dir(const char* xdg_var, const char* home_default) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && xdg[0] == '/') return xdg;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + home_default;
}

std::string app_dir(const char* xdg_var, const char* home_default) {
    auto base = base_dir(xdg_var, home_default);
    if (base.empty()) return {};
    return base + kAppDir;
}

} // namespace

std::string config_dir() { return app_dir("XDG_CONFIG_HOME", "/.config"); }

std::string data_dir() { return app_dir("XDG_DATA_HOME", "/.local/share"); }

} // namespace platform
