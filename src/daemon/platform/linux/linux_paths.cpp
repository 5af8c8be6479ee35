#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace platform {

namespace {

// $<xdg_var>/schaltwerk, else $HOME/<home_fallback>/schaltwerk.
std::string xdg_app_dir(const char* xdg_var, const char* home_fallback) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/schaltwerk";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/" + home_fallback + "/schaltwerk";
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string terminals_dir() {
    auto data = data_dir();
    return (data.empty() ? std::string("/tmp/schaltwerk") : data) + "/terminals";
}

std::string ipc_endpoint() {
    const char* explicit_path = std::getenv("SCHALTWERK_SOCKET");
    if (explicit_path && *explicit_path) return explicit_path;
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime) return std::string(runtime) + "/schaltwerk.sock";
    return "/tmp/schaltwerk-" + std::to_string(::getuid()) + ".sock";
}

} // namespace platform
