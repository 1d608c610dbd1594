#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace platform {

namespace {

std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return home;
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return {};
}

} // namespace

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/scribe";
    auto home = home_dir();
    if (home.empty()) return {};
    return home + "/.config/scribe";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/scribe";
    auto home = home_dir();
    if (home.empty()) return {};
    return home + "/.local/share/scribe";
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path; // ~user is left alone

    auto home = home_dir();
    if (home.empty()) return path;
    return home + path.substr(1);
}

} // namespace platform
