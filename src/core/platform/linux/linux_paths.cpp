#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/stt-service";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/stt-service";
}

std::string temp_dir() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) return "/tmp";
    return dir.string();
}

} // namespace platform
