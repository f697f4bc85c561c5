#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* appdata = std::getenv("APPDATA");
    if (!appdata) return {};
    return std::string(appdata) + "\\voicewin";
}

} // namespace platform
