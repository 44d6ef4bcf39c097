#include "../../include/platform.hpp"
#include "../../include/logger.hpp"
#include <cstdlib>

namespace droply {

Platform detect_platform() {
    static const Platform detected = [] {
        const char* env = std::getenv("DROPLY_PLATFORM");
        if (env && *env) {
            if (auto parsed = parse_platform(env)) {
                Logger::log(LogLevel::Debug, "Platform forced by DROPLY_PLATFORM: " + platform_to_string(*parsed),
                            "Platform");
                return *parsed;
            }
            Logger::log(LogLevel::Warning, std::string("Ignoring unknown DROPLY_PLATFORM value: ") + env,
                        "Platform");
        }
        return Platform::Server;
    }();
    return detected;
}

} // namespace droply
