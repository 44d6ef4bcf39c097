/**
 * @file platform.hpp
 * @brief Execution targets a codec build can be published for.
 */

#ifndef DROPLY_PLATFORM_HPP
#define DROPLY_PLATFORM_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace droply {

/**
 * @brief Execution target.
 *
 * The same algorithm name may resolve to a different native module per
 * target, so the registry and the loader key everything by platform.
 */
enum class Platform {
    Server,  ///< Long-running host process (default for native builds)
    Browser, ///< Sandboxed client build, reduced archive support
    Bundler  ///< Build-time tooling
};

inline std::string platform_to_string(const Platform p) {
    switch (p) {
        case Platform::Server:  return "server";
        case Platform::Browser: return "browser";
        case Platform::Bundler: return "bundler";
    }
    return "server";
}

/**
 * @brief Parses a platform name (case-insensitive).
 *
 * Also accepts the aliases "node"/"nodejs" (server) and "web" (browser).
 */
inline std::optional<Platform> parse_platform(std::string_view str) {
    std::string s(str);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (s == "server" || s == "node" || s == "nodejs") return Platform::Server;
    if (s == "browser" || s == "web")                  return Platform::Browser;
    if (s == "bundler")                                return Platform::Bundler;
    return std::nullopt;
}

/**
 * @brief Detects the current platform once and caches it.
 *
 * Native builds default to Platform::Server. The DROPLY_PLATFORM environment
 * variable overrides the detection; an unrecognized value is logged and ignored.
 */
Platform detect_platform();

} // namespace droply

#endif // DROPLY_PLATFORM_HPP
