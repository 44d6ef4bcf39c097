#ifndef DROPLY_PLUGIN_DESCRIPTOR_HPP
#define DROPLY_PLUGIN_DESCRIPTOR_HPP

#include "codec.hpp"
#include "platform.hpp"
#include <optional>
#include <string>
#include <vector>

namespace droply {

/**
 * @brief Inclusive level range of a compression algorithm.
 */
struct LevelRange {
    int min = 0;
    int max = 9;
    int default_level = 6;

    [[nodiscard]] bool contains(const int level) const noexcept { return level >= min && level <= max; }
};

/**
 * @brief Read-only description of one published codec build.
 *
 * Created when a codec build is published and loaded into the PluginRegistry
 * at startup; never mutated afterwards.
 */
struct PluginDescriptor {
    std::string name;                    ///< Algorithm or format key (e.g. "gzip")
    std::string package;                 ///< Published package name (e.g. "droply-compression-gzip")
    PluginKind kind = PluginKind::Compression;
    std::string version;                 ///< Plugin version (e.g. "0.1.0")
    std::string description;
    std::vector<std::string> extensions; ///< Extensions with their leading dot (e.g. ".gz")
    std::optional<LevelRange> levels;    ///< Only for compression plugins
    Platform target = Platform::Server;
    std::vector<std::string> features;
};

} // namespace droply

#endif // DROPLY_PLUGIN_DESCRIPTOR_HPP
