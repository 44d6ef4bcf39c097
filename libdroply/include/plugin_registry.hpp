/**
 * @file plugin_registry.hpp
 * @brief Capability catalog of compression and archive plugins per platform.
 */

#ifndef DROPLY_PLUGIN_REGISTRY_HPP
#define DROPLY_PLUGIN_REGISTRY_HPP

#include "plugin_descriptor.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace droply {

/**
 * @brief Source the registry (re)builds its catalog from.
 */
using CatalogSource = std::function<std::vector<PluginDescriptor>()>;

/**
 * @brief Registry of every plugin available per platform.
 *
 * @details Answers "is algorithm X / format Y supported on this platform?"
 * and "which algorithm maps to extension .ext?". The registry is constructed
 * explicitly by the host and injected where needed; it is read-only after
 * construction except for reload(), which rebuilds it from its catalog
 * source. Queries take a shared lock and may run concurrently; reload() is
 * exclusive.
 */
class PluginRegistry {
public:
    /// Catalog schema version understood by this build.
    static constexpr int catalog_version = 1;

    /**
     * @brief Build the registry from the built-in catalog.
     * @param platform Current platform (defaults to detect_platform()).
     */
    explicit PluginRegistry(Platform platform = detect_platform());

    /**
     * @brief Build the registry from a custom catalog source.
     * @param platform Current platform.
     * @param source Called now and on every reload().
     */
    PluginRegistry(Platform platform, CatalogSource source);

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /// @return Descriptors of the built-in codecs for every platform.
    static std::vector<PluginDescriptor> builtin_catalog();

    /**
     * @brief Reads a JSON catalog file.
     *
     * Shape: `{"version":1,"platforms":{"server":{"compression":{"gzip":{...}},"archives":{...}}}}`.
     * Each plugin object carries "name", "version", "description", "extensions",
     * optional "compression_levels" {"min","max","default"} and "features".
     *
     * @throws ValidationError if the file cannot be read or does not match the schema.
     */
    static std::vector<PluginDescriptor> load_catalog_file(const std::filesystem::path& path);

    // --- queries ---

    [[nodiscard]] bool is_compression_supported(std::string_view name,
                                                std::optional<Platform> platform = std::nullopt) const;

    [[nodiscard]] bool is_archive_supported(std::string_view name,
                                            std::optional<Platform> platform = std::nullopt) const;

    /**
     * @brief Compression algorithm declared for an extension.
     * @param ext Extension, with or without the leading dot. Case-insensitive.
     */
    [[nodiscard]] std::optional<std::string> algorithm_for_extension(std::string_view ext,
                                                                     std::optional<Platform> platform = std::nullopt) const;

    /// Archive-format equivalent of algorithm_for_extension().
    [[nodiscard]] std::optional<std::string> archive_for_extension(std::string_view ext,
                                                                   std::optional<Platform> platform = std::nullopt) const;

    [[nodiscard]] std::optional<PluginDescriptor> describe(std::string_view name, PluginKind kind,
                                                           std::optional<Platform> platform = std::nullopt) const;

    [[nodiscard]] std::vector<std::string> compression_algorithms(std::optional<Platform> platform = std::nullopt) const;

    [[nodiscard]] std::vector<std::string> archive_formats(std::optional<Platform> platform = std::nullopt) const;

    /// @return Platforms for which at least one plugin is registered.
    [[nodiscard]] std::vector<Platform> supported_platforms() const;

    [[nodiscard]] Platform current_platform() const noexcept { return platform_; }

    [[nodiscard]] int version() const noexcept { return catalog_version; }

    // --- validation ---

    /**
     * @brief Validates a compression choice for the current platform.
     * @param name Algorithm name.
     * @param level Requested level, if any.
     * @return The effective level (the requested one or the algorithm default).
     * @throws ValidationError for unknown algorithms or out-of-range levels.
     * @throws UnsupportedPlatformError when the algorithm exists on another platform only.
     */
    int validate_compression(std::string_view name, std::optional<int> level) const;

    /**
     * @brief Validates an archive format for the current platform.
     * @throws ValidationError / UnsupportedPlatformError as validate_compression().
     */
    void validate_archive(std::string_view name) const;

    // --- lifecycle ---

    /// Clears and rebuilds the catalog from its source.
    void reload();

private:
    using PluginMap = std::map<std::string, PluginDescriptor, std::less<>>;

    struct PlatformTable {
        PluginMap compression; ///< compression plugins by name
        PluginMap archives;    ///< archive plugins by name
    };

    void rebuild();
    [[nodiscard]] const PlatformTable* table_for(std::optional<Platform> platform) const;
    [[nodiscard]] const PluginMap* map_for(PluginKind kind, std::optional<Platform> platform) const;
    [[nodiscard]] bool known_elsewhere(std::string_view name, PluginKind kind) const;

    Platform platform_;
    CatalogSource source_;
    std::map<Platform, PlatformTable> tables_;
    mutable std::shared_mutex mtx_; ///< shared for queries, exclusive for reload
    std::mutex reload_mtx_;         ///< serializes reload() calls
};

} // namespace droply

#endif // DROPLY_PLUGIN_REGISTRY_HPP
