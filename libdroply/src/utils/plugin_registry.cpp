#include "../../include/plugin_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace droply {

namespace {

const char* registry_tag() {
    return "PluginRegistry";
}

std::string normalize_extension(const std::string_view ext) {
    std::string s(ext);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (!s.empty() && s.front() != '.') {
        s.insert(s.begin(), '.');
    }
    return s;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

PluginDescriptor make_compression(const std::string& name, const std::string& ext, const LevelRange levels,
                                  const std::string& description, const Platform target) {
    PluginDescriptor d;
    d.name = name;
    d.package = "droply-compression-" + name;
    d.kind = PluginKind::Compression;
    d.version = "0.1.0";
    d.description = description;
    d.extensions = {ext};
    d.levels = levels;
    d.target = target;
    d.features = {"compress", "decompress"};
    return d;
}

PluginDescriptor make_archive(const std::string& name, const std::string& ext, const std::string& description,
                              const Platform target, std::vector<std::string> features) {
    PluginDescriptor d;
    d.name = name;
    d.package = "droply-archive-" + name;
    d.kind = PluginKind::Archive;
    d.version = "0.1.0";
    d.description = description;
    d.extensions = {ext};
    d.target = target;
    d.features = std::move(features);
    return d;
}

PluginDescriptor parse_plugin(const std::string& key, const nlohmann::json& j, const PluginKind kind,
                              const Platform target) {
    PluginDescriptor d;
    d.name = key;
    d.kind = kind;
    d.target = target;
    d.package = j.value("name", std::string("droply-") + plugin_kind_to_string(kind) + "-" + key);
    d.version = j.value("version", std::string("0.0.0"));
    d.description = j.value("description", std::string());
    for (const auto& ext : j.value("extensions", std::vector<std::string>{})) {
        d.extensions.push_back(normalize_extension(ext));
    }
    d.features = j.value("features", std::vector<std::string>{});
    if (kind == PluginKind::Compression) {
        LevelRange range;
        if (j.contains("compression_levels")) {
            const auto& lv = j.at("compression_levels");
            range.min = lv.value("min", 0);
            range.max = lv.value("max", 9);
            range.default_level = lv.value("default", range.max < 6 ? range.max : 6);
        }
        if (range.min > range.max || !range.contains(range.default_level)) {
            throw ValidationError("Invalid level range for plugin '" + key + "'");
        }
        d.levels = range;
    }
    return d;
}

} // namespace

PluginRegistry::PluginRegistry(const Platform platform)
    : PluginRegistry(platform, &PluginRegistry::builtin_catalog) {}

PluginRegistry::PluginRegistry(const Platform platform, CatalogSource source)
    : platform_(platform), source_(std::move(source)) {
    rebuild();
}

std::vector<PluginDescriptor> PluginRegistry::builtin_catalog() {
    std::vector<PluginDescriptor> catalog;
    for (const Platform p : {Platform::Server, Platform::Bundler, Platform::Browser}) {
        catalog.push_back(make_compression("gzip", ".gz", {0, 9, 6}, "gzip (deflate) compression", p));
        catalog.push_back(make_compression("brotli", ".br", {0, 11, 6}, "Brotli compression", p));
        catalog.push_back(make_compression("zip", ".zip", {0, 9, 6}, "Single-entry ZIP container", p));
        catalog.push_back(make_archive("zip", ".zip", "ZIP archive", p, {"pack", "unpack", "compress-inside"}));
        // the browser build ships zip framing only
        if (p != Platform::Browser) {
            catalog.push_back(make_archive("tar", ".tar", "GNU tar archive", p, {"pack", "unpack"}));
        }
    }
    return catalog;
}

std::vector<PluginDescriptor> PluginRegistry::load_catalog_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("Cannot open registry catalog: " + path.string());
    }

    std::vector<PluginDescriptor> catalog;
    try {
        const auto doc = nlohmann::json::parse(in);
        const int version = doc.at("version").get<int>();
        if (version > catalog_version) {
            throw ValidationError("Registry catalog version " + std::to_string(version) + " is newer than supported (" +
                                  std::to_string(catalog_version) + ")");
        }
        for (const auto& [platform_name, entry] : doc.at("platforms").items()) {
            const auto platform = parse_platform(platform_name);
            if (!platform) {
                Logger::log(LogLevel::Warning, "Skipping unknown platform in catalog: " + platform_name, registry_tag());
                continue;
            }
            if (entry.contains("compression")) {
                for (const auto& [key, plugin] : entry.at("compression").items()) {
                    catalog.push_back(parse_plugin(key, plugin, PluginKind::Compression, *platform));
                }
            }
            if (entry.contains("archives")) {
                for (const auto& [key, plugin] : entry.at("archives").items()) {
                    catalog.push_back(parse_plugin(key, plugin, PluginKind::Archive, *platform));
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("Malformed registry catalog " + path.string() + ": " + e.what());
    }
    return catalog;
}

void PluginRegistry::rebuild() {
    std::map<Platform, PlatformTable> tables;
    for (auto& d : source_()) {
        auto& table = tables[d.target];
        auto& target = d.kind == PluginKind::Compression ? table.compression : table.archives;
        const std::string key = d.name;
        target.insert_or_assign(key, std::move(d));
    }

    std::size_t count = 0;
    for (const auto& [_, table] : tables) {
        count += table.compression.size() + table.archives.size();
    }

    {
        std::unique_lock lock(mtx_);
        tables_ = std::move(tables);
    }
    Logger::log(LogLevel::Debug, "Registry loaded with " + std::to_string(count) + " plugins", registry_tag());
}

void PluginRegistry::reload() {
    std::lock_guard guard(reload_mtx_);
    rebuild();
    Logger::log(LogLevel::Info, "Registry reloaded", registry_tag());
}

const PluginRegistry::PlatformTable* PluginRegistry::table_for(const std::optional<Platform> platform) const {
    const auto it = tables_.find(platform.value_or(platform_));
    return it == tables_.end() ? nullptr : &it->second;
}

const PluginRegistry::PluginMap* PluginRegistry::map_for(const PluginKind kind,
                                                         const std::optional<Platform> platform) const {
    const auto* table = table_for(platform);
    if (!table) return nullptr;
    return kind == PluginKind::Compression ? &table->compression : &table->archives;
}

bool PluginRegistry::known_elsewhere(const std::string_view name, const PluginKind kind) const {
    for (const auto& [_, table] : tables_) {
        const auto& map = kind == PluginKind::Compression ? table.compression : table.archives;
        if (map.find(name) != map.end()) return true;
    }
    return false;
}

bool PluginRegistry::is_compression_supported(const std::string_view name, const std::optional<Platform> platform) const {
    std::shared_lock lock(mtx_);
    const auto* map = map_for(PluginKind::Compression, platform);
    return map && map->find(name) != map->end();
}

bool PluginRegistry::is_archive_supported(const std::string_view name, const std::optional<Platform> platform) const {
    std::shared_lock lock(mtx_);
    const auto* map = map_for(PluginKind::Archive, platform);
    return map && map->find(name) != map->end();
}

std::optional<std::string> PluginRegistry::algorithm_for_extension(const std::string_view ext,
                                                                   const std::optional<Platform> platform) const {
    const auto wanted = normalize_extension(ext);
    std::shared_lock lock(mtx_);
    if (const auto* map = map_for(PluginKind::Compression, platform)) {
        for (const auto& [name, d] : *map) {
            if (std::ranges::find(d.extensions, wanted) != d.extensions.end()) return name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> PluginRegistry::archive_for_extension(const std::string_view ext,
                                                                 const std::optional<Platform> platform) const {
    const auto wanted = normalize_extension(ext);
    std::shared_lock lock(mtx_);
    if (const auto* map = map_for(PluginKind::Archive, platform)) {
        for (const auto& [name, d] : *map) {
            if (std::ranges::find(d.extensions, wanted) != d.extensions.end()) return name;
        }
    }
    return std::nullopt;
}

std::optional<PluginDescriptor> PluginRegistry::describe(const std::string_view name, const PluginKind kind,
                                                         const std::optional<Platform> platform) const {
    std::shared_lock lock(mtx_);
    const auto* map = map_for(kind, platform);
    if (!map) return std::nullopt;
    const auto it = map->find(name);
    if (it == map->end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> PluginRegistry::compression_algorithms(const std::optional<Platform> platform) const {
    std::vector<std::string> names;
    std::shared_lock lock(mtx_);
    if (const auto* map = map_for(PluginKind::Compression, platform)) {
        for (const auto& [name, _] : *map) names.push_back(name);
    }
    return names;
}

std::vector<std::string> PluginRegistry::archive_formats(const std::optional<Platform> platform) const {
    std::vector<std::string> names;
    std::shared_lock lock(mtx_);
    if (const auto* map = map_for(PluginKind::Archive, platform)) {
        for (const auto& [name, _] : *map) names.push_back(name);
    }
    return names;
}

std::vector<Platform> PluginRegistry::supported_platforms() const {
    std::vector<Platform> platforms;
    std::shared_lock lock(mtx_);
    for (const auto& [platform, table] : tables_) {
        if (!table.compression.empty() || !table.archives.empty()) {
            platforms.push_back(platform);
        }
    }
    return platforms;
}

int PluginRegistry::validate_compression(const std::string_view name, const std::optional<int> level) const {
    const auto descriptor = describe(name, PluginKind::Compression);
    if (!descriptor) {
        const auto supported = "Supported algorithms: " + join(compression_algorithms());
        bool elsewhere = false;
        {
            std::shared_lock lock(mtx_);
            elsewhere = known_elsewhere(name, PluginKind::Compression);
        }
        if (elsewhere) {
            throw UnsupportedPlatformError("Compression algorithm '" + std::string(name) +
                                           "' is not available on platform " + platform_to_string(platform_),
                                           supported);
        }
        throw ValidationError("Unsupported compression algorithm: '" + std::string(name) + "'", supported);
    }

    const LevelRange range = descriptor->levels.value_or(LevelRange{});
    if (!level) {
        return range.default_level;
    }
    if (!range.contains(*level)) {
        throw ValidationError("Level " + std::to_string(*level) + " is out of range for " + std::string(name),
                              "Valid levels for " + std::string(name) + ": " + std::to_string(range.min) + "-" +
                              std::to_string(range.max));
    }
    return *level;
}

void PluginRegistry::validate_archive(const std::string_view name) const {
    if (is_archive_supported(name)) {
        return;
    }
    const auto supported = "Supported archive formats: " + join(archive_formats());
    bool elsewhere = false;
    {
        std::shared_lock lock(mtx_);
        elsewhere = known_elsewhere(name, PluginKind::Archive);
    }
    if (elsewhere) {
        throw UnsupportedPlatformError("Archive format '" + std::string(name) + "' is not available on platform " +
                                       platform_to_string(platform_), supported);
    }
    throw ValidationError("Unsupported archive format: '" + std::string(name) + "'", supported);
}

} // namespace droply
