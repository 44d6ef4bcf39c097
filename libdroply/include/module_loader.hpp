/**
 * @file module_loader.hpp
 * @brief Resolves algorithm names to loaded codec instances.
 */

#ifndef DROPLY_MODULE_LOADER_HPP
#define DROPLY_MODULE_LOADER_HPP

#include "codec.hpp"
#include "plugin_registry.hpp"
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace droply {

/**
 * @brief Where a loaded codec came from.
 */
enum class CodecOrigin {
    Native,  ///< Precompiled shared module
    Fallback ///< Implementation compiled into libdroply
};

inline const char* codec_origin_to_string(const CodecOrigin origin) {
    return origin == CodecOrigin::Native ? "native" : "fallback";
}

/**
 * @brief A loaded codec behind a uniform interface.
 *
 * Callers never branch on the origin; it is exposed for diagnostics only.
 * Copies share the same codec instance (and keep its module loaded).
 */
class CodecHandle {
public:
    CodecHandle(CodecOrigin origin, std::shared_ptr<const ICodec> codec);

    [[nodiscard]] CodecOrigin origin() const noexcept { return origin_; }
    [[nodiscard]] PluginKind kind() const noexcept { return codec_->get_kind(); }
    [[nodiscard]] std::string_view name() const noexcept { return codec_->get_name(); }

    /// @throws LoadFailure if the handle does not hold a compression codec.
    [[nodiscard]] const ICompressionCodec& compression() const;

    /// @throws LoadFailure if the handle does not hold an archive codec.
    [[nodiscard]] const IArchiveCodec& archive() const;

private:
    CodecOrigin origin_;
    std::shared_ptr<const ICodec> codec_;
};

/**
 * @brief Loads and memoizes codec instances.
 *
 * @details get() first tries the native module for the registry's current
 * platform and falls back to the built-in implementation on any failure
 * (missing file, ABI mismatch, missing symbol, codec not provided). The
 * fallback is logged, never raised. Results are cached per
 * (kind, platform, name) for the loader's lifetime; concurrent first loads
 * of the same key run once and the other callers wait for that result,
 * while different keys load independently.
 */
class ModuleLoader {
public:
    /**
     * @param registry Registry used to validate names and pick the platform.
     * @param module_dir Directory holding native modules (empty: fallback only).
     */
    explicit ModuleLoader(const PluginRegistry& registry,
                          std::filesystem::path module_dir = default_module_dir());

    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;

    /// @return Value of DROPLY_MODULE_PATH, or an empty path.
    static std::filesystem::path default_module_dir();

    /**
     * @brief Resolve a validated algorithm name to a codec.
     * @throws ValidationError / UnsupportedPlatformError if the registry does not advertise it.
     * @throws LoadFailure if the fallback also fails.
     */
    CodecHandle get(std::string_view name, PluginKind kind);

    /// Shorthand for get(name, PluginKind::Compression).
    CodecHandle compression(std::string_view name) { return get(name, PluginKind::Compression); }

    /// Shorthand for get(name, PluginKind::Archive).
    CodecHandle archive(std::string_view name) { return get(name, PluginKind::Archive); }

    /**
     * @brief Forces re-instantiation on the next get().
     * @param name Algorithm to drop (every kind), or every cached codec if empty.
     * The native module itself is reopened as well.
     */
    void reload(std::optional<std::string_view> name = std::nullopt);

    /// Drops every cached codec.
    void clear_cache();

    [[nodiscard]] bool is_cached(std::string_view name, PluginKind kind) const;

    /// @return Path of the native module for the current platform.
    [[nodiscard]] std::filesystem::path module_path() const;

private:
    [[nodiscard]] std::string cache_key(std::string_view name, PluginKind kind) const;
    CodecHandle load(const std::string& name, PluginKind kind);
    std::shared_ptr<const ICodec> load_native(const std::string& name, PluginKind kind, std::string& reason);
    std::shared_ptr<void> open_module(std::string& reason);

    const PluginRegistry& registry_;
    std::filesystem::path module_dir_;

    mutable std::mutex mtx_; ///< protects cache_
    std::unordered_map<std::string, std::shared_future<CodecHandle>> cache_;

    std::mutex module_mtx_;        ///< protects module_
    std::shared_ptr<void> module_; ///< dlopen handle, released when the last native codec goes away
};

} // namespace droply

#endif // DROPLY_MODULE_LOADER_HPP
