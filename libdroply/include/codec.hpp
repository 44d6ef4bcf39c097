/**
 * @file codec.hpp
 * @brief Uniform interfaces over the compression and archive primitives.
 */

#ifndef DROPLY_CODEC_HPP
#define DROPLY_CODEC_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @namespace droply
 * @brief The main namespace for the droply library.
 *
 * @details Holds the codec interfaces and their zlib, brotli and libarchive
 * backed implementations, the plugin registry, the module loader, the
 * compression/archive pipeline, the filename convention engine and the
 * conflict resolver.
 */
namespace droply {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief A named in-memory file.
 *
 * Owned by the caller for the duration of one pipeline call.
 */
struct FileRecord {
    std::string name; ///< File name (no directories are preserved)
    Bytes data;       ///< File content

    bool operator==(const FileRecord&) const = default;
};

/**
 * @brief Kind of primitive a plugin provides.
 */
enum class PluginKind {
    Compression, ///< Whole-stream compress/decompress
    Archive      ///< Pack/unpack of several named files
};

inline const char* plugin_kind_to_string(const PluginKind kind) {
    switch (kind) {
        case PluginKind::Compression: return "compression";
        case PluginKind::Archive:     return "archive";
    }
    return "";
}

/**
 * @brief Common base of all codec primitives.
 *
 * Implementations are stateless between calls and safe to share between
 * threads; the ModuleLoader hands out a single instance per algorithm.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    /// @return Algorithm or format name as used by the registry (e.g. "gzip").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return What kind of primitive this is.
    [[nodiscard]] virtual PluginKind get_kind() const noexcept = 0;
};

/**
 * @brief Raw compress/decompress of a single byte stream.
 */
class ICompressionCodec : public ICodec {
public:
    [[nodiscard]] PluginKind get_kind() const noexcept override { return PluginKind::Compression; }

    /**
     * @brief Compress a byte stream.
     * @param input Bytes to compress.
     * @param level Algorithm-scoped level, already validated by the registry.
     * @return The compressed stream.
     */
    [[nodiscard]] virtual Bytes compress(std::span<const std::uint8_t> input, int level) const = 0;

    /**
     * @brief Decompress a byte stream.
     * @throws CorruptInputError on malformed or truncated input.
     */
    [[nodiscard]] virtual Bytes decompress(std::span<const std::uint8_t> input) const = 0;
};

/**
 * @brief Pack/unpack of a flat list of named files.
 */
class IArchiveCodec : public ICodec {
public:
    [[nodiscard]] PluginKind get_kind() const noexcept override { return PluginKind::Archive; }

    /**
     * @brief Pack files into one archive stream, preserving order.
     * @param files Files to pack. Names are stored as given.
     * @param compress_inside Compress each entry (when the format supports it)
     * instead of storing it raw.
     * @param level Deflate level of compressed entries, 1-9.
     */
    [[nodiscard]] virtual Bytes pack(const std::vector<FileRecord>& files, bool compress_inside, int level) const = 0;

    /**
     * @brief Unpack every regular entry, in archive order.
     * @throws CorruptInputError on malformed or truncated input.
     */
    [[nodiscard]] virtual std::vector<FileRecord> unpack(std::span<const std::uint8_t> input) const = 0;
};

} // namespace droply

#endif // DROPLY_CODEC_HPP
