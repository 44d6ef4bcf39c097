/**
 * @file pipeline.hpp
 * @brief Compression/archive pipeline: process() and its inverse restore().
 */

#ifndef DROPLY_PIPELINE_HPP
#define DROPLY_PIPELINE_HPP

#include "codec.hpp"
#include "embedded_metadata.hpp"
#include "module_loader.hpp"
#include "plugin_registry.hpp"
#include "process_metadata.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace droply {

struct CompressionOptions {
    std::string algo = "gzip";  ///< registry name, or "none" for a plain copy
    std::optional<int> level;   ///< algorithm default when unset
};

struct ArchiveOptions {
    std::string algo = "zip";     ///< "zip", "tar", or "none" to never archive
    bool compress_inside = false; ///< deflate entries individually (zip only), at CompressionOptions::level
};

/**
 * @brief Options of one process() call.
 *
 * With more than one file and no archive option the files are packed as zip.
 */
struct ProcessOptions {
    CompressionOptions compression;
    std::optional<ArchiveOptions> archive;
    bool embed_metadata = true;                   ///< embed names so restore() needs no side channel
    std::string metadata_name = std::string(meta_name); ///< entry name inside ".droply/"
    bool allow_reserved_names = false;            ///< accept input names under ".droply/"
};

struct ProcessResult {
    Bytes data;
    ProcessMetadata metadata;
};

/**
 * @brief Options of one restore() call.
 */
struct RestoreOptions {
    std::string compression = "gzip";   ///< algorithm the bytes were compressed with, or "none"
    std::optional<std::string> archive; ///< "zip", "tar", "none"; see restore_with_metadata() when unset
};

struct RestoreResult {
    std::vector<FileRecord> files;
    std::optional<EmbeddedMetadata> metadata; ///< embedded record, when present
};

struct ArchiveListing {
    std::string name;
    std::uint64_t size = 0;
};

/**
 * @brief The single entry point for compressing file sets and restoring them.
 *
 * @details A Pipeline holds no per-call state: concurrent calls on the same
 * instance are independent. Codecs are obtained from the ModuleLoader, which
 * serializes only their first load. All validation happens before any codec
 * is invoked.
 */
class Pipeline {
public:
    Pipeline(const PluginRegistry& registry, ModuleLoader& loader);

    /**
     * @brief Compresses one file, or packs several files and compresses the archive.
     * @throws ValidationError, UnsupportedPlatformError before any byte is processed.
     */
    Bytes process(const std::vector<FileRecord>& files, const ProcessOptions& options);

    /// process() plus timing and a ProcessMetadata record.
    ProcessResult process_with_metadata(const std::vector<FileRecord>& files, const ProcessOptions& options);

    /**
     * @brief Exact inverse of process().
     * @throws CorruptInputError for malformed or truncated input.
     * @throws AlgorithmMismatchError when the header contradicts the declared algorithm.
     */
    std::vector<FileRecord> restore(std::span<const std::uint8_t> data, const RestoreOptions& options);

    /**
     * @brief restore() plus the embedded metadata record, if any.
     *
     * A metadata trailer marks a single file and wins over a declared archive.
     * Without a declared archive, a zip or tar payload is unpacked only when it
     * carries an embedded metadata entry; anything else is one file.
     */
    RestoreResult restore_with_metadata(std::span<const std::uint8_t> data, const RestoreOptions& options);

    // --- single primitives ---

    Bytes compress(std::span<const std::uint8_t> data, std::string_view algo, std::optional<int> level = std::nullopt);

    Bytes decompress(std::span<const std::uint8_t> data, std::string_view algo);

    /// @param level Deflate level of compress_inside entries, 1-9; default 6.
    Bytes create_archive(const std::vector<FileRecord>& files, std::string_view format, bool compress_inside = false,
                         std::optional<int> level = std::nullopt);

    /// Unpacks an archive, dropping embedded metadata entries.
    std::vector<FileRecord> extract_archive(std::span<const std::uint8_t> data, std::string_view format);

    /// Names and sizes of the entries, without the metadata entry.
    std::vector<ArchiveListing> list_archive(std::span<const std::uint8_t> data, std::string_view format);

private:
    struct Plan {
        std::string compression;
        int level = 0;
        std::optional<std::string> archive; ///< effective archive, unset for single files
        bool compress_inside = false;
        int inside_level = 6;               ///< deflate level of compress_inside entries
    };

    Plan validate(const std::vector<FileRecord>& files, const ProcessOptions& options) const;
    int validate_compression(std::string_view algo, std::optional<int> level) const;
    Bytes run(const std::vector<FileRecord>& files, const ProcessOptions& options, const Plan& plan);
    Bytes compress_stream(std::span<const std::uint8_t> data, std::string_view algo, int level);
    Bytes decompress_stream(std::span<const std::uint8_t> data, std::string_view algo);
    void check_header(std::span<const std::uint8_t> data, std::string_view algo) const;
    RestoreResult unpack_with_metadata(std::span<const std::uint8_t> data, std::string_view format);
    std::optional<RestoreResult> unpack_if_tagged(std::span<const std::uint8_t> data, std::string_view format);

    const PluginRegistry& registry_;
    ModuleLoader& loader_;
};

} // namespace droply

#endif // DROPLY_PIPELINE_HPP
