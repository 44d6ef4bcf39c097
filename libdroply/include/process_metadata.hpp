#ifndef DROPLY_PROCESS_METADATA_HPP
#define DROPLY_PROCESS_METADATA_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace droply {

struct FileMetadata {
    std::string name;
    std::uint64_t original_size = 0;
    std::string checksum; ///< "size_<n>_name_<name>", not a content hash
};

struct Checksums {
    std::string original;   ///< "size_<total>_count_<n>"
    std::string compressed; ///< "size_<compressed>_algo_<algo>"
};

struct Compatibility {
    std::string min_version;                 ///< Oldest reader able to restore the payload
    std::vector<std::string> required_modules; ///< e.g. "compression-gzip", "archive-zip"
};

/**
 * @brief Derived description of one pipeline call.
 *
 * Computed once per call and returned to the caller; the pipeline never
 * persists it.
 */
struct ProcessMetadata {
    std::uint64_t original_size = 0;
    std::uint64_t compressed_size = 0;
    double compression_ratio = 0.0; ///< 1 - compressed/original
    std::string compression_algo;
    std::optional<std::string> archive_algo;
    std::optional<int> level;
    bool compress_inside = false;
    bool metadata_embedded = false;
    std::size_t file_count = 0;
    double processing_time_ms = 0.0;
    std::string timestamp; ///< ISO 8601, UTC
    std::vector<FileMetadata> per_file;
    Checksums checksums;
    Compatibility compatibility;
};

/**
 * @brief Serializes a ProcessMetadata record as JSON (camelCase keys).
 * @param indent Pretty-print indentation, -1 for a single line.
 */
std::string process_metadata_to_json(const ProcessMetadata& metadata, int indent = 2);

/// @return Current UTC time in ISO 8601 ("2025-01-31T12:00:00Z").
std::string iso8601_now();

} // namespace droply

#endif // DROPLY_PROCESS_METADATA_HPP
