/**
 * @file embedded_metadata.hpp
 * @brief Metadata stored inside the compressed payload itself.
 *
 * Archives carry it as an extra entry under the reserved ".droply/"
 * directory, listed first. Single files carry it as a trailing block
 * appended to the file bytes before compression:
 *
 *   [payload][JSON][u32 big-endian JSON length]["__DROPLY_META__"]
 *
 * Tools unaware of the block see one extra archive entry, or a few extra
 * bytes at the end of the decompressed file.
 */

#ifndef DROPLY_EMBEDDED_METADATA_HPP
#define DROPLY_EMBEDDED_METADATA_HPP

#include "codec.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace droply {

inline constexpr std::string_view meta_dir = ".droply";
inline constexpr std::string_view meta_name = "__droply_meta.json";
inline constexpr std::string_view legacy_meta_entry = ".__droply_meta.json";
inline constexpr std::string_view meta_trailer_marker = "__DROPLY_META__";
inline constexpr std::string_view meta_schema_version = "1.0.0";

struct EmbeddedFile {
    std::string name;
    std::uint64_t original_size = 0;

    bool operator==(const EmbeddedFile&) const = default;
};

/**
 * @brief Record embedded at compression time.
 */
struct EmbeddedMetadata {
    std::string schema_version = std::string(meta_schema_version);
    std::string operation = "compress";
    std::string algo;                   ///< compression algorithm
    std::optional<std::string> archive; ///< archive format, if any
    std::string created_at;             ///< ISO 8601
    std::vector<EmbeddedFile> files;    ///< in original order
    std::uint64_t total_original = 0;
};

/// @return Pretty-printed JSON document.
std::string embedded_metadata_to_json(const EmbeddedMetadata& metadata);

/**
 * @brief Parses an embedded metadata document.
 * @return std::nullopt (logged) when the document is not valid metadata.
 */
std::optional<EmbeddedMetadata> parse_embedded_metadata(std::string_view json);

/// @return "<meta_dir>/<name>".
std::string metadata_entry_path(std::string_view name = meta_name);

/// @return True for entries under ".droply/" and for the legacy entry name.
bool is_metadata_entry(std::string_view entry_name);

/// @return True when a user-supplied name lies in the reserved metadata directory.
bool is_reserved_name(std::string_view name);

/**
 * @brief Refuses input names that could spoof embedded metadata.
 * @throws ValidationError listing up to three offenders, unless allow is set.
 */
void ensure_no_reserved_names(const std::vector<FileRecord>& files, bool allow);

/// @return payload followed by the metadata trailer.
Bytes append_metadata_trailer(std::span<const std::uint8_t> payload, const EmbeddedMetadata& metadata);

struct TrailerSplit {
    std::span<const std::uint8_t> payload;   ///< bytes before the trailer (all bytes if none)
    std::optional<EmbeddedMetadata> metadata; ///< decoded trailer, if present and valid
};

/**
 * @brief Detects and decodes a metadata trailer.
 *
 * A candidate trailer that fails to decode is treated as payload.
 */
TrailerSplit split_metadata_trailer(std::span<const std::uint8_t> data);

} // namespace droply

#endif // DROPLY_EMBEDDED_METADATA_HPP
