/**
 * @file filename_convention.hpp
 * @brief Maps (archive, compression) choices to canonical file extensions and back.
 *
 * Pure functions, no I/O. Archive names: "none", "zip", "tar". Compression
 * names: "none", "gzip", "brotli", "zip". The archive extension always comes
 * before the compression extension (".tar.gz", ".zip.br").
 */

#ifndef DROPLY_FILENAME_CONVENTION_HPP
#define DROPLY_FILENAME_CONVENTION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace droply {

inline constexpr std::string_view algo_none = "none";

/**
 * @brief How a lone ".zip" suffix is interpreted.
 *
 * ".zip" is both an archive and a compression suffix; only the caller's
 * explicit archive choice can tell them apart.
 */
enum class ZipSuffixRole {
    Archive,    ///< ".zip" means archive=zip, compression=none (default)
    Compression ///< ".zip" means archive=none, compression=zip
};

/**
 * @brief Result of parse_extension().
 */
struct ParsedFilename {
    std::string base_name;   ///< Name without the recognized suffix
    std::string archive;     ///< "none", "zip" or "tar"
    std::string compression; ///< "none", "gzip", "brotli" or "zip"

    bool operator==(const ParsedFilename&) const = default;
};

/**
 * @brief Options for smart_filename().
 */
struct SmartFilenameOptions {
    std::string archive = std::string(algo_none);
    std::string compression = std::string(algo_none);
    std::optional<std::string> timestamp; ///< Inserted as "-<timestamp>" before the extension
    std::string prefix;                   ///< Prepended to the base name
    std::string suffix;                   ///< Appended to the base name
    bool strip_extension = false;         ///< Drop the base name's last extension first
};

/**
 * @brief Result of validate_filename_convention().
 */
struct FilenameValidation {
    bool valid = false;
    ParsedFilename parsed;
    std::vector<std::string> issues;
};

/**
 * @brief Composes the canonical extension for an (archive, compression) pair.
 *
 * none+gzip ".gz", none+brotli ".br", none+zip ".zip", none+none "",
 * zip+none ".zip", zip+gzip ".zip.gz", zip+brotli ".zip.br", zip+zip ".zip.zip",
 * tar+none ".tar", tar+gzip ".tar.gz", tar+brotli ".tar.br", tar+zip ".tar.zip".
 *
 * @throws ValidationError for unknown names.
 */
std::string compose_extension(std::string_view archive, std::string_view compression);

/**
 * @brief Splits a file name into base name and recognized archive/compression.
 *
 * Double suffixes are matched before single ones (case-insensitive). In a
 * double suffix the leading token is the archive and the trailing token the
 * compression. Unknown suffixes are not stripped: the whole name becomes the
 * base name with archive=none, compression=none.
 */
ParsedFilename parse_extension(std::string_view filename, ZipSuffixRole zip_role = ZipSuffixRole::Archive);

/**
 * @brief Builds "<prefix><base><suffix>[-<timestamp>]<extension>".
 * @throws ValidationError for unknown archive/compression names.
 */
std::string smart_filename(std::string_view base_name, const SmartFilenameOptions& options);

/// @return Current UTC time as "YYYYMMDD-HHMMSS", for SmartFilenameOptions::timestamp.
std::string make_timestamp_token();

/**
 * @brief Checks whether a file name follows the convention.
 *
 * Valid names have a non-empty base and a recognized suffix.
 */
FilenameValidation validate_filename_convention(std::string_view filename);

/// @return Every extension compose_extension() can produce, longest first.
std::vector<std::string> supported_extensions();

/// @return Recognized suffixes, longest first.
const std::vector<std::string>& known_suffixes();

/**
 * @brief Splits a name at its extension boundary.
 *
 * A recognized suffix wins; otherwise the name is split at the first dot
 * (a leading dot does not count, so ".bashrc" has no extension).
 *
 * @return {stem, extension}; extension is empty when there is none.
 */
std::pair<std::string, std::string> split_extension(std::string_view filename);

} // namespace droply

#endif // DROPLY_FILENAME_CONVENTION_HPP
