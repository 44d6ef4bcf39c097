#ifndef DROPLY_FILE_TYPE_HPP
#define DROPLY_FILE_TYPE_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace droply {

/**
 * @brief Payload formats recognizable from their leading bytes or MIME type.
 *
 * Brotli streams carry no magic number and therefore never appear as a
 * sniffing result.
 */
enum class PayloadFormat {
    Unknown,
    Gzip,
    Zip,
    Tar
};

/**
 * @brief Maps MIME types reported by libmagic to payload formats.
 */
inline const std::unordered_map<std::string, PayloadFormat> mime_to_format = {
    { "application/gzip",             PayloadFormat::Gzip },
    { "application/x-gzip",           PayloadFormat::Gzip },
    { "application/zip",              PayloadFormat::Zip },
    { "application/x-zip-compressed", PayloadFormat::Zip },
    { "application/x-tar",            PayloadFormat::Tar },
    { "application/x-gtar",           PayloadFormat::Tar },
};

/**
 * @brief Converts a PayloadFormat to the algorithm or archive name used by the registry.
 * @return "gzip", "zip", "tar", or an empty string for Unknown.
 */
inline std::string payload_format_to_string(const PayloadFormat fmt) {
    switch (fmt) {
        case PayloadFormat::Gzip:    return "gzip";
        case PayloadFormat::Zip:     return "zip";
        case PayloadFormat::Tar:     return "tar";
        case PayloadFormat::Unknown: return "";
    }
    return "";
}

/**
 * @brief Identifies a payload from its first bytes.
 *
 * gzip: 1f 8b. zip: "PK" followed by 03 04 (local header) or 05 06 (empty archive).
 * tar: "ustar" at offset 257.
 *
 * @param data The payload.
 * @return The detected format, PayloadFormat::Unknown otherwise.
 */
inline PayloadFormat sniff_payload_format(const std::span<const std::uint8_t> data) {
    if (data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b) {
        return PayloadFormat::Gzip;
    }
    if (data.size() >= 4 && data[0] == 'P' && data[1] == 'K' &&
        ((data[2] == 0x03 && data[3] == 0x04) || (data[2] == 0x05 && data[3] == 0x06))) {
        return PayloadFormat::Zip;
    }
    if (data.size() >= 262 && data[257] == 'u' && data[258] == 's' && data[259] == 't' &&
        data[260] == 'a' && data[261] == 'r') {
        return PayloadFormat::Tar;
    }
    return PayloadFormat::Unknown;
}

} // namespace droply

#endif // DROPLY_FILE_TYPE_HPP
