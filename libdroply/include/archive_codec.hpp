/**
 * @file archive_codec.hpp
 * @brief libarchive backed primitives: zip and tar framing, and zip used as a
 * single-stream compression format.
 */

#ifndef DROPLY_ARCHIVE_CODEC_HPP
#define DROPLY_ARCHIVE_CODEC_HPP

#include "codec.hpp"

namespace droply {

/**
 * @brief ZIP archive. Entries are stored raw unless compress_inside is set,
 * in which case they are deflated at the given level.
 */
class ZipArchiveCodec final : public IArchiveCodec {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "zip"; }

    [[nodiscard]] Bytes pack(const std::vector<FileRecord>& files, bool compress_inside, int level) const override;

    [[nodiscard]] std::vector<FileRecord> unpack(std::span<const std::uint8_t> input) const override;
};

/**
 * @brief GNU tar archive. Entries are regular files, mode 0644.
 * compress_inside and level have no effect: tar has no per-entry compression.
 */
class TarArchiveCodec final : public IArchiveCodec {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "tar"; }

    [[nodiscard]] Bytes pack(const std::vector<FileRecord>& files, bool compress_inside, int level) const override;

    [[nodiscard]] std::vector<FileRecord> unpack(std::span<const std::uint8_t> input) const override;
};

/**
 * @brief "zip as compression": the stream becomes the single entry of a ZIP.
 *
 * Level 0 stores the entry, levels 1-9 deflate it. Any ZIP reader can open
 * the result; decompression returns the first regular entry.
 */
class ZipCompressionCodec final : public ICompressionCodec {
public:
    static constexpr std::string_view entry_name = "data.bin";

    [[nodiscard]] std::string_view get_name() const noexcept override { return "zip"; }

    [[nodiscard]] Bytes compress(std::span<const std::uint8_t> input, int level) const override;

    [[nodiscard]] Bytes decompress(std::span<const std::uint8_t> input) const override;

    /**
     * @brief Tells a compress() container from a zip archive.
     * @return true if input is a zip holding exactly one entry named entry_name.
     * @throws CorruptInputError if input is not a readable zip.
     */
    [[nodiscard]] static bool is_container(std::span<const std::uint8_t> input);
};

} // namespace droply

#endif // DROPLY_ARCHIVE_CODEC_HPP
