#ifndef DROPLY_GZIP_CODEC_HPP
#define DROPLY_GZIP_CODEC_HPP

#include "codec.hpp"

namespace droply {

/**
 * @brief gzip (RFC 1952) codec backed by zlib. Levels 0-9.
 */
class GzipCodec final : public ICompressionCodec {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "gzip"; }

    [[nodiscard]] Bytes compress(std::span<const std::uint8_t> input, int level) const override;

    [[nodiscard]] Bytes decompress(std::span<const std::uint8_t> input) const override;
};

} // namespace droply

#endif // DROPLY_GZIP_CODEC_HPP
