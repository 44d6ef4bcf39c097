#ifndef DROPLY_BROTLI_CODEC_HPP
#define DROPLY_BROTLI_CODEC_HPP

#include "codec.hpp"

namespace droply {

/**
 * @brief Brotli codec backed by the reference encoder/decoder. Levels 0-11.
 */
class BrotliCodec final : public ICompressionCodec {
public:
    [[nodiscard]] std::string_view get_name() const noexcept override { return "brotli"; }

    [[nodiscard]] Bytes compress(std::span<const std::uint8_t> input, int level) const override;

    [[nodiscard]] Bytes decompress(std::span<const std::uint8_t> input) const override;
};

} // namespace droply

#endif // DROPLY_BROTLI_CODEC_HPP
