#include "../../include/brotli_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <brotli/decode.h>
#include <brotli/encode.h>
#include <algorithm>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>

namespace droply {

namespace {
using BrotliDecoderPtr = std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)>;

const char* codec_tag() {
    return "BrotliCodec";
}
} // namespace

Bytes BrotliCodec::compress(const std::span<const std::uint8_t> input, const int level) const {
    std::size_t out_size = BrotliEncoderMaxCompressedSize(input.size());
    if (out_size == 0) {
        // input too large for a one-shot bound
        throw ValidationError("Input too large for brotli (" + std::to_string(input.size()) + " bytes)");
    }
    Bytes out(out_size);

    if (BrotliEncoderCompress(level, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_GENERIC,
                              input.size(), input.data(), &out_size, out.data()) == BROTLI_FALSE) {
        throw std::runtime_error("BrotliEncoderCompress failed");
    }
    out.resize(out_size);

    Logger::log(LogLevel::Debug, "Compressed " + std::to_string(input.size()) + " -> " +
                std::to_string(out.size()) + " bytes (quality " + std::to_string(level) + ")", codec_tag());
    return out;
}

Bytes BrotliCodec::decompress(const std::span<const std::uint8_t> input) const {
    BrotliDecoderPtr state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance);
    if (!state) {
        throw std::bad_alloc();
    }

    const std::uint8_t* next_in = input.data();
    std::size_t avail_in = input.size();

    Bytes out(std::max<std::size_t>(input.size() * 4, 4096));
    std::size_t produced = 0;

    for (;;) {
        std::uint8_t* next_out = out.data() + produced;
        std::size_t avail_out = out.size() - produced;
        const std::size_t room = avail_out;

        const auto res = BrotliDecoderDecompressStream(state.get(), &avail_in, &next_in,
                                                       &avail_out, &next_out, nullptr);
        produced += room - avail_out;

        if (res == BROTLI_DECODER_RESULT_SUCCESS) {
            if (avail_in != 0) {
                Logger::log(LogLevel::Warning, "Ignoring " + std::to_string(avail_in) +
                            " trailing bytes after brotli stream", codec_tag());
            }
            break;
        }
        if (res == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
            out.resize(out.size() * 2);
            continue;
        }
        if (res == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
            throw CorruptInputError("brotli stream is truncated",
                                    "The file may be incomplete; re-download or re-create it.");
        }
        const auto code = BrotliDecoderGetErrorCode(state.get());
        throw CorruptInputError(std::string("brotli stream is corrupt: ") + BrotliDecoderErrorString(code));
    }

    out.resize(produced);
    return out;
}

} // namespace droply
