#include "../../include/zlib_stream.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>

namespace droply {

namespace {
int window_bits(const ZlibStream::Variant variant) {
    switch (variant) {
        case ZlibStream::Variant::Gzip:    return MAX_WBITS + 16;
        case ZlibStream::Variant::Deflate: return -MAX_WBITS;
    }
    throw std::invalid_argument("Invalid zlib variant");
}
} // namespace

ZlibStream::ZlibStream(const Variant variant) : deflating_(false) {
    const int ret = inflateInit2(&stream, window_bits(variant));
    if (ret != Z_OK) {
        throw std::runtime_error("inflateInit2 failed with error " + std::to_string(ret));
    }
}

ZlibStream::ZlibStream(const Variant variant, const int level) : deflating_(true) {
    const int ret = deflateInit2(&stream, level, Z_DEFLATED, window_bits(variant), 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw std::runtime_error("deflateInit2 failed with error " + std::to_string(ret));
    }
}

ZlibStream::~ZlibStream() {
    const int ret = deflating_ ? deflateEnd(&stream) : inflateEnd(&stream);
    // Z_DATA_ERROR is expected when a deflate stream is torn down early
    if (ret != Z_OK && ret != Z_DATA_ERROR) {
        Logger::log(LogLevel::Debug, "zlib end returned " + std::to_string(ret), "ZlibStream");
    }
}

} // namespace droply
