#ifndef DROPLY_ZLIB_STREAM_HPP
#define DROPLY_ZLIB_STREAM_HPP

#include <zlib.h>

namespace droply {

/**
 * @brief RAII owner of a z_stream configured for inflate or deflate.
 *
 * Constructors throw std::runtime_error when zlib refuses the parameters.
 */
struct ZlibStream {
    enum class Variant {
        Gzip,   ///< gzip wrapper (RFC 1952)
        Deflate ///< raw deflate, no header or trailer
    };

    /// Initialize for decompression.
    explicit ZlibStream(Variant variant);

    /// Initialize for compression at the given level (0-9).
    ZlibStream(Variant variant, int level);

    ZlibStream(const ZlibStream&) = delete;
    ZlibStream& operator=(const ZlibStream&) = delete;

    ~ZlibStream();

    z_stream stream{};

private:
    bool deflating_;
};

} // namespace droply

#endif // DROPLY_ZLIB_STREAM_HPP
