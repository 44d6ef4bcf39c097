#include "../../include/gzip_codec.hpp"
#include "../../include/zlib_stream.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <limits>
#include <string>

namespace droply {

static const char* codec_tag() {
    return "GzipCodec";
}

static void ensure_zlib_sized(const std::span<const std::uint8_t> input) {
    if (input.size() > std::numeric_limits<uInt>::max()) {
        throw ValidationError("Input too large for a single gzip stream (" + std::to_string(input.size()) + " bytes)");
    }
}

Bytes GzipCodec::compress(const std::span<const std::uint8_t> input, const int level) const {
    ensure_zlib_sized(input);
    ZlibStream zs(ZlibStream::Variant::Gzip, level);

    Bytes out(deflateBound(&zs.stream, static_cast<uLong>(input.size())));
    zs.stream.next_in = const_cast<Bytef*>(input.data());
    zs.stream.avail_in = static_cast<uInt>(input.size());
    zs.stream.next_out = out.data();
    zs.stream.avail_out = static_cast<uInt>(out.size());

    const int ret = deflate(&zs.stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("gzip deflate failed with error " + std::to_string(ret));
    }
    out.resize(zs.stream.total_out);

    Logger::log(LogLevel::Debug, "Compressed " + std::to_string(input.size()) + " -> " +
                std::to_string(out.size()) + " bytes (level " + std::to_string(level) + ")", codec_tag());
    return out;
}

Bytes GzipCodec::decompress(const std::span<const std::uint8_t> input) const {
    ensure_zlib_sized(input);
    ZlibStream zs(ZlibStream::Variant::Gzip);

    Bytes out(std::max<std::size_t>(input.size() * 4, 4096));
    std::size_t produced = 0;

    zs.stream.next_in = const_cast<Bytef*>(input.data());
    zs.stream.avail_in = static_cast<uInt>(input.size());

    for (;;) {
        if (produced == out.size()) {
            out.resize(out.size() * 2);
        }
        const std::size_t room = std::min<std::size_t>(out.size() - produced, std::numeric_limits<uInt>::max());
        zs.stream.next_out = out.data() + produced;
        zs.stream.avail_out = static_cast<uInt>(room);

        const int ret = inflate(&zs.stream, Z_NO_FLUSH);
        produced += room - zs.stream.avail_out;

        if (ret == Z_STREAM_END) {
            break;
        }
        if (ret == Z_OK) {
            continue;
        }
        if (ret == Z_BUF_ERROR && zs.stream.avail_in == 0) {
            throw CorruptInputError("gzip stream is truncated",
                                    "The file may be incomplete; re-download or re-create it.");
        }
        if (ret == Z_BUF_ERROR) {
            continue;
        }
        const std::string detail = zs.stream.msg ? zs.stream.msg : ("inflate error " + std::to_string(ret));
        throw CorruptInputError("gzip stream is corrupt: " + detail);
    }

    if (zs.stream.avail_in != 0) {
        Logger::log(LogLevel::Warning, "Ignoring " + std::to_string(zs.stream.avail_in) +
                    " trailing bytes after gzip stream", codec_tag());
    }
    out.resize(produced);
    return out;
}

} // namespace droply
