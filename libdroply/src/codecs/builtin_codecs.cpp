#include "../../include/builtin_codecs.hpp"
#include "../../include/archive_codec.hpp"
#include "../../include/brotli_codec.hpp"
#include "../../include/gzip_codec.hpp"

namespace droply {

std::unique_ptr<ICodec> create_builtin_codec(const PluginKind kind, const std::string_view name) {
    switch (kind) {
        case PluginKind::Compression:
            if (name == "gzip")   return std::make_unique<GzipCodec>();
            if (name == "brotli") return std::make_unique<BrotliCodec>();
            if (name == "zip")    return std::make_unique<ZipCompressionCodec>();
            break;
        case PluginKind::Archive:
            if (name == "zip") return std::make_unique<ZipArchiveCodec>();
            if (name == "tar") return std::make_unique<TarArchiveCodec>();
            break;
    }
    return nullptr;
}

} // namespace droply
