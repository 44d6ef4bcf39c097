#ifndef DROPLY_BUILTIN_CODECS_HPP
#define DROPLY_BUILTIN_CODECS_HPP

#include "codec.hpp"
#include <memory>
#include <string_view>

namespace droply {

/**
 * @brief Instantiates the codec compiled into libdroply for a name.
 *
 * Compression: gzip, brotli, zip. Archive: zip, tar.
 *
 * @return The codec, or nullptr when no built-in implementation exists.
 */
std::unique_ptr<ICodec> create_builtin_codec(PluginKind kind, std::string_view name);

} // namespace droply

#endif // DROPLY_BUILTIN_CODECS_HPP
