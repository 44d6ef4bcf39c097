/**
 * @file module_abi.hpp
 * @brief C entry points a native codec module exports.
 *
 * A module is a shared object named `libdroply_<platform>.so`. The loader
 * resolves the three symbols below; a module whose ABI version differs from
 * droply::module_abi_version is rejected.
 */

#ifndef DROPLY_MODULE_ABI_HPP
#define DROPLY_MODULE_ABI_HPP

#include "codec.hpp"
#include <cstdint>

namespace droply {

inline constexpr std::uint32_t module_abi_version = 1;

inline constexpr const char* module_abi_symbol = "droply_module_abi_version";
inline constexpr const char* module_create_symbol = "droply_module_create";
inline constexpr const char* module_destroy_symbol = "droply_module_destroy";

/// Returns the ABI version the module was built against.
using ModuleAbiFn = std::uint32_t (*)();
/// Creates a codec; kind is a PluginKind value. Returns nullptr when unsupported. Must not throw.
using ModuleCreateFn = ICodec* (*)(int kind, const char* name);
/// Destroys a codec created by the same module.
using ModuleDestroyFn = void (*)(ICodec* codec);

} // namespace droply

#endif // DROPLY_MODULE_ABI_HPP
