// Native codec module for the server platform, loaded by droply::ModuleLoader.

#include "../include/builtin_codecs.hpp"
#include "../include/module_abi.hpp"
#include <exception>

extern "C" {

__attribute__((visibility("default"))) std::uint32_t droply_module_abi_version() {
    return droply::module_abi_version;
}

__attribute__((visibility("default"))) droply::ICodec* droply_module_create(const int kind, const char* name) {
    if (!name || (kind != static_cast<int>(droply::PluginKind::Compression) &&
                  kind != static_cast<int>(droply::PluginKind::Archive))) {
        return nullptr;
    }
    try {
        return droply::create_builtin_codec(static_cast<droply::PluginKind>(kind), name).release();
    } catch (const std::exception&) {
        return nullptr;
    }
}

__attribute__((visibility("default"))) void droply_module_destroy(droply::ICodec* codec) {
    delete codec;
}

}
