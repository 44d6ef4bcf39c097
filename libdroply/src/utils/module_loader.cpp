#include "../../include/module_loader.hpp"
#include "../../include/builtin_codecs.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/module_abi.hpp"
#include <dlfcn.h>
#include <cstdlib>
#include <exception>
#include <vector>

namespace droply {

namespace fs = std::filesystem;

static const char* loader_tag() {
    return "ModuleLoader";
}

CodecHandle::CodecHandle(const CodecOrigin origin, std::shared_ptr<const ICodec> codec)
    : origin_(origin), codec_(std::move(codec)) {
    if (!codec_) {
        throw LoadFailure("Codec handle created without a codec");
    }
}

const ICompressionCodec& CodecHandle::compression() const {
    const auto* c = dynamic_cast<const ICompressionCodec*>(codec_.get());
    if (!c) {
        throw LoadFailure("'" + std::string(codec_->get_name()) + "' is not a compression codec");
    }
    return *c;
}

const IArchiveCodec& CodecHandle::archive() const {
    const auto* c = dynamic_cast<const IArchiveCodec*>(codec_.get());
    if (!c) {
        throw LoadFailure("'" + std::string(codec_->get_name()) + "' is not an archive codec");
    }
    return *c;
}

ModuleLoader::ModuleLoader(const PluginRegistry& registry, fs::path module_dir)
    : registry_(registry), module_dir_(std::move(module_dir)) {}

fs::path ModuleLoader::default_module_dir() {
    const char* env = std::getenv("DROPLY_MODULE_PATH");
    return (env && *env) ? fs::path(env) : fs::path();
}

fs::path ModuleLoader::module_path() const {
    if (module_dir_.empty()) return {};
    return module_dir_ / ("libdroply_" + platform_to_string(registry_.current_platform()) + ".so");
}

std::string ModuleLoader::cache_key(const std::string_view name, const PluginKind kind) const {
    return std::string(plugin_kind_to_string(kind)) + ":" + platform_to_string(registry_.current_platform()) +
           ":" + std::string(name);
}

CodecHandle ModuleLoader::get(const std::string_view name, const PluginKind kind) {
    if (kind == PluginKind::Compression) {
        registry_.validate_compression(name, std::nullopt);
    } else {
        registry_.validate_archive(name);
    }

    const auto key = cache_key(name, kind);
    std::promise<CodecHandle> promise;
    std::shared_future<CodecHandle> future;
    bool owner = false;
    {
        std::lock_guard lock(mtx_);
        if (const auto it = cache_.find(key); it != cache_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            cache_.emplace(key, future);
            owner = true;
        }
    }

    if (owner) {
        try {
            promise.set_value(load(std::string(name), kind));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Loading " + key + " failed: " + e.what(), loader_tag());
            {
                std::lock_guard lock(mtx_);
                cache_.erase(key);
            }
            promise.set_exception(std::current_exception());
        }
    } else {
        Logger::log(LogLevel::Debug, "Cache hit for " + key, loader_tag());
    }
    return future.get();
}

CodecHandle ModuleLoader::load(const std::string& name, const PluginKind kind) {
    std::string reason;
    if (auto native = load_native(name, kind, reason)) {
        Logger::log(LogLevel::Debug, "Loaded native " + std::string(plugin_kind_to_string(kind)) + " codec '" +
                    name + "' from " + module_path().string(), loader_tag());
        return CodecHandle(CodecOrigin::Native, std::move(native));
    }

    // a module that is simply not installed is the normal case for native builds
    const LogLevel level = module_dir_.empty() ? LogLevel::Debug : LogLevel::Warning;
    Logger::log(level, "Native " + std::string(plugin_kind_to_string(kind)) + " codec '" + name +
                "' unavailable (" + reason + "), using built-in implementation", loader_tag());

    std::shared_ptr<const ICodec> fallback = create_builtin_codec(kind, name);
    if (!fallback) {
        throw LoadFailure("No implementation available for " + std::string(plugin_kind_to_string(kind)) + " '" +
                          name + "'", "Native module: " + reason);
    }
    return CodecHandle(CodecOrigin::Fallback, std::move(fallback));
}

std::shared_ptr<void> ModuleLoader::open_module(std::string& reason) {
    std::lock_guard lock(module_mtx_);
    if (module_) return module_;

    const auto path = module_path();
    if (path.empty()) {
        reason = "no module directory configured";
        return nullptr;
    }
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        reason = "module not found: " + path.string();
        return nullptr;
    }

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        reason = std::string("dlopen failed: ") + (err ? err : "unknown error");
        return nullptr;
    }
    std::shared_ptr<void> module(handle, [](void* h) { dlclose(h); });

    auto abi = reinterpret_cast<ModuleAbiFn>(dlsym(handle, module_abi_symbol));
    if (!abi) {
        reason = std::string("missing symbol ") + module_abi_symbol;
        return nullptr;
    }
    if (const auto v = abi(); v != module_abi_version) {
        reason = "ABI mismatch (module " + std::to_string(v) + ", expected " +
                 std::to_string(module_abi_version) + ")";
        return nullptr;
    }

    module_ = std::move(module);
    return module_;
}

std::shared_ptr<const ICodec> ModuleLoader::load_native(const std::string& name, const PluginKind kind,
                                                        std::string& reason) {
    auto module = open_module(reason);
    if (!module) return nullptr;

    auto create = reinterpret_cast<ModuleCreateFn>(dlsym(module.get(), module_create_symbol));
    auto destroy = reinterpret_cast<ModuleDestroyFn>(dlsym(module.get(), module_destroy_symbol));
    if (!create || !destroy) {
        reason = "module lacks create/destroy entry points";
        return nullptr;
    }

    ICodec* raw = create(static_cast<int>(kind), name.c_str());
    if (!raw) {
        reason = "module does not provide this codec";
        return nullptr;
    }
    if (raw->get_kind() != kind) {
        destroy(raw);
        reason = "module returned a codec of the wrong kind";
        return nullptr;
    }
    // the deleter owns a reference to the module so the code stays mapped
    return std::shared_ptr<const ICodec>(raw, [module, destroy](const ICodec* c) {
        destroy(const_cast<ICodec*>(c));
    });
}

void ModuleLoader::reload(const std::optional<std::string_view> name) {
    {
        std::lock_guard lock(mtx_);
        if (!name) {
            cache_.clear();
        } else {
            for (const PluginKind kind : {PluginKind::Compression, PluginKind::Archive}) {
                cache_.erase(cache_key(*name, kind));
            }
        }
    }
    {
        std::lock_guard lock(module_mtx_);
        module_.reset();
    }
    Logger::log(LogLevel::Info, name ? "Reloading codec '" + std::string(*name) + "'" : std::string("Reloading all codecs"),
                loader_tag());
}

void ModuleLoader::clear_cache() {
    std::lock_guard lock(mtx_);
    cache_.clear();
}

bool ModuleLoader::is_cached(const std::string_view name, const PluginKind kind) const {
    std::lock_guard lock(mtx_);
    return cache_.contains(cache_key(name, kind));
}

} // namespace droply
