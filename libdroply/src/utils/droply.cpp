/**
 * @file droply.cpp
 * @brief Implementation of the public Droply API.
 */

#include "../../include/droply.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include <cstdlib>
#include <mutex>
#include <thread>

namespace droply {

namespace {

// registry, loader and pipeline of one configuration; submitted jobs share ownership
struct Engine {
    std::unique_ptr<PluginRegistry> registry;
    std::unique_ptr<ModuleLoader> loader;
    std::unique_ptr<Pipeline> pipeline;
};

} // namespace

struct Droply::Impl {
    std::optional<Platform> platform;
    std::optional<std::filesystem::path> moduleDir;
    std::optional<std::filesystem::path> catalogFile;
    unsigned numThreads = std::thread::hardware_concurrency() / 2;

    std::mutex mtx; ///< guards everything above and below
    std::shared_ptr<Engine> engine;
    std::shared_ptr<ThreadPool> pool;

    Impl() {
        if (numThreads == 0) numThreads = 1;
        if (const char* env = std::getenv("DROPLY_REGISTRY"); env && *env) {
            catalogFile = std::filesystem::path(env);
        }
    }

    std::shared_ptr<Engine> ensure() {
        std::lock_guard lock(mtx);
        if (!engine) {
            const auto target = platform.value_or(detect_platform());
            auto e = std::make_shared<Engine>();
            if (catalogFile) {
                e->registry = std::make_unique<PluginRegistry>(target, [path = *catalogFile] {
                    return PluginRegistry::load_catalog_file(path);
                });
            } else {
                e->registry = std::make_unique<PluginRegistry>(target);
            }
            e->loader = std::make_unique<ModuleLoader>(*e->registry,
                                                       moduleDir.value_or(ModuleLoader::default_module_dir()));
            e->pipeline = std::make_unique<Pipeline>(*e->registry, *e->loader);
            engine = std::move(e);
            Logger::log(LogLevel::Debug, "Initialized for platform " + platform_to_string(target), "Droply");
        }
        return engine;
    }

    std::shared_ptr<ThreadPool> ensurePool() {
        std::lock_guard lock(mtx);
        if (!pool) {
            pool = std::make_shared<ThreadPool>(numThreads);
        }
        return pool;
    }

    template<class Setter>
    void configure(Setter&& setter) {
        std::lock_guard lock(mtx);
        setter();
        engine.reset();
    }
};

Droply::Droply() : impl_(std::make_unique<Impl>()) {}

Droply::~Droply() {
    if (impl_ && impl_->pool) {
        impl_->pool->wait_idle();
    }
}

Droply::Droply(Droply&&) noexcept = default;
Droply& Droply::operator=(Droply&&) noexcept = default;

Droply& Droply::platform(const Platform p) {
    impl_->configure([&] { impl_->platform = p; });
    return *this;
}

Droply& Droply::moduleDirectory(const std::filesystem::path& dir) {
    impl_->configure([&] { impl_->moduleDir = dir; });
    return *this;
}

Droply& Droply::catalogFile(const std::filesystem::path& path) {
    impl_->configure([&] { impl_->catalogFile = path; });
    return *this;
}

Droply& Droply::threads(const unsigned val) {
    std::shared_ptr<ThreadPool> old;
    {
        std::lock_guard lock(impl_->mtx);
        impl_->numThreads = val == 0 ? 1 : val;
        old = std::move(impl_->pool);
    }
    if (old) {
        old->wait_idle();
    }
    return *this;
}

const PluginRegistry& Droply::registry() {
    return *impl_->ensure()->registry;
}

ModuleLoader& Droply::loader() {
    return *impl_->ensure()->loader;
}

Pipeline& Droply::pipeline() {
    return *impl_->ensure()->pipeline;
}

Bytes Droply::process(const std::vector<FileRecord>& files, const ProcessOptions& options) {
    const auto e = impl_->ensure();
    return e->pipeline->process(files, options);
}

ProcessResult Droply::processWithMetadata(const std::vector<FileRecord>& files, const ProcessOptions& options) {
    const auto e = impl_->ensure();
    return e->pipeline->process_with_metadata(files, options);
}

std::vector<FileRecord> Droply::restore(const std::span<const std::uint8_t> data, const RestoreOptions& options) {
    const auto e = impl_->ensure();
    return e->pipeline->restore(data, options);
}

RestoreResult Droply::restoreWithMetadata(const std::span<const std::uint8_t> data, const RestoreOptions& options) {
    const auto e = impl_->ensure();
    return e->pipeline->restore_with_metadata(data, options);
}

std::future<ProcessResult> Droply::submitProcess(std::vector<FileRecord> files, ProcessOptions options) {
    auto label = "process " + std::to_string(files.size()) + " file(s) with " + options.compression.algo;
    return impl_->ensurePool()->submit(std::move(label),
        [e = impl_->ensure(), files = std::move(files), options = std::move(options)] {
            return e->pipeline->process_with_metadata(files, options);
        });
}

std::future<RestoreResult> Droply::submitRestore(Bytes data, RestoreOptions options) {
    auto label = "restore " + std::to_string(data.size()) + " bytes of " + options.compression;
    return impl_->ensurePool()->submit(std::move(label),
        [e = impl_->ensure(), data = std::move(data), options = std::move(options)] {
            return e->pipeline->restore_with_metadata(data, options);
        });
}

void Droply::reload() {
    const auto e = impl_->ensure();
    e->registry->reload();
    e->loader->reload();
}

void Droply::wait() {
    std::shared_ptr<ThreadPool> pool;
    {
        std::lock_guard lock(impl_->mtx);
        pool = impl_->pool;
    }
    if (pool) {
        pool->wait_idle();
    }
}

std::size_t Droply::cancel() {
    std::lock_guard lock(impl_->mtx);
    return impl_->pool ? impl_->pool->cancel_pending() : 0;
}

} // namespace droply
