/**
 * @file droply.hpp
 * @brief Public API for the Droply library.
 */

#ifndef DROPLY_HPP
#define DROPLY_HPP

#include "pipeline.hpp"
#include "platform.hpp"
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace droply {

/**
 * @brief Main interface for the Droply library.
 *
 * @details Owns a PluginRegistry, a ModuleLoader and a Pipeline, built on
 * first use from the configuration below. Changing the configuration swaps
 * in a new set on next use; work already submitted keeps the set it was
 * submitted with. process() and restore() are blocking; the submit variants
 * run on an internal ThreadPool.
 */
class Droply {
public:
    Droply();
    ~Droply();

    Droply(const Droply&) = delete;
    Droply& operator=(const Droply&) = delete;
    Droply(Droply&&) noexcept;
    Droply& operator=(Droply&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Sets the execution target.
     * Default: detect_platform().
     */
    Droply& platform(Platform p);

    /**
     * @brief Sets the directory searched for the native codec module.
     * Default: $DROPLY_MODULE_PATH.
     */
    Droply& moduleDirectory(const std::filesystem::path& dir);

    /**
     * @brief Reads the plugin catalog from a JSON file instead of the built-in one.
     * Default: $DROPLY_REGISTRY, else the built-in catalog.
     */
    Droply& catalogFile(const std::filesystem::path& path);

    /**
     * @brief Sets the number of worker threads used by submitProcess()/submitRestore().
     * Default: hardware concurrency / 2.
     */
    Droply& threads(unsigned val);

    // --- Components ---
    // References stay valid until the next configuration change.

    const PluginRegistry& registry();
    ModuleLoader& loader();
    Pipeline& pipeline();

    // --- Execution ---

    Bytes process(const std::vector<FileRecord>& files, const ProcessOptions& options);
    ProcessResult processWithMetadata(const std::vector<FileRecord>& files, const ProcessOptions& options);
    std::vector<FileRecord> restore(std::span<const std::uint8_t> data, const RestoreOptions& options);
    RestoreResult restoreWithMetadata(std::span<const std::uint8_t> data, const RestoreOptions& options);

    /// Runs processWithMetadata() on the pool. Inputs are copied.
    std::future<ProcessResult> submitProcess(std::vector<FileRecord> files, ProcessOptions options);

    /// Runs restoreWithMetadata() on the pool. Input is copied.
    std::future<RestoreResult> submitRestore(Bytes data, RestoreOptions options);

    /// Rebuilds the registry from its catalog and drops every loaded codec.
    void reload();

    /// Waits for submitted work to finish.
    void wait();

    /**
     * @brief Drops submitted work that has not started.
     * Futures of dropped work throw std::future_error (broken_promise).
     * @return Number of submissions dropped.
     */
    std::size_t cancel();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace droply

#endif // DROPLY_HPP
