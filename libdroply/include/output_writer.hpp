/**
 * @file output_writer.hpp
 * @brief Materializes restored files on disk through the ConflictResolver.
 */

#ifndef DROPLY_OUTPUT_WRITER_HPP
#define DROPLY_OUTPUT_WRITER_HPP

#include "codec.hpp"
#include "conflict_resolver.hpp"
#include "event_bus.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace droply {

struct WriteReport {
    std::vector<std::filesystem::path> written;
    std::vector<std::filesystem::path> skipped;
    std::size_t failed = 0;
};

/**
 * @brief Writes files into an output directory.
 *
 * @details Entry names are resolved relative to the output directory and
 * rejected when they would escape it. Each file is resolved independently:
 * a skipped or failed file does not stop the others. Results are published
 * on the EventBus, if one is given.
 */
class OutputWriter {
public:
    OutputWriter(const ConflictResolver& resolver, EventBus* bus = nullptr);

    /**
     * @brief Writes one buffer to an explicit path.
     * @return Path written, or std::nullopt when the conflict was resolved as Skip.
     * @throws IoError, FilesystemConflictExhausted.
     */
    std::optional<std::filesystem::path> write(const std::filesystem::path& path, const Bytes& data);

    /// Writes every file below dir, creating it if needed.
    WriteReport write_all(const std::filesystem::path& dir, const std::vector<FileRecord>& files);

    /**
     * @brief Joins an entry name to dir.
     * @return std::nullopt when the name is empty or escapes dir.
     */
    static std::optional<std::filesystem::path> safe_join(const std::filesystem::path& dir, const std::string& name);

private:
    const ConflictResolver& resolver_;
    EventBus* bus_;
};

} // namespace droply

#endif // DROPLY_OUTPUT_WRITER_HPP
