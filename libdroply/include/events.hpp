#ifndef DROPLY_EVENTS_HPP
#define DROPLY_EVENTS_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace droply {

/**
 * @brief Events published by OutputWriter through the EventBus.
 */

/**
 * @brief Emitted after a file has been written to disk.
 */
struct OutputWrittenEvent {
    std::filesystem::path requested; ///< Path asked for by the caller
    std::filesystem::path written;   ///< Path actually written (differs on keep-both)
    std::uintmax_t size = 0;         ///< Bytes written
    bool replaced = false;           ///< True if an existing file was overwritten
};

/**
 * @brief Emitted when a conflict was resolved by skipping the file.
 */
struct OutputSkippedEvent {
    std::filesystem::path requested;
    std::string reason;
};

/**
 * @brief Emitted when writing a file failed.
 */
struct OutputErrorEvent {
    std::filesystem::path requested;
    std::string error_message;
};

} // namespace droply

#endif // DROPLY_EVENTS_HPP
