/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by every droply component.
 */

#ifndef DROPLY_LOGGER_HPP
#define DROPLY_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace droply {

/**
 * @brief Static logging facade.
 *
 * Messages are forwarded to all registered ILogSink implementations. The
 * library never installs a sink by itself: hosts (the CLI, a server, tests)
 * decide where output goes.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// Remove all configured sinks.
    static void clear_sinks();

    /// @return Number of installed sinks.
    static std::size_t sink_count();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "droply").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "droply");

    /**
     * @brief Converts a LogLevel to its display name.
     * @return A constant string ("DEBUG", "INFO", "WARN", "ERROR").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name, case-insensitive.
     * Accepts "DEBUG", "INFO", "WARN", "WARNING" and "ERROR".
     * @return The level, or std::nullopt for unknown names.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    ///< All registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to sinks_.
    static std::mutex mtx_;
};

} // namespace droply

#endif // DROPLY_LOGGER_HPP
