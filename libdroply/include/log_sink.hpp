#ifndef DROPLY_LOG_SINK_HPP
#define DROPLY_LOG_SINK_HPP

#include <string_view>

namespace droply {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Diagnostic detail (codec selection, cache hits)
    Info,    ///< Normal operation (files written, archives packed)
    Warning, ///< Recovered problems (native module fallback, ignored metadata)
    Error    ///< Failures surfaced to the caller
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages end up (console, file, JSON lines).
 * The Logger delegates to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace droply

#endif // DROPLY_LOG_SINK_HPP
