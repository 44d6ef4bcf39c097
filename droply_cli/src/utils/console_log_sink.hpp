#ifndef DROPLY_CONSOLE_LOG_SINK_HPP
#define DROPLY_CONSOLE_LOG_SINK_HPP

#include "color.hpp"
#include "../../../libdroply/include/log_sink.hpp"
#include "../../../libdroply/include/logger.hpp"
#include <iostream>

/**
 * @brief Writes log lines to stderr, colored by level.
 */
class ConsoleLogSink final : public droply::ILogSink {
public:
    droply::LogLevel log_level = droply::LogLevel::Warning; ///< minimum level printed

    void log(const droply::LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (level < log_level) return;
        const char* color = RESET;
        switch (level) {
            case droply::LogLevel::Debug:   color = GRAY;   break;
            case droply::LogLevel::Info:    color = RESET;  break;
            case droply::LogLevel::Warning: color = YELLOW; break;
            case droply::LogLevel::Error:   color = RED;    break;
        }
        std::cerr << color << "[" << droply::Logger::level_to_string(level) << "] [" << tag << "] "
                  << message << RESET << std::endl;
    }
};

#endif // DROPLY_CONSOLE_LOG_SINK_HPP
