#ifndef DROPLY_JSON_LOG_SINK_HPP
#define DROPLY_JSON_LOG_SINK_HPP

#include "../../../libdroply/include/log_sink.hpp"
#include "../../../libdroply/include/logger.hpp"
#include "../../../libdroply/include/process_metadata.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

/**
 * @brief Line-delimited JSON log records on stderr, for --json mode.
 */
class JsonLogSink final : public droply::ILogSink {
public:
    droply::LogLevel log_level = droply::LogLevel::Warning;

    void log(const droply::LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (level < log_level) return;
        const nlohmann::json line = {
            {"type", "log"},
            {"time", droply::iso8601_now()},
            {"level", droply::Logger::level_to_string(level)},
            {"tag", std::string(tag)},
            {"message", std::string(message)},
        };
        std::cerr << line.dump() << std::endl;
    }
};

#endif // DROPLY_JSON_LOG_SINK_HPP
