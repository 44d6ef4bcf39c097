#ifndef DROPLY_FILE_LOG_SINK_HPP
#define DROPLY_FILE_LOG_SINK_HPP

#include "../../../libdroply/include/log_sink.hpp"
#include "../../../libdroply/include/logger.hpp"
#include "../../../libdroply/include/process_metadata.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

/**
 * @brief Appends (or truncates and writes) timestamped log lines to a file.
 */
class FileLogSink final : public droply::ILogSink {
public:
    FileLogSink(const std::filesystem::path& path, const bool append)
        : out_(path, append ? std::ios::app : std::ios::trunc) {
        if (!out_) {
            throw std::runtime_error("Cannot open log file: " + path.string());
        }
    }

    void log(const droply::LogLevel level, const std::string_view message, const std::string_view tag) override {
        out_ << droply::iso8601_now() << " [" << droply::Logger::level_to_string(level) << "] [" << tag << "] "
             << message << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
};

#endif // DROPLY_FILE_LOG_SINK_HPP
