#include "../../include/output_writer.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

namespace droply {

namespace fs = std::filesystem;

static const char* writer_tag() {
    return "OutputWriter";
}

OutputWriter::OutputWriter(const ConflictResolver& resolver, EventBus* bus)
    : resolver_(resolver), bus_(bus) {}

std::optional<fs::path> OutputWriter::safe_join(const fs::path& dir, const std::string& name) {
    if (name.empty() || name.find('\0') != std::string::npos) return std::nullopt;

    std::string s = name;
    for (auto& c : s) { if (c == '\\') c = '/'; }
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    if (s.empty()) return std::nullopt;

    const auto base = dir.lexically_normal();
    const auto candidate = (base / fs::path(s).relative_path()).lexically_normal();
    const auto rel = candidate.lexically_relative(base);
    if (rel.empty() || rel == "." || *rel.begin() == "..") return std::nullopt;
    return candidate;
}

std::optional<fs::path> OutputWriter::write(const fs::path& path, const Bytes& data) {
    const auto resolution = resolver_.resolve(path);
    if (resolution.outcome == ResolutionOutcome::Skip) {
        Logger::log(LogLevel::Info, "Skipped existing " + path.string(), writer_tag());
        if (bus_) bus_->publish(OutputSkippedEvent{ path, "exists" });
        return std::nullopt;
    }

    if (const auto parent = resolution.target.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw IoError("Cannot create " + parent.string() + ": " + ec.message());
        }
    }
    if (resolution.outcome == ResolutionOutcome::Replace) {
        std::error_code ec;
        fs::remove(resolution.target, ec);
        if (ec) {
            throw IoError("Cannot replace " + resolution.target.string() + ": " + ec.message());
        }
    }

    write_file(resolution.target, data);
    Logger::log(LogLevel::Debug, "Wrote " + std::to_string(data.size()) + " bytes to " +
                resolution.target.string(), writer_tag());
    if (bus_) {
        bus_->publish(OutputWrittenEvent{ path, resolution.target, data.size(),
                                          resolution.outcome == ResolutionOutcome::Replace });
    }
    return resolution.target;
}

WriteReport OutputWriter::write_all(const fs::path& dir, const std::vector<FileRecord>& files) {
    WriteReport report;
    const auto root = resolver_.resolve_directory(dir);
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw IoError("Cannot create " + root.string() + ": " + ec.message());
    }

    for (const auto& file : files) {
        const auto target = safe_join(root, file.name);
        if (!target) {
            Logger::log(LogLevel::Warning, "Skipping suspicious entry name (path traversal): " + file.name,
                        writer_tag());
            if (bus_) bus_->publish(OutputErrorEvent{ root / "?", "unsafe entry name: " + file.name });
            ++report.failed;
            continue;
        }
        try {
            if (auto written = write(*target, file.data)) {
                report.written.push_back(std::move(*written));
            } else {
                report.skipped.push_back(*target);
            }
        } catch (const IoError& e) {
            Logger::log(LogLevel::Error, e.what(), writer_tag());
            if (bus_) bus_->publish(OutputErrorEvent{ *target, e.what() });
            ++report.failed;
        }
    }
    return report;
}

} // namespace droply
