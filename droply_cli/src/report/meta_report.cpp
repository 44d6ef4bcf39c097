#include "meta_report.hpp"
#include "../utils/color.hpp"
#include "../../../libdroply/include/filename_convention.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <ostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace droply;

bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

std::string human_size(const std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    if (unit == 0) ss << bytes << " B";
    else ss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return ss.str();
}

static std::string rule() {
    return std::string(std::min(get_terminal_width(), 60u), '-');
}

static const char* bold() { return is_stdout_a_tty() ? BOLD : ""; }
static const char* reset() { return is_stdout_a_tty() ? RESET : ""; }

static void row(std::ostream& os, const std::string& key, const std::string& value) {
    os << "  " << std::left << std::setw(18) << key << value << '\n';
}

void print_process_metadata(std::ostream& os, const ProcessMetadata& m, const std::string& format) {
    if (format == "json") {
        os << process_metadata_to_json(m) << '\n';
        return;
    }
    std::ostringstream ratio;
    ratio << std::fixed << std::setprecision(1) << m.compression_ratio * 100.0 << "%";
    std::ostringstream ms;
    ms << std::fixed << std::setprecision(1) << m.processing_time_ms << " ms";

    os << bold() << "Metadata" << reset() << '\n' << rule() << '\n';
    row(os, "Files", std::to_string(m.file_count));
    row(os, "Original size", human_size(m.original_size));
    row(os, "Compressed size", human_size(m.compressed_size));
    row(os, "Ratio", ratio.str());
    row(os, "Algorithm", m.compression_algo + (m.level ? " (level " + std::to_string(*m.level) + ")" : ""));
    row(os, "Archive", m.archive_algo.value_or("none") + (m.compress_inside ? " (entries compressed)" : ""));
    row(os, "Embedded meta", m.metadata_embedded ? "yes" : "no");
    row(os, "Time", ms.str());
    row(os, "Timestamp", m.timestamp);
    for (const auto& f : m.per_file) {
        row(os, "  " + f.name, human_size(f.original_size));
    }
    os << rule() << '\n';
}

void print_embedded_metadata(std::ostream& os, const EmbeddedMetadata& m, const std::string& format) {
    if (format == "json") {
        os << embedded_metadata_to_json(m) << '\n';
        return;
    }
    os << bold() << "Embedded metadata" << reset() << '\n' << rule() << '\n';
    row(os, "Schema", m.schema_version);
    row(os, "Operation", m.operation);
    row(os, "Algorithm", m.algo);
    row(os, "Archive", m.archive.value_or("none"));
    row(os, "Created", m.created_at);
    row(os, "Total size", human_size(m.total_original));
    for (const auto& f : m.files) {
        row(os, "  " + f.name, human_size(f.original_size));
    }
    os << rule() << '\n';
}

void print_registry(std::ostream& os, const PluginRegistry& registry, const bool json) {
    const auto describe_all = [&](const std::vector<std::string>& names, const PluginKind kind) {
        std::vector<PluginDescriptor> out;
        for (const auto& name : names) {
            if (auto d = registry.describe(name, kind)) out.push_back(std::move(*d));
        }
        return out;
    };
    const auto compression = describe_all(registry.compression_algorithms(), PluginKind::Compression);
    const auto archives = describe_all(registry.archive_formats(), PluginKind::Archive);

    if (json) {
        const auto to_json = [](const PluginDescriptor& d) {
            nlohmann::json j = {
                {"name", d.name},
                {"package", d.package},
                {"version", d.version},
                {"description", d.description},
                {"extensions", d.extensions},
            };
            if (d.levels) {
                j["levels"] = {{"min", d.levels->min}, {"max", d.levels->max}, {"default", d.levels->default_level}};
            }
            return j;
        };
        nlohmann::json doc = {
            {"version", registry.version()},
            {"platform", platform_to_string(registry.current_platform())},
            {"compression", nlohmann::json::array()},
            {"archives", nlohmann::json::array()},
            {"extensions", supported_extensions()},
        };
        for (const auto& d : compression) doc["compression"].push_back(to_json(d));
        for (const auto& d : archives) doc["archives"].push_back(to_json(d));
        os << doc.dump(2) << '\n';
        return;
    }

    const auto join = [](const std::vector<std::string>& v) {
        std::string s;
        for (const auto& e : v) s += (s.empty() ? "" : " ") + e;
        return s;
    };

    os << bold() << "droply registry v" << registry.version() << reset()
       << " (platform: " << platform_to_string(registry.current_platform()) << ")\n" << rule() << '\n';
    os << "Compression:\n";
    for (const auto& d : compression) {
        std::string levels;
        if (d.levels) {
            levels = " levels " + std::to_string(d.levels->min) + "-" + std::to_string(d.levels->max) +
                     " (default " + std::to_string(d.levels->default_level) + ")";
        }
        row(os, d.name, d.version + "  " + join(d.extensions) + levels);
    }
    os << "Archives:\n";
    for (const auto& d : archives) {
        row(os, d.name, d.version + "  " + join(d.extensions));
    }
    os << "Extensions:\n  " << join(supported_extensions()) << '\n' << rule() << '\n';
}
