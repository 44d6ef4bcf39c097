#include "file_scanner.hpp"
#include "../../../libdroply/include/logger.hpp"
#include <algorithm>

namespace fs = std::filesystem;
using droply::Logger;
using droply::LogLevel;

bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    return name == ".ds_store" || name == "desktop.ini";
}

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs) {
    std::vector<fs::path> result;

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in, ec)) {
            std::vector<fs::path> entries;
            for (const auto& e : fs::directory_iterator(in)) {
                if (e.is_regular_file() && !is_junk(e.path())) {
                    entries.push_back(e.path());
                } else if (e.is_directory()) {
                    Logger::log(LogLevel::Debug, "Not descending into " + e.path().string(), "scanner");
                }
            }
            std::ranges::sort(entries);
            result.insert(result.end(), entries.begin(), entries.end());
        } else if (fs::is_regular_file(in, ec) && !is_junk(in)) {
            result.push_back(in);
        } else {
            Logger::log(LogLevel::Debug, "Skipping " + in.string(), "scanner");
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
