#include "../../include/process_metadata.hpp"
#include <nlohmann/json.hpp>
#include <ctime>

namespace droply {

std::string process_metadata_to_json(const ProcessMetadata& m, const int indent) {
    nlohmann::json per_file = nlohmann::json::array();
    for (const auto& f : m.per_file) {
        per_file.push_back({{"name", f.name}, {"originalSize", f.original_size}, {"checksum", f.checksum}});
    }

    nlohmann::json doc = {
        {"originalSize", m.original_size},
        {"compressedSize", m.compressed_size},
        {"compressionRatio", m.compression_ratio},
        {"compressionAlgo", m.compression_algo},
        {"archiveAlgo", m.archive_algo ? nlohmann::json(*m.archive_algo) : nlohmann::json(nullptr)},
        {"level", m.level ? nlohmann::json(*m.level) : nlohmann::json(nullptr)},
        {"compressInside", m.compress_inside},
        {"metadataEmbedded", m.metadata_embedded},
        {"fileCount", m.file_count},
        {"processingTimeMs", m.processing_time_ms},
        {"timestamp", m.timestamp},
        {"perFile", per_file},
        {"checksums", {{"original", m.checksums.original}, {"compressed", m.checksums.compressed}}},
        {"compatibility", {{"minVersion", m.compatibility.min_version},
                           {"requiredModules", m.compatibility.required_modules}}},
    };
    return doc.dump(indent);
}

std::string iso8601_now() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf, n);
}

} // namespace droply
