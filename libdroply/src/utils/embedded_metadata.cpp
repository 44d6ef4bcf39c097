#include "../../include/embedded_metadata.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace droply {

namespace {

const char* metadata_tag() {
    return "EmbeddedMetadata";
}

constexpr std::size_t length_field_size = 4;

} // namespace

std::string embedded_metadata_to_json(const EmbeddedMetadata& metadata) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& f : metadata.files) {
        files.push_back({{"name", f.name}, {"originalSize", f.original_size}});
    }

    nlohmann::json doc = {
        {"schemaVersion", metadata.schema_version},
        {"operation", metadata.operation},
        {"algo", metadata.algo},
        {"archive", metadata.archive ? nlohmann::json(*metadata.archive) : nlohmann::json(nullptr)},
        {"createdAt", metadata.created_at},
        {"files", files},
        {"totals", {{"original", metadata.total_original}}},
    };
    return doc.dump(2);
}

std::optional<EmbeddedMetadata> parse_embedded_metadata(const std::string_view json) {
    try {
        const auto doc = nlohmann::json::parse(json.begin(), json.end());
        EmbeddedMetadata m;
        m.schema_version = doc.value("schemaVersion", std::string(meta_schema_version));
        m.operation = doc.value("operation", std::string("compress"));
        m.algo = doc.value("algo", std::string());
        if (doc.contains("archive") && doc.at("archive").is_string()) {
            m.archive = doc.at("archive").get<std::string>();
        }
        m.created_at = doc.value("createdAt", std::string());
        for (const auto& f : doc.at("files")) {
            m.files.push_back(EmbeddedFile{f.at("name").get<std::string>(),
                                           f.value("originalSize", std::uint64_t{0})});
        }
        if (doc.contains("totals")) {
            m.total_original = doc.at("totals").value("original", std::uint64_t{0});
        }
        return m;
    } catch (const nlohmann::json::exception& e) {
        Logger::log(LogLevel::Warning, std::string("Ignoring malformed embedded metadata: ") + e.what(), metadata_tag());
        return std::nullopt;
    }
}

std::string metadata_entry_path(const std::string_view name) {
    return std::string(meta_dir) + "/" + std::string(name);
}

bool is_metadata_entry(const std::string_view entry_name) {
    if (entry_name == legacy_meta_entry) return true;
    return entry_name.size() > meta_dir.size() + 1 &&
           entry_name.starts_with(meta_dir) &&
           entry_name[meta_dir.size()] == '/';
}

bool is_reserved_name(const std::string_view name) {
    const std::string dir(meta_dir);
    return name == dir ||
           name.starts_with(dir + "/") ||
           name.find("/" + dir + "/") != std::string_view::npos ||
           name == legacy_meta_entry;
}

void ensure_no_reserved_names(const std::vector<FileRecord>& files, const bool allow) {
    if (allow) return;

    std::vector<std::string> offenders;
    for (const auto& f : files) {
        if (is_reserved_name(f.name)) offenders.push_back(f.name);
    }
    if (offenders.empty()) return;

    std::string details;
    for (std::size_t i = 0; i < offenders.size() && i < 3; ++i) {
        if (i) details += ", ";
        details += offenders[i];
    }
    if (offenders.size() > 3) details += ", ...";

    throw ValidationError("Input contains reserved path '" + std::string(meta_dir) + "/' (" + details + ")",
                          "This path holds droply metadata inside archives. Re-run with --allow-user-meta to bypass.");
}

Bytes append_metadata_trailer(const std::span<const std::uint8_t> payload, const EmbeddedMetadata& metadata) {
    const std::string json = embedded_metadata_to_json(metadata);
    const auto len = static_cast<std::uint32_t>(json.size());

    Bytes out;
    out.reserve(payload.size() + json.size() + length_field_size + meta_trailer_marker.size());
    out.insert(out.end(), payload.begin(), payload.end());
    out.insert(out.end(), json.begin(), json.end());
    out.push_back(static_cast<std::uint8_t>(len >> 24));
    out.push_back(static_cast<std::uint8_t>(len >> 16));
    out.push_back(static_cast<std::uint8_t>(len >> 8));
    out.push_back(static_cast<std::uint8_t>(len));
    out.insert(out.end(), meta_trailer_marker.begin(), meta_trailer_marker.end());
    return out;
}

TrailerSplit split_metadata_trailer(const std::span<const std::uint8_t> data) {
    const std::size_t footer = length_field_size + meta_trailer_marker.size();
    if (data.size() < footer) {
        return {data, std::nullopt};
    }

    const auto marker = data.subspan(data.size() - meta_trailer_marker.size());
    if (!std::equal(marker.begin(), marker.end(), meta_trailer_marker.begin())) {
        return {data, std::nullopt};
    }

    const auto* len_bytes = data.data() + data.size() - footer;
    const std::uint32_t len = (static_cast<std::uint32_t>(len_bytes[0]) << 24) |
                              (static_cast<std::uint32_t>(len_bytes[1]) << 16) |
                              (static_cast<std::uint32_t>(len_bytes[2]) << 8) |
                              static_cast<std::uint32_t>(len_bytes[3]);
    if (len > data.size() - footer) {
        Logger::log(LogLevel::Warning, "Metadata trailer length exceeds payload, treating as plain data", metadata_tag());
        return {data, std::nullopt};
    }

    const std::size_t json_start = data.size() - footer - len;
    const std::string_view json(reinterpret_cast<const char*>(data.data() + json_start), len);
    auto metadata = parse_embedded_metadata(json);
    if (!metadata) {
        return {data, std::nullopt};
    }
    return {data.first(json_start), std::move(metadata)};
}

} // namespace droply
