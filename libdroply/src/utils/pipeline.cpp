#include "../../include/pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_type.hpp"
#include "../../include/filename_convention.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <chrono>
#include <numeric>

namespace droply {

static const char* pipeline_tag() {
    return "Pipeline";
}

static bool is_none(const std::string_view algo) {
    return algo == algo_none;
}

static std::uint64_t total_size(const std::vector<FileRecord>& files) {
    return std::accumulate(files.begin(), files.end(), std::uint64_t{0},
                           [](const std::uint64_t acc, const FileRecord& f) { return acc + f.data.size(); });
}

static EmbeddedMetadata make_embedded(const std::vector<FileRecord>& files, const std::string& algo,
                                      const std::optional<std::string>& archive) {
    EmbeddedMetadata meta;
    meta.algo = algo;
    meta.archive = archive;
    meta.created_at = iso8601_now();
    meta.files.reserve(files.size());
    for (const auto& f : files) {
        meta.files.push_back({ f.name, f.data.size() });
    }
    meta.total_original = total_size(files);
    return meta;
}

Pipeline::Pipeline(const PluginRegistry& registry, ModuleLoader& loader)
    : registry_(registry), loader_(loader) {}

int Pipeline::validate_compression(const std::string_view algo, const std::optional<int> level) const {
    if (is_none(algo)) {
        return 0;
    }
    return registry_.validate_compression(algo, level);
}

Pipeline::Plan Pipeline::validate(const std::vector<FileRecord>& files, const ProcessOptions& options) const {
    if (files.empty()) {
        throw ValidationError("No input files", "Provide at least one file");
    }
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (files[i].name.empty()) {
            throw ValidationError("File #" + std::to_string(i + 1) + " has an empty name");
        }
        if (files[i].data.empty()) {
            throw ValidationError("File '" + files[i].name + "' is empty");
        }
    }

    Plan plan;
    plan.compression = options.compression.algo;
    plan.level = validate_compression(plan.compression, options.compression.level);

    if (options.archive && !is_none(options.archive->algo)) {
        registry_.validate_archive(options.archive->algo);
    }

    if (files.size() > 1) {
        if (!options.archive) {
            plan.archive = "zip";
            registry_.validate_archive(*plan.archive);
        } else if (is_none(options.archive->algo)) {
            throw ValidationError("Multiple files require an archive format",
                                  "Supported archives: zip, tar");
        } else {
            plan.archive = options.archive->algo;
            plan.compress_inside = options.archive->compress_inside;
        }
    }
    if (plan.compress_inside && options.compression.level) {
        plan.inside_level = std::clamp(*options.compression.level, 1, 9);
    }

    if (options.embed_metadata && options.metadata_name.empty()) {
        throw ValidationError("Metadata entry name must not be empty");
    }
    ensure_no_reserved_names(files, options.allow_reserved_names);
    return plan;
}

Bytes Pipeline::compress_stream(const std::span<const std::uint8_t> data, const std::string_view algo,
                                const int level) {
    if (is_none(algo)) {
        return Bytes(data.begin(), data.end());
    }
    return loader_.compression(algo).compression().compress(data, level);
}

Bytes Pipeline::decompress_stream(const std::span<const std::uint8_t> data, const std::string_view algo) {
    if (is_none(algo)) {
        return Bytes(data.begin(), data.end());
    }
    return loader_.compression(algo).compression().decompress(data);
}

Bytes Pipeline::run(const std::vector<FileRecord>& files, const ProcessOptions& options, const Plan& plan) {
    Bytes payload;
    if (plan.archive) {
        std::vector<FileRecord> entries;
        entries.reserve(files.size() + 1);
        if (options.embed_metadata) {
            const auto meta = make_embedded(files, plan.compression, plan.archive);
            const auto json = embedded_metadata_to_json(meta);
            entries.push_back({ metadata_entry_path(options.metadata_name), Bytes(json.begin(), json.end()) });
        }
        entries.insert(entries.end(), files.begin(), files.end());
        payload = loader_.archive(*plan.archive).archive().pack(entries, plan.compress_inside, plan.inside_level);
        Logger::log(LogLevel::Debug, "Packed " + std::to_string(files.size()) + " file(s) as " + *plan.archive,
                    pipeline_tag());
    } else if (options.embed_metadata) {
        payload = append_metadata_trailer(files.front().data, make_embedded(files, plan.compression, std::nullopt));
    } else {
        payload = files.front().data;
    }
    return compress_stream(payload, plan.compression, plan.level);
}

Bytes Pipeline::process(const std::vector<FileRecord>& files, const ProcessOptions& options) {
    const auto plan = validate(files, options);
    return run(files, options, plan);
}

ProcessResult Pipeline::process_with_metadata(const std::vector<FileRecord>& files, const ProcessOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    const auto plan = validate(files, options);

    ProcessResult result;
    result.data = run(files, options, plan);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    auto& m = result.metadata;
    m.original_size = total_size(files);
    m.compressed_size = result.data.size();
    m.compression_ratio = m.original_size == 0
                              ? 0.0
                              : 1.0 - static_cast<double>(m.compressed_size) / static_cast<double>(m.original_size);
    m.compression_algo = plan.compression;
    m.archive_algo = plan.archive;
    if (!is_none(plan.compression)) {
        m.level = plan.level;
    }
    m.compress_inside = plan.compress_inside;
    m.metadata_embedded = options.embed_metadata;
    m.file_count = files.size();
    m.processing_time_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    m.timestamp = iso8601_now();

    m.per_file.reserve(files.size());
    for (const auto& f : files) {
        m.per_file.push_back({ f.name, f.data.size(),
                               "size_" + std::to_string(f.data.size()) + "_name_" + f.name });
    }
    m.checksums.original = "size_" + std::to_string(m.original_size) + "_count_" + std::to_string(files.size());
    m.checksums.compressed = "size_" + std::to_string(m.compressed_size) + "_algo_" + plan.compression;

    m.compatibility.min_version = options.embed_metadata ? std::string(meta_schema_version) : "1.0.0";
    if (!is_none(plan.compression)) {
        m.compatibility.required_modules.push_back("compression-" + plan.compression);
    }
    if (plan.archive) {
        m.compatibility.required_modules.push_back("archive-" + *plan.archive);
    }

    Logger::log(LogLevel::Info, "Processed " + std::to_string(files.size()) + " file(s): " +
                std::to_string(m.original_size) + " -> " + std::to_string(m.compressed_size) + " bytes (" +
                plan.compression + (plan.archive ? ", " + *plan.archive : std::string()) + ")", pipeline_tag());
    return result;
}

void Pipeline::check_header(const std::span<const std::uint8_t> data, const std::string_view algo) const {
    const auto sniffed = sniff_payload_format(data);
    const auto mismatch = [&](const std::string& detected) {
        throw AlgorithmMismatchError("Input looks like " + detected + ", not " + std::string(algo),
                                     "Try --algo " + detected);
    };

    if (algo == "gzip") {
        if (data.size() < 2) {
            throw CorruptInputError("Input is too short to be gzip data");
        }
        if (sniffed == PayloadFormat::Gzip) return;
        if (sniffed != PayloadFormat::Unknown) mismatch(payload_format_to_string(sniffed));
        throw AlgorithmMismatchError("Input has no gzip header");
    }
    if (algo == "zip") {
        if (data.size() < 4) {
            throw CorruptInputError("Input is too short to be a zip container");
        }
        if (sniffed == PayloadFormat::Zip) return;
        if (sniffed != PayloadFormat::Unknown) mismatch(payload_format_to_string(sniffed));
        throw AlgorithmMismatchError("Input has no zip header");
    }
    if (algo == "brotli" && (sniffed == PayloadFormat::Gzip || sniffed == PayloadFormat::Zip)) {
        mismatch(payload_format_to_string(sniffed));
    }
}

RestoreResult Pipeline::unpack_with_metadata(const std::span<const std::uint8_t> data, const std::string_view format) {
    const auto sniffed = sniff_payload_format(data);
    if (sniffed != PayloadFormat::Unknown && payload_format_to_string(sniffed) != format) {
        throw AlgorithmMismatchError("Archive looks like " + payload_format_to_string(sniffed) + ", not " +
                                     std::string(format));
    }

    auto entries = loader_.archive(format).archive().unpack(data);

    RestoreResult result;
    result.files.reserve(entries.size());
    for (auto& entry : entries) {
        if (is_metadata_entry(entry.name)) {
            auto parsed = parse_embedded_metadata(std::string_view(
                reinterpret_cast<const char*>(entry.data.data()), entry.data.size()));
            if (parsed) {
                if (!result.metadata) result.metadata = std::move(parsed);
                continue;
            }
        }
        result.files.push_back(std::move(entry));
    }

    for (std::size_t i = 0; i < result.files.size(); ++i) {
        if (result.files[i].name.empty()) {
            result.files[i].name = "file_" + std::to_string(i + 1);
        }
    }

    if (result.metadata) {
        const auto& declared = result.metadata->files;
        if (declared.size() == result.files.size()) {
            for (std::size_t i = 0; i < declared.size(); ++i) {
                if (!declared[i].name.empty() && declared[i].name != result.files[i].name) {
                    Logger::log(LogLevel::Debug, "Renaming '" + result.files[i].name + "' to '" +
                                declared[i].name + "'", pipeline_tag());
                    result.files[i].name = declared[i].name;
                }
            }
        } else {
            Logger::log(LogLevel::Warning, "Embedded metadata lists " + std::to_string(declared.size()) +
                        " file(s), archive holds " + std::to_string(result.files.size()), pipeline_tag());
        }
    }
    return result;
}

std::optional<RestoreResult> Pipeline::unpack_if_tagged(const std::span<const std::uint8_t> data,
                                                       const std::string_view format) {
    try {
        auto result = unpack_with_metadata(data, format);
        if (result.metadata) {
            return result;
        }
        Logger::log(LogLevel::Debug, "Payload is a " + std::string(format) +
                    " archive without droply metadata, restoring it as one file", pipeline_tag());
    } catch (const CorruptInputError& e) {
        Logger::log(LogLevel::Debug, "Payload looks like " + std::string(format) + " but does not unpack (" +
                    e.what() + "), restoring it as one file", pipeline_tag());
    }
    return std::nullopt;
}

RestoreResult Pipeline::restore_with_metadata(const std::span<const std::uint8_t> data, const RestoreOptions& options) {
    if (data.empty()) {
        throw ValidationError("No input data");
    }
    validate_compression(options.compression, std::nullopt);
    if (options.archive && !is_none(*options.archive)) {
        registry_.validate_archive(*options.archive);
    }

    check_header(data, options.compression);
    const auto decompressed = decompress_stream(data, options.compression);
    auto split = split_metadata_trailer(decompressed);
    const bool single = split.metadata && (!split.metadata->archive || is_none(*split.metadata->archive));

    if (single) {
        if (options.archive && !is_none(*options.archive)) {
            Logger::log(LogLevel::Debug, "Metadata trailer marks a single file, not unpacking as " +
                        *options.archive, pipeline_tag());
        }
    } else if (options.archive && !is_none(*options.archive)) {
        auto result = unpack_with_metadata(decompressed, *options.archive);
        Logger::log(LogLevel::Info, "Restored " + std::to_string(result.files.size()) + " file(s) from " +
                    *options.archive, pipeline_tag());
        return result;
    } else if (!options.archive) {
        const auto sniffed = sniff_payload_format(decompressed);
        const auto detected = payload_format_to_string(sniffed);
        if ((sniffed == PayloadFormat::Zip || sniffed == PayloadFormat::Tar) &&
            registry_.is_archive_supported(detected)) {
            if (auto result = unpack_if_tagged(decompressed, detected)) {
                Logger::log(LogLevel::Info, "Restored " + std::to_string(result->files.size()) +
                            " file(s) from detected " + detected, pipeline_tag());
                return std::move(*result);
            }
        }
    }

    RestoreResult result;
    std::string name = "file";
    if (split.metadata && split.metadata->files.size() == 1 && !split.metadata->files.front().name.empty()) {
        name = split.metadata->files.front().name;
    }
    result.files.push_back({ std::move(name), Bytes(split.payload.begin(), split.payload.end()) });
    result.metadata = std::move(split.metadata);
    Logger::log(LogLevel::Info, "Restored '" + result.files.front().name + "' (" +
                std::to_string(result.files.front().data.size()) + " bytes)", pipeline_tag());
    return result;
}

std::vector<FileRecord> Pipeline::restore(const std::span<const std::uint8_t> data, const RestoreOptions& options) {
    return restore_with_metadata(data, options).files;
}

Bytes Pipeline::compress(const std::span<const std::uint8_t> data, const std::string_view algo,
                         const std::optional<int> level) {
    if (data.empty()) {
        throw ValidationError("No input data");
    }
    const int effective = validate_compression(algo, level);
    return compress_stream(data, algo, effective);
}

Bytes Pipeline::decompress(const std::span<const std::uint8_t> data, const std::string_view algo) {
    if (data.empty()) {
        throw ValidationError("No input data");
    }
    validate_compression(algo, std::nullopt);
    check_header(data, algo);
    return decompress_stream(data, algo);
}

Bytes Pipeline::create_archive(const std::vector<FileRecord>& files, const std::string_view format,
                               const bool compress_inside, const std::optional<int> level) {
    if (files.empty()) {
        throw ValidationError("No input files");
    }
    registry_.validate_archive(format);
    return loader_.archive(format).archive().pack(files, compress_inside, level.value_or(6));
}

std::vector<FileRecord> Pipeline::extract_archive(const std::span<const std::uint8_t> data,
                                                  const std::string_view format) {
    if (data.empty()) {
        throw ValidationError("No input data");
    }
    registry_.validate_archive(format);
    return unpack_with_metadata(data, format).files;
}

std::vector<ArchiveListing> Pipeline::list_archive(const std::span<const std::uint8_t> data,
                                                   const std::string_view format) {
    std::vector<ArchiveListing> listing;
    for (const auto& f : extract_archive(data, format)) {
        listing.push_back({ f.name, f.data.size() });
    }
    return listing;
}

} // namespace droply
