#include "commands.hpp"
#include "../report/meta_report.hpp"
#include "../utils/file_scanner.hpp"
#include "../utils/color.hpp"
#include "../utils/prompt_decision_provider.hpp"
#include "../../../libdroply/include/archive_codec.hpp"
#include "../../../libdroply/include/errors.hpp"
#include "../../../libdroply/include/file_type.hpp"
#include "../../../libdroply/include/file_utils.hpp"
#include "../../../libdroply/include/filename_convention.hpp"
#include "../../../libdroply/include/logger.hpp"
#include "../../../libdroply/include/mime_detector.hpp"
#include "../../../libdroply/include/output_writer.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using namespace droply;
namespace fs = std::filesystem;

namespace {

fs::path output_directory(const Settings& settings) {
    return settings.output_dir.empty() ? fs::path(".") : settings.output_dir;
}

std::string archive_for_name(const ProcessOptions& options, const std::size_t file_count) {
    if (file_count < 2) return std::string(algo_none);
    return options.archive ? options.archive->algo : "zip";
}

std::string base_name_for(const Settings& settings, const std::vector<FileRecord>& files, bool& strip) {
    const auto& first = settings.inputs.front();
    if (files.size() > 1 && settings.inputs.size() == 1 && fs::is_directory(first)) {
        strip = false;
        auto dir = fs::absolute(first).lexically_normal();
        if (!dir.has_filename()) dir = dir.parent_path();
        return dir.filename().string();
    }
    strip = files.size() > 1;
    return files.front().name;
}

} // namespace

std::shared_ptr<IDecisionProvider> make_decision_provider(const Settings& settings, const bool interactive) {
    if (settings.on_conflict == "ask") {
        if (interactive && !settings.json) {
            return std::make_shared<PromptDecisionProvider>(std::cin, std::cerr);
        }
        Logger::log(LogLevel::Debug, "No terminal to ask on, existing outputs are kept", "cli");
        return std::make_shared<AutoDecisionProvider>(ConflictAction::KeepBoth);
    }
    return std::make_shared<AutoDecisionProvider>(
        parse_conflict_action(settings.on_conflict).value_or(ConflictAction::KeepBoth));
}

int exit_code_for(const DroplyError& e) {
    const bool invalid = e.kind() == ErrorKind::Validation || e.kind() == ErrorKind::UnsupportedPlatform;
    return invalid ? 2 : 1;
}

static int report_error(const Settings& settings, const DroplyError& e) {
    if (settings.json) {
        nlohmann::json line = {
            {"type", "error"},
            {"kind", error_kind_to_string(e.kind())},
            {"message", e.what()},
        };
        if (!e.hint().empty()) line["hint"] = e.hint();
        std::cout << line.dump() << std::endl;
    } else {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        if (!e.hint().empty()) {
            std::cerr << CYAN << "Hint: " << e.hint() << RESET << std::endl;
        }
    }
    return exit_code_for(e);
}

int run_command(const Settings& settings, Droply& droply, EventBus& bus) {
    try {
        switch (settings.command) {
            case Command::Compress:   return run_compress(settings, droply, bus);
            case Command::Decompress: return run_decompress(settings, droply, bus);
            case Command::Info:       return run_info(settings, droply);
            case Command::Help:       return run_help(settings);
            case Command::None:       return run_help(settings);
        }
    } catch (const DroplyError& e) {
        Logger::log(LogLevel::Debug, std::string("Failed: ") + e.what(), "cli");
        return report_error(settings, e);
    }
    return 0;
}

int run_compress(const Settings& settings, Droply& droply, EventBus& bus) {
    const auto paths = collect_input_files(settings.inputs);
    if (paths.empty()) {
        throw ValidationError("No valid input files", "Directories are scanned one level deep");
    }

    std::vector<FileRecord> files;
    files.reserve(paths.size());
    for (const auto& p : paths) {
        files.push_back({ p.filename().string(), read_file(p) });
    }

    ProcessOptions options;
    options.compression.algo = settings.algo.empty() ? "gzip" : settings.algo;
    if (settings.level >= 0) options.compression.level = settings.level;
    if (!settings.archive.empty()) {
        options.archive = ArchiveOptions{ settings.archive, settings.compress_inside };
    } else if (settings.compress_inside) {
        options.archive = ArchiveOptions{ "zip", true };
    }
    options.embed_metadata = settings.should_embed_metadata();
    if (!settings.meta_name.empty()) options.metadata_name = settings.meta_name;
    options.allow_reserved_names = settings.allow_user_meta;

    const auto result = droply.processWithMetadata(files, options);

    fs::path target = settings.output_path;
    if (target.empty()) {
        SmartFilenameOptions naming;
        naming.archive = archive_for_name(options, files.size());
        naming.compression = options.compression.algo;
        if (settings.timestamp) naming.timestamp = make_timestamp_token();
        const auto base = base_name_for(settings, files, naming.strip_extension);
        target = output_directory(settings) / smart_filename(base, naming);
    }

    const ConflictResolver resolver(make_decision_provider(settings, stdin_is_terminal()));
    OutputWriter writer(resolver, &bus);
    writer.write(target, result.data);

    if (!settings.meta_path.empty()) {
        const auto json = process_metadata_to_json(result.metadata);
        write_file(settings.meta_path, std::span(reinterpret_cast<const std::uint8_t*>(json.data()), json.size()));
        Logger::log(LogLevel::Info, "Metadata written to " + settings.meta_path.string(), "cli");
    }
    if (settings.print_meta) {
        print_process_metadata(std::cout, result.metadata, settings.json ? "json" : settings.meta_format);
    }
    return 0;
}

RestoreOptions infer_restore_options(const fs::path& input, const std::string& algo, const std::string& archive) {
    auto parsed = parse_extension(input.filename().string());
    if (parsed.archive == "zip" && parsed.compression == algo_none && algo.empty() && archive.empty() &&
        ZipCompressionCodec::is_container(read_file(input))) {
        Logger::log(LogLevel::Debug, input.filename().string() + " is a zip compression container", "cli");
        parsed = parse_extension(input.filename().string(), ZipSuffixRole::Compression);
    }

    RestoreOptions options;
    options.compression = parsed.compression;
    if (parsed.archive != algo_none) {
        options.archive = parsed.archive;
    }

    if (parsed.compression == algo_none && parsed.archive == algo_none) {
        const auto mime = MimeDetector::detect(input);
        const auto it = mime_to_format.find(mime);
        const auto format = it != mime_to_format.end() ? it->second : PayloadFormat::Unknown;
        Logger::log(LogLevel::Debug, input.string() + ": MIME '" + mime + "'", "cli");
        if (format == PayloadFormat::Gzip) {
            options.compression = "gzip";
        } else if (format == PayloadFormat::Zip || format == PayloadFormat::Tar) {
            options.archive = payload_format_to_string(format);
        }
    }

    if (!algo.empty()) options.compression = algo;
    if (!archive.empty()) options.archive = archive;

    if (options.compression == algo_none && !options.archive && algo.empty()) {
        throw ValidationError("Cannot tell how " + input.filename().string() + " was compressed",
                              "Pass --algo and --archive");
    }
    return options;
}

int run_decompress(const Settings& settings, Droply& droply, EventBus& bus) {
    const auto& input = settings.inputs.front();
    const auto options = infer_restore_options(input, settings.algo, settings.archive);
    Logger::log(LogLevel::Info, "Restoring " + input.string() + " (" + options.compression + ", " +
                options.archive.value_or("auto") + ")", "cli");

    const auto data = read_file(input);
    auto result = droply.restoreWithMetadata(data, options);

    // single files restored without metadata take their name from the input
    if (!result.metadata && result.files.size() == 1 && result.files.front().name == "file") {
        const auto base = parse_extension(input.filename().string()).base_name;
        if (!base.empty()) result.files.front().name = base;
    }

    const ConflictResolver resolver(make_decision_provider(settings, stdin_is_terminal()));
    OutputWriter writer(resolver, &bus);
    const auto report = writer.write_all(output_directory(settings), result.files);

    if (settings.print_meta) {
        if (result.metadata) {
            print_embedded_metadata(std::cout, *result.metadata, settings.json ? "json" : settings.meta_format);
        } else {
            Logger::log(LogLevel::Warning, input.filename().string() + " carries no embedded metadata", "cli");
        }
    }
    return report.failed == 0 ? 0 : 1;
}

int run_info(const Settings& settings, Droply& droply) {
    if (settings.inputs.empty()) {
        print_registry(std::cout, droply.registry(), settings.json);
        return 0;
    }

    const auto& input = settings.inputs.front();
    const auto parsed = parse_extension(input.filename().string());
    const auto size = fs::file_size(input);
    const auto mime = MimeDetector::detect(input);

    std::optional<EmbeddedMetadata> metadata;
    std::string error;
    try {
        const auto options = infer_restore_options(input, {}, {});
        metadata = droply.restoreWithMetadata(read_file(input), options).metadata;
    } catch (const DroplyError& e) {
        error = e.what();
        Logger::log(LogLevel::Warning, "Cannot read " + input.string() + ": " + e.what(), "cli");
    }

    if (settings.json) {
        nlohmann::json doc = {
            {"file", input.string()},
            {"size", size},
            {"mime", mime},
            {"baseName", parsed.base_name},
            {"archive", parsed.archive},
            {"compression", parsed.compression},
            {"metadata", metadata ? nlohmann::json::parse(embedded_metadata_to_json(*metadata)) : nlohmann::json()},
        };
        if (!error.empty()) doc["error"] = error;
        std::cout << doc.dump(2) << '\n';
        return 0;
    }

    std::cout << input.filename().string() << '\n'
              << "  size:        " << human_size(size) << '\n'
              << "  mime:        " << (mime.empty() ? "unknown" : mime) << '\n'
              << "  base name:   " << parsed.base_name << '\n'
              << "  archive:     " << parsed.archive << '\n'
              << "  compression: " << parsed.compression << '\n';
    if (metadata) {
        print_embedded_metadata(std::cout, *metadata, "text");
    } else {
        std::cout << "  no embedded metadata" << (error.empty() ? "" : " (" + error + ")") << '\n';
    }
    return 0;
}

int run_help(const Settings& settings) {
    const auto& topic = settings.help_topic;
    if (topic == "meta") {
        std::cout <<
            "Embedded metadata\n"
            "  compress stores the original file names and sizes inside the output, so\n"
            "  decompress can restore the names without a side channel.\n"
            "  Archives carry it as the first entry, .droply/__droply_meta.json;\n"
            "  single files carry it as a trailer after the file bytes.\n"
            "  --no-meta          don't embed it\n"
            "  --meta-name NAME   entry name inside .droply/\n"
            "  --allow-user-meta  accept input files under .droply/\n"
            "  --meta             print it after the operation (--meta-format text|json)\n";
    } else if (topic == "archive") {
        std::cout <<
            "Archives\n"
            "  Several input files are packed into one archive, then compressed.\n"
            "  --archive zip|tar|none   (default zip; none fails for several files)\n"
            "  --compress-inside        compress entries too (zip only)\n"
            "  Names: report.zip.gz, report.tar.br, report.zip\n";
    } else if (topic == "algo") {
        std::cout <<
            "Algorithms\n"
            "  gzip    .gz   levels 0-9  (default 6)\n"
            "  brotli  .br   levels 0-11 (default 6)\n"
            "  zip     .zip  levels 0-9  (single-entry container)\n"
            "  none          no compression\n"
            "  Run 'droply info' for what the current platform supports.\n";
    } else {
        std::cout <<
            "droply compress <inputs...> [-a ALGO] [-l LEVEL] [--archive FMT] [-o FILE]\n"
            "droply decompress <file> [--output-dir DIR]\n"
            "droply info [file]\n"
            "droply help meta|archive|algo\n";
    }
    return 0;
}
