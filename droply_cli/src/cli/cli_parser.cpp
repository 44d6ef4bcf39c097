#include "cli_parser.hpp"
#include "../../../libdroply/include/embedded_metadata.hpp"
#include "../../../libdroply/include/platform.hpp"
#include <CLI/CLI.hpp>

namespace {

const std::vector<std::string> compression_choices{"gzip", "brotli", "zip", "none"};
const std::vector<std::string> archive_choices{"zip", "tar", "none"};
const std::vector<std::string> conflict_choices{"ask", "replace", "skip", "keep-both"};
const std::vector<std::string> meta_formats{"text", "json"};

// options shared by compress and decompress
void add_output_options(CLI::App& cmd, Settings& settings) {
    cmd.add_option("--output-dir", settings.output_dir,
                   "Directory for output files (default: current directory).");

    cmd.add_flag("--meta", settings.print_meta,
                 "Print metadata after the operation.");

    cmd.add_option("--meta-format", settings.meta_format,
                   "Metadata output format: text or json.")
        ->check(CLI::IsMember(meta_formats, CLI::ignore_case));

    cmd.add_option("--on-conflict", settings.on_conflict,
                   "What to do with existing outputs: ask, replace, skip, keep-both.")
        ->check(CLI::IsMember(conflict_choices, CLI::ignore_case));
}

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0.0");
    app.require_subcommand(0, 1);

    // --- global flags ---
    app.add_flag("-v,--verbose", settings.verbose, "Print informational messages.");
    app.add_flag("--debug", settings.debug, "Print debug messages.");
    app.add_flag("--json", settings.json, "Line-delimited JSON output for scripting.");
    app.add_option("--log-file", settings.log_file, "Also write logs to FILE.");
    app.add_option("--platform", settings.platform, "Execution target: server, browser, bundler.")
        ->check([](const std::string& str) {
            if (droply::parse_platform(str)) return std::string();
            return "Unknown platform '" + str + "'. Must be one of: server, browser, bundler.";
        });

    // --- compress ---
    auto* compress = app.add_subcommand("compress", "Compress files, archiving them when there are several.");
    compress->add_option("inputs", settings.inputs, "Files or directories to compress.")
        ->required()
        ->check(CLI::ExistingPath);
    compress->add_option("-a,--algo", settings.algo, "Compression algorithm: gzip, brotli, zip, none.")
        ->default_val("gzip")
        ->check(CLI::IsMember(compression_choices, CLI::ignore_case));
    compress->add_option("-l,--level", settings.level, "Compression level (gzip/zip 0-9, brotli 0-11).")
        ->check(CLI::NonNegativeNumber);
    compress->add_option("--archive", settings.archive, "Archive format for several files: zip, tar, none.")
        ->check(CLI::IsMember(archive_choices, CLI::ignore_case));
    compress->add_flag("--compress-inside", settings.compress_inside,
                       "Compress each archive entry as well.");
    compress->add_option("-o,--output", settings.output_path, "Output file.");
    compress->add_option("--meta-path", settings.meta_path, "Write the metadata JSON to FILE.");
    compress->add_option("--meta-name", settings.meta_name,
                         "Name of the embedded metadata entry.")
        ->default_val(std::string(droply::meta_name));
    compress->add_flag("--no-meta", settings.no_meta, "Don't embed metadata in the output.");
    compress->add_flag("--allow-user-meta", settings.allow_user_meta,
                       "Accept input files inside the reserved .droply/ directory.");
    compress->add_flag("--timestamp", settings.timestamp, "Insert a timestamp into the output name.");
    add_output_options(*compress, settings);
    compress->callback([&settings]() {
        settings.command = Command::Compress;
        if (!settings.output_path.empty() && !settings.output_dir.empty()) {
            throw CLI::ValidationError("-o,--output and --output-dir cannot be used together.");
        }
        if (settings.compress_inside && settings.archive == "none") {
            throw CLI::ValidationError("--compress-inside requires an archive.");
        }
    });

    // --- decompress ---
    auto* decompress = app.add_subcommand("decompress", "Restore the files stored in a compressed file.");
    decompress->add_option("input", settings.inputs, "Compressed file.")
        ->required()
        ->expected(1)
        ->check(CLI::ExistingFile);
    decompress->add_option("-a,--algo", settings.algo, "Compression algorithm (default: from the file name).")
        ->check(CLI::IsMember(compression_choices, CLI::ignore_case));
    decompress->add_option("--archive", settings.archive, "Archive format (default: from the file name).")
        ->check(CLI::IsMember(archive_choices, CLI::ignore_case));
    add_output_options(*decompress, settings);
    decompress->callback([&settings]() { settings.command = Command::Decompress; });

    // --- info ---
    auto* info = app.add_subcommand("info", "Show supported algorithms, or details about a file.");
    info->add_option("input", settings.inputs, "File to inspect.")
        ->expected(0, 1)
        ->check(CLI::ExistingFile);
    info->callback([&settings]() { settings.command = Command::Info; });

    // --- help ---
    auto* help = app.add_subcommand("help", "Show help on a topic: meta, archive, algo.");
    help->add_option("topic", settings.help_topic, "Help topic.")
        ->check(CLI::IsMember({"meta", "archive", "algo"}, CLI::ignore_case));
    help->callback([&settings]() { settings.command = Command::Help; });
}
