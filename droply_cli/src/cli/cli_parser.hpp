#ifndef DROPLY_CLI_PARSER_HPP
#define DROPLY_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

enum class Command {
    None,
    Compress,
    Decompress,
    Info,
    Help
};

struct Settings {
    Command command = Command::None;

    // --- global ---
    bool verbose = false;
    bool debug = false;
    bool json = false;
    std::filesystem::path log_file;
    std::string platform;                ///< empty: detect

    // --- compress / decompress ---
    std::vector<std::filesystem::path> inputs;
    std::string algo;                    ///< empty: gzip on compress, inferred on decompress
    int level = -1;                      ///< -1: algorithm default
    std::string archive;                 ///< empty: zip for several files on compress, inferred on decompress
    bool compress_inside = false;
    std::filesystem::path output_path;
    std::filesystem::path output_dir;
    bool print_meta = false;
    std::string meta_format = "text";
    std::filesystem::path meta_path;
    std::string meta_name;
    bool no_meta = false;
    bool allow_user_meta = false;
    bool timestamp = false;
    std::string on_conflict = "ask";

    // --- help ---
    std::string help_topic;

    [[nodiscard]] bool should_embed_metadata() const { return !no_meta; }
};

/**
 * @brief Configures the CLI11 parser with every subcommand, option and flag.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct the options are mapped to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // DROPLY_CLI_PARSER_HPP
