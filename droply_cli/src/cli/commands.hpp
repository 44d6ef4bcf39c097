#ifndef DROPLY_COMMANDS_HPP
#define DROPLY_COMMANDS_HPP

#include "cli_parser.hpp"
#include "../../../libdroply/include/conflict_resolver.hpp"
#include "../../../libdroply/include/droply.hpp"
#include "../../../libdroply/include/errors.hpp"
#include "../../../libdroply/include/event_bus.hpp"
#include <memory>

/**
 * @brief Subcommand implementations.
 *
 * Each returns the process exit code on success; failures are thrown as
 * droply::DroplyError and mapped to exit codes by main().
 */

int run_compress(const Settings& settings, droply::Droply& droply, droply::EventBus& bus);

int run_decompress(const Settings& settings, droply::Droply& droply, droply::EventBus& bus);

int run_info(const Settings& settings, droply::Droply& droply);

int run_help(const Settings& settings);

/**
 * @brief Runs settings.command, reporting a DroplyError on stderr (or as a
 * JSON line with --json).
 * @return The command's exit code, or exit_code_for() the error.
 */
int run_command(const Settings& settings, droply::Droply& droply, droply::EventBus& bus);

/// 2 for invalid requests (validation, unsupported platform), 1 for everything else.
int exit_code_for(const droply::DroplyError& e);

/**
 * @brief Picks who settles output conflicts.
 * "ask" prompts on the terminal when interactive, and keeps both files otherwise.
 */
std::shared_ptr<droply::IDecisionProvider> make_decision_provider(const Settings& settings, bool interactive);

/**
 * @brief Works out how a compressed file should be restored.
 *
 * The file name is parsed first, libmagic fills in what the name leaves
 * open, and explicit --algo/--archive options override both. A bare ".zip"
 * holding only a zip compression container is restored as compression.
 */
droply::RestoreOptions infer_restore_options(const std::filesystem::path& input,
                                             const std::string& algo,
                                             const std::string& archive);

#endif // DROPLY_COMMANDS_HPP
