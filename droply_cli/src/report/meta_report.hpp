#ifndef DROPLY_META_REPORT_HPP
#define DROPLY_META_REPORT_HPP

#include "../../../libdroply/include/embedded_metadata.hpp"
#include "../../../libdroply/include/plugin_registry.hpp"
#include "../../../libdroply/include/process_metadata.hpp"
#include <iosfwd>
#include <string>

/// @return Width of the terminal attached to stdout, 80 if unknown.
unsigned get_terminal_width();

bool is_stdout_a_tty();

/**
 * @brief Prints a ProcessMetadata record.
 * @param format "text" or "json".
 */
void print_process_metadata(std::ostream& os, const droply::ProcessMetadata& metadata, const std::string& format);

/// Prints a metadata record recovered from a compressed file.
void print_embedded_metadata(std::ostream& os, const droply::EmbeddedMetadata& metadata, const std::string& format);

/// Prints versions, platform, algorithms, formats and extensions known to the registry.
void print_registry(std::ostream& os, const droply::PluginRegistry& registry, bool json);

/// @return "1.5 KB"-style size.
std::string human_size(std::uint64_t bytes);

#endif // DROPLY_META_REPORT_HPP
