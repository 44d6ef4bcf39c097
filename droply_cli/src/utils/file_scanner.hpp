#ifndef DROPLY_FILE_SCANNER_HPP
#define DROPLY_FILE_SCANNER_HPP

#include <filesystem>
#include <vector>

/**
 * @brief Expands input paths into regular files.
 *
 * Directories are scanned one level deep, in name order. Junk files
 * (".DS_Store", "._*", "desktop.ini") are skipped.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs);

/// @return True for OS metadata files that are never worth compressing.
bool is_junk(const std::filesystem::path& p);

#endif // DROPLY_FILE_SCANNER_HPP
