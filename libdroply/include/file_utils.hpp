#ifndef DROPLY_FILE_UTILS_HPP
#define DROPLY_FILE_UTILS_HPP

#include "codec.hpp"
#include <cstdio>
#include <filesystem>
#include <span>

namespace droply {

    /**
     * @brief Opens a file with the C stdio API.
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Reads a whole file into memory.
     * @throws IoError if the file cannot be opened or read.
     */
    Bytes read_file(const std::filesystem::path& path);

    /**
     * @brief Writes bytes to a file, truncating it.
     * @throws IoError if the file cannot be opened or fully written.
     */
    void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data);

} // namespace droply

#endif // DROPLY_FILE_UTILS_HPP
