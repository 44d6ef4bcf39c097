#ifndef DROPLY_MIME_DETECTOR_HPP
#define DROPLY_MIME_DETECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace droply {

    /**
     * @brief MIME type detection through libmagic.
     *
     * Used by the CLI to guess the algorithm of an input whose name carries
     * no known suffix.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detects the MIME type of a file.
         * @return MIME type (e.g. "application/gzip"), empty if libmagic is unavailable.
         */
        static std::string detect(const std::filesystem::path& path);

        /// Same as detect() for an in-memory buffer.
        static std::string detect_buffer(std::span<const std::uint8_t> data);
    };

} // namespace droply

#endif // DROPLY_MIME_DETECTOR_HPP
