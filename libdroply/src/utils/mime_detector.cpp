#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>

namespace droply {

namespace {

struct MagicCloser {
    void operator()(const magic_t m) const noexcept { magic_close(m); }
};
using MagicPtr = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

MagicPtr open_magic() {
    MagicPtr magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        Logger::log(LogLevel::Warning, "magic_open failed", "libmagic");
        return nullptr;
    }
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") +
                    (magic_error(magic.get()) ? magic_error(magic.get()) : "unknown error"), "libmagic");
        return nullptr;
    }
    return magic;
}

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path) {
    const auto magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_file(magic.get(), path.string().c_str());
    return mime ? mime : "";
}

std::string MimeDetector::detect_buffer(const std::span<const std::uint8_t> data) {
    const auto magic = open_magic();
    if (!magic) return {};
    const char* mime = magic_buffer(magic.get(), data.data(), data.size());
    return mime ? mime : "";
}

} // namespace droply
