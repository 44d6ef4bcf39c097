#include "../../include/file_utils.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <memory>

namespace droply {

    namespace {
        struct FileCloser {
            void operator()(FILE* f) const noexcept {
                if (f) std::fclose(f);
            }
        };
        using FilePtr = std::unique_ptr<FILE, FileCloser>;
    }

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.string().c_str(), mode);
    }

    Bytes read_file(const std::filesystem::path& path) {
        const FilePtr f(open_file(path, "rb"));
        if (!f) {
            throw IoError("Cannot open " + path.string() + " for reading");
        }
        Bytes data;
        std::uint8_t buf[64 * 1024];
        std::size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (std::ferror(f.get())) {
            throw IoError("Read error on " + path.string());
        }
        Logger::log(LogLevel::Debug, "Read " + std::to_string(data.size()) + " bytes from " + path.string(),
                    "file_utils");
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::span<const std::uint8_t> data) {
        FilePtr f(open_file(path, "wb"));
        if (!f) {
            throw IoError("Cannot open " + path.string() + " for writing");
        }
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) {
            throw IoError("Short write on " + path.string());
        }
        if (std::fclose(f.release()) != 0) {
            throw IoError("Cannot close " + path.string());
        }
    }

} // namespace droply
