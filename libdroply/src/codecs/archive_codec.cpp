#include "../../include/archive_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <ctime>
#include <memory>
#include <new>
#include <string>
#include <vector>

namespace droply {

namespace {

const char* codec_tag() {
    return "ArchiveCodec";
}

enum class Layout { Zip, Tar };

const char* layout_name(const Layout layout) {
    return layout == Layout::Zip ? "zip" : "tar";
}

using WriteHandle = std::unique_ptr<archive, decltype(&archive_write_free)>;
using ReadHandle = std::unique_ptr<archive, decltype(&archive_read_free)>;
using EntryHandle = std::unique_ptr<archive_entry, decltype(&archive_entry_free)>;

std::string error_of(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

la_ssize_t append_to_buffer(archive*, void* client, const void* buffer, const size_t length) {
    auto* out = static_cast<Bytes*>(client);
    const auto* p = static_cast<const std::uint8_t*>(buffer);
    out->insert(out->end(), p, p + length);
    return static_cast<la_ssize_t>(length);
}

void set_zip_option(archive* a, const char* key, const std::string& value) {
    const int r = archive_write_set_format_option(a, "zip", key, value.c_str());
    if (r != ARCHIVE_OK) {
        Logger::log(LogLevel::Warning, std::string("zip option ") + key + "=" + value +
                    " not applied: " + error_of(a), codec_tag());
    }
}

Bytes write_archive(const std::vector<FileRecord>& files, const Layout layout, const bool deflate, const int level) {
    WriteHandle a(archive_write_new(), &archive_write_free);
    if (!a) throw std::bad_alloc();

    int r = ARCHIVE_OK;
    switch (layout) {
        case Layout::Zip:
            r = archive_write_set_format_zip(a.get());
            if (r == ARCHIVE_OK) {
                set_zip_option(a.get(), "compression", deflate ? "deflate" : "store");
                if (deflate) {
                    set_zip_option(a.get(), "compression-level", std::to_string(level));
                }
            }
            break;
        case Layout::Tar:
            r = archive_write_set_format_gnutar(a.get());
            if (r == ARCHIVE_OK) {
                // no padding to a full 10 KiB record
                r = archive_write_set_bytes_in_last_block(a.get(), 1);
            }
            break;
    }
    if (r != ARCHIVE_OK) {
        throw std::runtime_error(std::string("Setting ") + layout_name(layout) + " format failed: " + error_of(a.get()));
    }

    Bytes out;
    r = archive_write_open(a.get(), &out, nullptr, &append_to_buffer, nullptr);
    if (r != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_open: " + error_of(a.get()));
    }

    const auto now = std::time(nullptr);
    for (const auto& file : files) {
        EntryHandle entry(archive_entry_new(), &archive_entry_free);
        if (!entry) throw std::bad_alloc();
        archive_entry_set_pathname(entry.get(), file.name.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(file.data.size()));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_mtime(entry.get(), now, 0);

        r = archive_write_header(a.get(), entry.get());
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(a.get()), codec_tag());
        } else if (r != ARCHIVE_OK) {
            throw std::runtime_error("archive_write_header (" + file.name + "): " + error_of(a.get()));
        }

        std::size_t written = 0;
        while (written < file.data.size()) {
            const la_ssize_t n = archive_write_data(a.get(), file.data.data() + written, file.data.size() - written);
            if (n <= 0) {
                throw std::runtime_error("archive_write_data (" + file.name + "): " + error_of(a.get()));
            }
            written += static_cast<std::size_t>(n);
        }
    }

    r = archive_write_close(a.get());
    if (r != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_close: " + error_of(a.get()));
    }

    Logger::log(LogLevel::Debug, std::string("Packed ") + std::to_string(files.size()) + " entries into " +
                std::to_string(out.size()) + " byte " + layout_name(layout), codec_tag());
    return out;
}

std::vector<FileRecord> read_archive(const std::span<const std::uint8_t> input, const Layout layout) {
    ReadHandle a(archive_read_new(), &archive_read_free);
    if (!a) throw std::bad_alloc();

    if (layout == Layout::Zip) {
        archive_read_support_format_zip(a.get());
    } else {
        archive_read_support_format_tar(a.get());
        archive_read_support_format_gnutar(a.get());
    }

    int r = archive_read_open_memory(a.get(), input.data(), input.size());
    if (r != ARCHIVE_OK) {
        throw CorruptInputError(std::string("Not a readable ") + layout_name(layout) + " archive: " + error_of(a.get()));
    }

    std::vector<FileRecord> files;
    std::vector<std::uint8_t> buffer(64 * 1024);
    archive_entry* entry = nullptr;

    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_of(a.get()), codec_tag());
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(a.get());
            continue;
        }

        FileRecord record;
        const char* path = archive_entry_pathname(entry);
        record.name = path ? path : "";

        la_ssize_t size_read = 0;
        while ((size_read = archive_read_data(a.get(), buffer.data(), buffer.size())) > 0) {
            record.data.insert(record.data.end(), buffer.begin(), buffer.begin() + size_read);
        }
        if (size_read < 0) {
            throw CorruptInputError("Error reading entry '" + record.name + "': " + error_of(a.get()));
        }
        files.push_back(std::move(record));
    }

    if (r != ARCHIVE_EOF) {
        throw CorruptInputError(std::string("Malformed ") + layout_name(layout) + " archive: " + error_of(a.get()));
    }
    return files;
}

} // namespace

Bytes ZipArchiveCodec::pack(const std::vector<FileRecord>& files, const bool compress_inside, const int level) const {
    if (compress_inside && (level < 1 || level > 9)) {
        throw ValidationError("Deflate level " + std::to_string(level) + " is out of range (1-9)");
    }
    return write_archive(files, Layout::Zip, compress_inside, level);
}

std::vector<FileRecord> ZipArchiveCodec::unpack(const std::span<const std::uint8_t> input) const {
    return read_archive(input, Layout::Zip);
}

Bytes TarArchiveCodec::pack(const std::vector<FileRecord>& files, const bool compress_inside, int) const {
    if (compress_inside) {
        Logger::log(LogLevel::Debug, "tar has no per-entry compression, compress-inside ignored", codec_tag());
    }
    return write_archive(files, Layout::Tar, false, 0);
}

std::vector<FileRecord> TarArchiveCodec::unpack(const std::span<const std::uint8_t> input) const {
    return read_archive(input, Layout::Tar);
}

Bytes ZipCompressionCodec::compress(const std::span<const std::uint8_t> input, const int level) const {
    std::vector<FileRecord> single;
    single.push_back(FileRecord{std::string(entry_name), Bytes(input.begin(), input.end())});
    return write_archive(single, Layout::Zip, level > 0, level);
}

Bytes ZipCompressionCodec::decompress(const std::span<const std::uint8_t> input) const {
    auto entries = read_archive(input, Layout::Zip);
    if (entries.empty()) {
        throw CorruptInputError("zip container holds no file entry");
    }
    if (entries.size() > 1) {
        Logger::log(LogLevel::Warning, "zip container holds " + std::to_string(entries.size()) +
                    " entries, using the first one ('" + entries.front().name + "')", codec_tag());
    }
    return std::move(entries.front().data);
}

bool ZipCompressionCodec::is_container(const std::span<const std::uint8_t> input) {
    const auto entries = read_archive(input, Layout::Zip);
    return entries.size() == 1 && entries.front().name == entry_name;
}

} // namespace droply
