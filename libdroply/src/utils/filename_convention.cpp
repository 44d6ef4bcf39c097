#include "../../include/filename_convention.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>

namespace droply {

namespace {

struct SuffixRule {
    std::string_view suffix;
    std::string_view archive;
    std::string_view compression;
};

// longest first; the lone ".zip" is resolved by ZipSuffixRole
constexpr std::array<SuffixRule, 10> suffix_rules{{
    {".tar.gz",  "tar",  "gzip"},
    {".tar.br",  "tar",  "brotli"},
    {".tar.zip", "tar",  "zip"},
    {".zip.gz",  "zip",  "gzip"},
    {".zip.br",  "zip",  "brotli"},
    {".zip.zip", "zip",  "zip"},
    {".gz",      "none", "gzip"},
    {".br",      "none", "brotli"},
    {".zip",     "zip",  "none"},
    {".tar",     "tar",  "none"},
}};

constexpr std::array<std::string_view, 3> archive_names{"none", "zip", "tar"};
constexpr std::array<std::string_view, 4> compression_names{"none", "gzip", "brotli", "zip"};

bool ends_with_icase(const std::string_view s, const std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return std::equal(suffix.begin(), suffix.end(), s.end() - static_cast<std::ptrdiff_t>(suffix.size()),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::string_view archive_extension(const std::string_view archive) {
    if (archive == "zip") return ".zip";
    if (archive == "tar") return ".tar";
    return "";
}

std::string_view compression_extension(const std::string_view compression) {
    if (compression == "gzip")   return ".gz";
    if (compression == "brotli") return ".br";
    if (compression == "zip")    return ".zip";
    return "";
}

} // namespace

std::string compose_extension(const std::string_view archive, const std::string_view compression) {
    if (std::ranges::find(archive_names, archive) == archive_names.end()) {
        throw ValidationError("Unknown archive format: '" + std::string(archive) + "'",
                              "Supported archive formats: zip, tar, none");
    }
    if (std::ranges::find(compression_names, compression) == compression_names.end()) {
        throw ValidationError("Unknown compression algorithm: '" + std::string(compression) + "'",
                              "Supported algorithms: gzip, brotli, zip, none");
    }
    return std::string(archive_extension(archive)) + std::string(compression_extension(compression));
}

ParsedFilename parse_extension(const std::string_view filename, const ZipSuffixRole zip_role) {
    for (const auto& rule : suffix_rules) {
        if (!ends_with_icase(filename, rule.suffix)) continue;

        ParsedFilename parsed;
        parsed.base_name = std::string(filename.substr(0, filename.size() - rule.suffix.size()));
        parsed.archive = std::string(rule.archive);
        parsed.compression = std::string(rule.compression);
        if (rule.suffix == ".zip" && zip_role == ZipSuffixRole::Compression) {
            parsed.archive = std::string(algo_none);
            parsed.compression = "zip";
        }
        return parsed;
    }
    return ParsedFilename{std::string(filename), std::string(algo_none), std::string(algo_none)};
}

std::string smart_filename(const std::string_view base_name, const SmartFilenameOptions& options) {
    const std::string extension = compose_extension(options.archive, options.compression);

    std::string base(base_name);
    if (options.strip_extension) {
        base = split_extension(base).first;
    }

    std::string name = options.prefix + base + options.suffix;
    if (options.timestamp && !options.timestamp->empty()) {
        name += "-" + *options.timestamp;
    }
    return name + extension;
}

std::string make_timestamp_token() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &utc);
    return std::string(buf, n);
}

FilenameValidation validate_filename_convention(const std::string_view filename) {
    FilenameValidation result;
    result.parsed = parse_extension(filename);

    if (filename.empty()) {
        result.issues.emplace_back("file name is empty");
        return result;
    }
    if (result.parsed.archive == algo_none && result.parsed.compression == algo_none) {
        result.issues.emplace_back("no recognized archive or compression suffix");
    }
    if (result.parsed.base_name.empty()) {
        result.issues.emplace_back("base name is empty");
    }
    result.valid = result.issues.empty();
    return result;
}

std::vector<std::string> supported_extensions() {
    std::vector<std::string> out;
    for (const auto archive : archive_names) {
        for (const auto compression : compression_names) {
            auto ext = compose_extension(archive, compression);
            if (!ext.empty() && std::ranges::find(out, ext) == out.end()) {
                out.push_back(std::move(ext));
            }
        }
    }
    std::ranges::stable_sort(out, [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    return out;
}

const std::vector<std::string>& known_suffixes() {
    static const std::vector<std::string> suffixes = [] {
        std::vector<std::string> v;
        for (const auto& rule : suffix_rules) v.emplace_back(rule.suffix);
        return v;
    }();
    return suffixes;
}

std::pair<std::string, std::string> split_extension(const std::string_view filename) {
    for (const auto& suffix : known_suffixes()) {
        if (filename.size() > suffix.size() && ends_with_icase(filename, suffix)) {
            const auto cut = filename.size() - suffix.size();
            return {std::string(filename.substr(0, cut)), std::string(filename.substr(cut))};
        }
    }
    const auto dot = filename.find('.', 1);
    if (dot == std::string_view::npos || filename.empty()) {
        return {std::string(filename), std::string()};
    }
    return {std::string(filename.substr(0, dot)), std::string(filename.substr(dot))};
}

} // namespace droply
