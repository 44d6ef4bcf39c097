/**
 * @file errors.hpp
 * @brief Exception types raised by the droply pipeline.
 */

#ifndef DROPLY_ERRORS_HPP
#define DROPLY_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace droply {

/**
 * @brief Classification of every failure the library can surface.
 */
enum class ErrorKind {
    Validation,          ///< Bad algorithm, format, level or empty input
    UnsupportedPlatform, ///< Known algorithm, not available on the current platform
    LoadFailure,         ///< Neither the native module nor the built-in codec could be loaded
    CorruptInput,        ///< Restore could not parse the supplied bytes
    AlgorithmMismatch,   ///< Header inconsistent with the declared algorithm
    ConflictExhausted,   ///< No free numbered name within the attempt ceiling
    Io                   ///< Filesystem read/write failure
};

inline const char* error_kind_to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:          return "validation";
        case ErrorKind::UnsupportedPlatform: return "unsupported-platform";
        case ErrorKind::LoadFailure:         return "load-failure";
        case ErrorKind::CorruptInput:        return "corrupt-input";
        case ErrorKind::AlgorithmMismatch:   return "algorithm-mismatch";
        case ErrorKind::ConflictExhausted:   return "conflict-exhausted";
        case ErrorKind::Io:                  return "io";
    }
    return "unknown";
}

/**
 * @brief Base class of all droply exceptions.
 *
 * Carries the error kind and a short, user-facing hint
 * (e.g. "Supported algorithms: gzip, brotli, zip").
 */
class DroplyError : public std::runtime_error {
public:
    DroplyError(const ErrorKind kind, const std::string& message, std::string hint = {})
        : std::runtime_error(message), kind_(kind), hint_(std::move(hint)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& hint() const noexcept { return hint_; }

private:
    ErrorKind kind_;
    std::string hint_;
};

class ValidationError final : public DroplyError {
public:
    explicit ValidationError(const std::string& message, std::string hint = {})
        : DroplyError(ErrorKind::Validation, message, std::move(hint)) {}
};

class UnsupportedPlatformError final : public DroplyError {
public:
    explicit UnsupportedPlatformError(const std::string& message, std::string hint = {})
        : DroplyError(ErrorKind::UnsupportedPlatform, message, std::move(hint)) {}
};

class LoadFailure final : public DroplyError {
public:
    explicit LoadFailure(const std::string& message, std::string hint = {})
        : DroplyError(ErrorKind::LoadFailure, message, std::move(hint)) {}
};

class CorruptInputError final : public DroplyError {
public:
    explicit CorruptInputError(const std::string& message, std::string hint = {})
        : DroplyError(ErrorKind::CorruptInput, message, std::move(hint)) {}
};

class AlgorithmMismatchError final : public DroplyError {
public:
    explicit AlgorithmMismatchError(const std::string& message, std::string hint = {})
        : DroplyError(ErrorKind::AlgorithmMismatch, message, std::move(hint)) {}
};

class FilesystemConflictExhausted final : public DroplyError {
public:
    explicit FilesystemConflictExhausted(const std::string& message, std::string hint = {})
        : DroplyError(ErrorKind::ConflictExhausted, message, std::move(hint)) {}
};

class IoError final : public DroplyError {
public:
    explicit IoError(const std::string& message, std::string hint = {})
        : DroplyError(ErrorKind::Io, message, std::move(hint)) {}
};

} // namespace droply

#endif // DROPLY_ERRORS_HPP
