/**
 * @file conflict_resolver.hpp
 * @brief Decides what happens when an output path already exists.
 */

#ifndef DROPLY_CONFLICT_RESOLVER_HPP
#define DROPLY_CONFLICT_RESOLVER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace droply {

enum class ConflictAction {
    Replace,
    Skip,
    KeepBoth
};

const char* conflict_action_to_string(ConflictAction action);

/// Accepts "replace", "skip", "keep-both" (and "keepboth", "keep_both"), case-insensitive.
std::optional<ConflictAction> parse_conflict_action(std::string_view text);

/**
 * @brief Source of decisions for conflicting paths.
 *
 * The CLI plugs in a terminal prompt; non-interactive hosts use
 * AutoDecisionProvider.
 */
class IDecisionProvider {
public:
    virtual ~IDecisionProvider() = default;

    /**
     * @param existing Path that already exists.
     * @param candidate Numbered path that KeepBoth would write to.
     */
    virtual ConflictAction decide(const std::filesystem::path& existing,
                                  const std::filesystem::path& candidate) = 0;
};

/**
 * @brief Always answers with a fixed action.
 */
class AutoDecisionProvider final : public IDecisionProvider {
public:
    explicit AutoDecisionProvider(const ConflictAction action = ConflictAction::KeepBoth) : action_(action) {}

    ConflictAction decide(const std::filesystem::path&, const std::filesystem::path&) override {
        return action_;
    }

private:
    ConflictAction action_;
};

struct ConflictOptions {
    std::string open = "(";
    std::string close = ")";
    unsigned start_number = 1;
    unsigned max_attempts = 100;
    bool allow_replace = true;
    bool allow_skip = true;
    bool allow_keep_both = true;
    ConflictAction default_action = ConflictAction::KeepBoth;
};

enum class ResolutionOutcome {
    Write,   ///< path was free
    Replace, ///< existing file must be removed first
    Skip,    ///< nothing is written
    KeepBoth ///< write to a numbered path
};

const char* resolution_outcome_to_string(ResolutionOutcome outcome);

struct Resolution {
    ResolutionOutcome outcome = ResolutionOutcome::Write;
    std::filesystem::path target; ///< where to write; the requested path for Skip
};

/**
 * @brief State machine Conflict -> Decision.
 *
 * @details Numbered names insert "(n)" before the first recognized extension
 * boundary, so "report.tar.gz" becomes "report(1).tar.gz". A name that is
 * already numbered continues from its number.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(std::shared_ptr<IDecisionProvider> provider = nullptr,
                              ConflictOptions options = {});

    /**
     * @brief Resolves a requested output path.
     * @throws FilesystemConflictExhausted if KeepBoth finds no free name.
     */
    Resolution resolve(const std::filesystem::path& requested) const;

    /**
     * @brief First free numbered variant of path.
     * @throws FilesystemConflictExhausted after max_attempts candidates.
     */
    [[nodiscard]] std::filesystem::path next_free_path(const std::filesystem::path& path) const;

    /// @return file name with "<open>n<close>" inserted before its extension.
    [[nodiscard]] std::string numbered_name(std::string_view filename, unsigned n) const;

    /// Directory variant of resolve(): existing directories are reused, other entries get a numbered name.
    [[nodiscard]] std::filesystem::path resolve_directory(const std::filesystem::path& path) const;

    [[nodiscard]] const ConflictOptions& options() const noexcept { return options_; }

private:
    struct Numbered {
        std::string stem;
        unsigned number;
        std::string extension;
    };

    [[nodiscard]] std::optional<Numbered> parse_numbered(std::string_view filename) const;
    [[nodiscard]] ConflictAction allowed(ConflictAction action) const;

    std::shared_ptr<IDecisionProvider> provider_;
    ConflictOptions options_;
};

} // namespace droply

#endif // DROPLY_CONFLICT_RESOLVER_HPP
