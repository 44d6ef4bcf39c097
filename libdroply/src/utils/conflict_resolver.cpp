#include "../../include/conflict_resolver.hpp"
#include "../../include/errors.hpp"
#include "../../include/filename_convention.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

namespace droply {

namespace fs = std::filesystem;

static const char* resolver_tag() {
    return "ConflictResolver";
}

const char* conflict_action_to_string(const ConflictAction action) {
    switch (action) {
        case ConflictAction::Replace:  return "replace";
        case ConflictAction::Skip:     return "skip";
        case ConflictAction::KeepBoth: return "keep-both";
    }
    return "keep-both";
}

std::optional<ConflictAction> parse_conflict_action(const std::string_view text) {
    std::string s(text);
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    if (s == "replace" || s == "overwrite") return ConflictAction::Replace;
    if (s == "skip") return ConflictAction::Skip;
    if (s == "keep-both" || s == "keepboth" || s == "keep_both" || s == "rename") return ConflictAction::KeepBoth;
    return std::nullopt;
}

const char* resolution_outcome_to_string(const ResolutionOutcome outcome) {
    switch (outcome) {
        case ResolutionOutcome::Write:    return "write";
        case ResolutionOutcome::Replace:  return "replace";
        case ResolutionOutcome::Skip:     return "skip";
        case ResolutionOutcome::KeepBoth: return "keep-both";
    }
    return "write";
}

ConflictResolver::ConflictResolver(std::shared_ptr<IDecisionProvider> provider, ConflictOptions options)
    : provider_(std::move(provider)), options_(std::move(options)) {
    if (!provider_) {
        provider_ = std::make_shared<AutoDecisionProvider>(options_.default_action);
    }
    if (options_.max_attempts == 0) {
        throw ValidationError("max_attempts must be at least 1");
    }
}

ConflictAction ConflictResolver::allowed(const ConflictAction action) const {
    const auto permitted = [this](const ConflictAction a) {
        switch (a) {
            case ConflictAction::Replace:  return options_.allow_replace;
            case ConflictAction::Skip:     return options_.allow_skip;
            case ConflictAction::KeepBoth: return options_.allow_keep_both;
        }
        return false;
    };
    if (permitted(action)) return action;
    if (permitted(options_.default_action)) return options_.default_action;
    for (const auto a : { ConflictAction::KeepBoth, ConflictAction::Skip, ConflictAction::Replace }) {
        if (permitted(a)) return a;
    }
    throw ValidationError("No conflict action is allowed");
}

std::optional<ConflictResolver::Numbered> ConflictResolver::parse_numbered(const std::string_view filename) const {
    auto [stem, ext] = split_extension(filename);
    if (stem.size() <= options_.open.size() + options_.close.size() || !stem.ends_with(options_.close)) {
        return std::nullopt;
    }
    const auto close_pos = stem.size() - options_.close.size();
    const auto open_pos = stem.rfind(options_.open, close_pos);
    if (open_pos == std::string::npos || open_pos == 0) {
        return std::nullopt;
    }
    const auto digits = std::string_view(stem).substr(open_pos + options_.open.size(),
                                                      close_pos - open_pos - options_.open.size());
    if (digits.empty() || digits.size() > 9 ||
        !std::ranges::all_of(digits, [](const unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return Numbered{ stem.substr(0, open_pos), static_cast<unsigned>(std::stoul(std::string(digits))), ext };
}

std::string ConflictResolver::numbered_name(const std::string_view filename, const unsigned n) const {
    auto [stem, ext] = split_extension(filename);
    return stem + options_.open + std::to_string(n) + options_.close + ext;
}

fs::path ConflictResolver::next_free_path(const fs::path& path) const {
    const auto filename = path.filename().string();
    std::string stem_name = filename;
    unsigned n = options_.start_number;
    if (const auto numbered = parse_numbered(filename)) {
        stem_name = numbered->stem + numbered->extension;
        n = std::max(n, numbered->number + 1);
    }

    for (unsigned attempt = 0; attempt < options_.max_attempts; ++attempt, ++n) {
        auto candidate = path.parent_path() / numbered_name(stem_name, n);
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(candidate, ec))) {
            return candidate;
        }
    }
    throw FilesystemConflictExhausted("No free name for " + path.string() + " after " +
                                      std::to_string(options_.max_attempts) + " attempts",
                                      "Remove old outputs or choose another --output-dir");
}

Resolution ConflictResolver::resolve(const fs::path& requested) const {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(requested, ec))) {
        return { ResolutionOutcome::Write, requested };
    }

    auto candidate = next_free_path(requested);
    const auto action = allowed(provider_->decide(requested, candidate));
    Logger::log(LogLevel::Debug, requested.string() + " exists: " + conflict_action_to_string(action),
                resolver_tag());
    switch (action) {
        case ConflictAction::Replace:  return { ResolutionOutcome::Replace, requested };
        case ConflictAction::Skip:     return { ResolutionOutcome::Skip, requested };
        case ConflictAction::KeepBoth: return { ResolutionOutcome::KeepBoth, std::move(candidate) };
    }
    return { ResolutionOutcome::KeepBoth, std::move(candidate) };
}

fs::path ConflictResolver::resolve_directory(const fs::path& path) const {
    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (!fs::exists(st) || fs::is_directory(st)) {
        return path;
    }
    return next_free_path(path);
}

} // namespace droply
