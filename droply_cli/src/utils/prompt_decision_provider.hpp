#ifndef DROPLY_PROMPT_DECISION_PROVIDER_HPP
#define DROPLY_PROMPT_DECISION_PROVIDER_HPP

#include "../../../libdroply/include/conflict_resolver.hpp"
#include <iosfwd>

/**
 * @brief Asks on the terminal what to do with an existing output file.
 *
 * Answers: r(eplace), s(kip), k(eep both). Empty input or end of stream
 * selects keep both.
 */
class PromptDecisionProvider final : public droply::IDecisionProvider {
public:
    PromptDecisionProvider(std::istream& in, std::ostream& out);

    droply::ConflictAction decide(const std::filesystem::path& existing,
                                  const std::filesystem::path& candidate) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/// @return True when stdin is attached to a terminal.
bool stdin_is_terminal();

#endif // DROPLY_PROMPT_DECISION_PROVIDER_HPP
