#include "prompt_decision_provider.hpp"
#include "color.hpp"
#include <cctype>
#include <iostream>
#include <string>
#include <unistd.h>

using droply::ConflictAction;

PromptDecisionProvider::PromptDecisionProvider(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

ConflictAction PromptDecisionProvider::decide(const std::filesystem::path& existing,
                                              const std::filesystem::path& candidate) {
    for (;;) {
        out_ << YELLOW << existing.string() << " already exists." << RESET << '\n'
             << "  [r]eplace, [s]kip, [k]eep both as " << candidate.filename().string() << " (default k): "
             << std::flush;

        std::string answer;
        if (!std::getline(in_, answer)) {
            out_ << '\n';
            return ConflictAction::KeepBoth;
        }
        const auto first = answer.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return ConflictAction::KeepBoth;
        }
        switch (std::tolower(static_cast<unsigned char>(answer[first]))) {
            case 'r': return ConflictAction::Replace;
            case 's': return ConflictAction::Skip;
            case 'k': return ConflictAction::KeepBoth;
            default:
                out_ << RED << "Unknown answer '" << answer << "'" << RESET << '\n';
        }
    }
}

bool stdin_is_terminal() {
    return isatty(fileno(stdin)) != 0;
}
