#include "conflict_resolver.hpp"
#include <cctype>
#include <istream>
#include <ostream>
#include <string>
#include <fmt/core.h>
#include "infra/interrupt.hpp"

namespace lazycp::core {

auto to_string(ConflictDecision decision) -> std::string_view {
    switch (decision) {
        case ConflictDecision::Overwrite: return "overwrite";
        case ConflictDecision::Skip:      return "skip";
        case ConflictDecision::Abort:     return "abort";
    }
    return "unknown";
}

auto parse_decision(std::string_view answer) -> std::optional<ConflictDecision> {
    if (!answer.empty() && answer.back() == '\r') {
        answer.remove_suffix(1);
    }

    if (answer.size() != 1) {
        return std::nullopt;
    }
    switch (std::tolower(static_cast<unsigned char>(answer.front()))) {
        case 'o': return ConflictDecision::Overwrite;
        case 's': return ConflictDecision::Skip;
        case 'e': return ConflictDecision::Abort;
        default:  return std::nullopt;
    }
}

PromptDecisionProvider::PromptDecisionProvider(std::istream& in, std::ostream& out)
    : in_(in), out_(out)
{}

auto PromptDecisionProvider::decide(const std::filesystem::path& dest) -> ConflictDecision {
    std::string line;
    while (!infra::is_interrupted()) {
        out_ << fmt::format("Duplicate file found at {} - Overwrite (O), Skip (S), Exit (E)?\n> ",
                            dest.string());
        out_.flush();

        // EINTR от сигнала тоже роняет getline; ConflictResolver отличит его по флагу
        if (!std::getline(in_, line)) {
            return ConflictDecision::Abort;
        }
        if (auto decision = parse_decision(line)) {
            return *decision;
        }
    }
    return ConflictDecision::Abort;
}

} // namespace lazycp::core
