#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string_view>
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"

namespace lazycp::core {

enum class ConflictDecision {
    Overwrite,
    Skip,
    Abort,
};

[[nodiscard]] auto to_string(ConflictDecision decision) -> std::string_view;

/// Источник решения для существующего пути назначения.
class DecisionProvider {
public:
    virtual ~DecisionProvider() = default;
    [[nodiscard]] virtual auto decide(const std::filesystem::path& dest) -> ConflictDecision = 0;
};

/// Интерактивный запрос: повторяет вопрос, пока не получит o/s/e (регистр не важен).
/// Конец ввода трактуется как Abort, прерванное сигналом чтение тоже завершает запрос.
class PromptDecisionProvider final : public DecisionProvider {
public:
    PromptDecisionProvider(std::istream& in, std::ostream& out);

    [[nodiscard]] auto decide(const std::filesystem::path& dest) -> ConflictDecision override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/// Parses one answer line: exactly "o", "s" or "e" in any case.
[[nodiscard]] auto parse_decision(std::string_view answer) -> std::optional<ConflictDecision>;

class ConflictResolver {
public:
    explicit ConflictResolver(DecisionProvider& provider) : provider_(provider) {}

    /// Вызывается только если dest уже существует.
    /// Если во время запроса пришёл SIGINT/SIGTERM, ответ отбрасывается и возвращается Interrupted.
    [[nodiscard]] auto resolve(const std::filesystem::path& dest) -> infra::Result<ConflictDecision> {
        const auto decision = provider_.decide(dest);
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                                     "Interrupted at conflict prompt"));
        }
        return decision;
    }

private:
    DecisionProvider& provider_;
};

} // namespace lazycp::core
