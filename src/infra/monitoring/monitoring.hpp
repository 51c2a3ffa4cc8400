#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace lazycp::infra {

/// Состояние прогресса одного копируемого файла.
struct ProgressState {
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    double last_latency_ms = 0.0;
    std::string label;
};

/// Наблюдатель копирования. Не влияет на результат копирования.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void begin(std::uint64_t total_bytes, std::string label) = 0;
    virtual void advance(std::uint64_t bytes, double latency_ms) = 0;
    /// Повторный вызов без активного состояния ничего не делает.
    virtual void end() = 0;
};

class NullProgress final : public ProgressReporter {
public:
    void begin(std::uint64_t, std::string) override {}
    void advance(std::uint64_t, double) override {}
    void end() override {}
};

/// Однострочный индикатор в стиле "name - 0.42 ms: 40%|████░░| 4.0 KB/10.0 KB".
class ConsoleProgress final : public ProgressReporter {
public:
    explicit ConsoleProgress(std::ostream& out);
    ~ConsoleProgress() override;

    ConsoleProgress(const ConsoleProgress&) = delete;
    ConsoleProgress& operator=(const ConsoleProgress&) = delete;

    void begin(std::uint64_t total_bytes, std::string label) override;
    void advance(std::uint64_t bytes, double latency_ms) override;
    void end() override;

    [[nodiscard]] auto state() const -> const std::optional<ProgressState>& { return state_; }

private:
    void render_();

    std::ostream& out_;
    std::optional<ProgressState> state_;
    std::string base_label_;
    bool rendered_ = false;
    std::chrono::steady_clock::time_point last_render_{};
};

/// begin() в конструкторе, end() в деструкторе: состояние закрывается на любом пути выхода.
class ProgressScope {
public:
    ProgressScope(ProgressReporter& reporter, std::uint64_t total_bytes, std::string label)
        : reporter_(reporter)
    {
        reporter_.begin(total_bytes, std::move(label));
    }

    ~ProgressScope() { reporter_.end(); }

    ProgressScope(const ProgressScope&) = delete;
    ProgressScope& operator=(const ProgressScope&) = delete;

    void advance(std::uint64_t bytes, double latency_ms) { reporter_.advance(bytes, latency_ms); }
    void close() { reporter_.end(); }

private:
    ProgressReporter& reporter_;
};

[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;

} // namespace lazycp::infra
