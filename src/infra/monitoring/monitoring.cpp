#include "monitoring.hpp"
#include <fmt/core.h>
#include <ostream>

namespace lazycp::infra {

namespace {

constexpr int bar_width = 20;
constexpr auto render_interval = std::chrono::milliseconds(100);

} // namespace

auto format_bytes(std::uint64_t bytes) -> std::string {
    const char* unit = "B";
    double value = static_cast<double>(bytes);
    if (value >= 1024.0 * 1024 * 1024) { value /= 1024.0 * 1024 * 1024; unit = "GB"; }
    else if (value >= 1024.0 * 1024) { value /= 1024.0 * 1024; unit = "MB"; }
    else if (value >= 1024.0) { value /= 1024.0; unit = "KB"; }
    else return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", value, unit);
}

ConsoleProgress::ConsoleProgress(std::ostream& out)
    : out_(out)
{}

ConsoleProgress::~ConsoleProgress() {
    end();
}

void ConsoleProgress::begin(std::uint64_t total_bytes, std::string label) {
    end(); // старое состояние отбрасывается
    base_label_ = label;
    state_ = ProgressState{
        .total_bytes = total_bytes,
        .transferred_bytes = 0,
        .last_latency_ms = 0.0,
        .label = std::move(label)
    };
    rendered_ = false;
    // Пустой файл: индикатор не показываем
    if (total_bytes > 0) {
        render_();
    }
}

void ConsoleProgress::advance(std::uint64_t bytes, double latency_ms) {
    if (!state_) return;

    state_->transferred_bytes += bytes;
    state_->last_latency_ms = latency_ms;
    state_->label = fmt::format("{} - {:.2f} ms", base_label_, latency_ms);

    const auto now = std::chrono::steady_clock::now();
    if (now - last_render_ >= render_interval || state_->transferred_bytes >= state_->total_bytes) {
        render_();
    }
}

void ConsoleProgress::end() {
    if (!state_) return;

    if (rendered_) {
        render_();
        out_ << "\n";
        out_.flush();
    }
    state_.reset();
    rendered_ = false;
}

void ConsoleProgress::render_() {
    const auto& st = *state_;

    double fraction = st.total_bytes > 0
        ? static_cast<double>(st.transferred_bytes) / static_cast<double>(st.total_bytes)
        : 1.0;
    if (fraction > 1.0) fraction = 1.0;
    const int filled = static_cast<int>(fraction * bar_width);

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    out_ << "\r\033[K"; // ANSI: очистить строку
    out_ << fmt::format("{}: {:3.0f}%|{}| {}/{}",
                        st.label,
                        fraction * 100.0,
                        bar,
                        format_bytes(st.transferred_bytes),
                        format_bytes(st.total_bytes));
    out_.flush();

    rendered_ = true;
    last_render_ = std::chrono::steady_clock::now();
}

} // namespace lazycp::infra
