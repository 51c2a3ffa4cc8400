#pragma once

#include <cstdint>
#include <span>

namespace lazycp::adapters::text {

/// Потоковая проверка UTF-8 (RFC 3629): без overlong-форм, суррогатов и кодов > U+10FFFF.
/// Последовательность может разрываться между вызовами feed().
class Utf8Validator {
public:
    /// false, как только встретилась недопустимая последовательность.
    [[nodiscard]] bool feed(std::span<const char> bytes);

    /// Незавершённая многобайтовая последовательность в конце данных.
    [[nodiscard]] bool pending() const { return need_ > 0; }

    [[nodiscard]] bool valid() const { return valid_; }

    /// Весь поток корректен и закончился на границе символа.
    [[nodiscard]] bool complete() const { return valid_ && need_ == 0; }

private:
    int need_ = 0;
    std::uint8_t lower_ = 0x80;
    std::uint8_t upper_ = 0xBF;
    bool valid_ = true;
};

} // namespace lazycp::adapters::text
