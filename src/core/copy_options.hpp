#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lazycp::core {

/// Подсказка оператора для подбора размера чанка. Пока только принимается и логируется.
enum class Priority {
    Latency,
    ChunkSize,
};

inline constexpr std::size_t default_chunk_size = 4096;
inline constexpr std::uint32_t default_max_latency_ms = 100;

struct CopyOptions {
    std::size_t chunk_size = default_chunk_size;
    std::uint32_t max_latency_ms = default_max_latency_ms; // не применяется
    Priority priority = Priority::Latency;                 // не применяется
};

[[nodiscard]] constexpr auto parse_priority(std::string_view name) -> std::optional<Priority> {
    if (name == "latency") return Priority::Latency;
    if (name == "chunksize") return Priority::ChunkSize;
    return std::nullopt;
}

[[nodiscard]] constexpr auto to_string(Priority priority) -> std::string_view {
    return priority == Priority::Latency ? "latency" : "chunksize";
}

} // namespace lazycp::core
