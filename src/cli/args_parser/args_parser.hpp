#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace lazycp::args_parser {

struct CLIArgs
{
    std::string source;                          // позиционный
    std::string destination;                     // позиционный
    std::optional<std::size_t> chunk_size;       // --chunk-size
    std::optional<std::uint32_t> max_latency_ms; // --max-latency
    std::optional<std::string> priority;         // --priority [latency|chunksize]
    bool no_progress{false};                     // --no-progress
    bool quiet{false};                           // -q, --quiet
    bool verbose{false};                         // -v, --verbose
};

/// Parses command-line arguments.
/// On --help, --version or a parse error the message is already printed and the
/// unexpected value holds the process exit code.
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace lazycp::args_parser
