#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>
#include "core/copy_options.hpp"

namespace lazycp::args_parser {

namespace {

auto version_text() -> std::string {
    constexpr auto git = build_info::get_git_info();
    return fmt::format("lazycp {} ({}@{}{}, built {})",
                       build_info::project_version,
                       git.branch,
                       git.commit_short,
                       git.dirty ? "-dirty" : "",
                       git.timestamp);
}

} // namespace

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLI::App app{"lazycp - lazy recursive file copy"};

    CLIArgs args{};
    std::size_t chunk_size = core::default_chunk_size;
    std::uint32_t max_latency = core::default_max_latency_ms;
    std::string priority;

    app.add_option("source", args.source, "Source file or dir")->required();
    app.add_option("destination", args.destination, "Destination dir or file name")->required();

    auto* chunk_opt = app.add_option("--chunk-size", chunk_size, "How large the buffer (bytes)")
        ->check(CLI::PositiveNumber);
    auto* latency_opt = app.add_option("--max-latency", max_latency, "How many ms for max write latency");
    // Без значения означает latency
    auto* priority_opt = app.add_option("--priority", priority, "What you would prioritize? (latency|chunksize)")
        ->expected(0, 1);

    app.add_flag("--no-progress", args.no_progress, "Do not draw the per-file progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only log warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.set_version_flag("--version", version_text, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    if (chunk_opt->count() > 0) args.chunk_size = chunk_size;
    if (latency_opt->count() > 0) args.max_latency_ms = max_latency;
    if (priority_opt->count() > 0) args.priority = priority.empty() ? std::string{"latency"} : priority;

    return args;
}

} // namespace lazycp::args_parser
