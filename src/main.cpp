#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <git_info.hpp>

#include "adapters/fs.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/conflict/conflict_resolver.hpp"
#include "core/file_copier/file_copier.hpp"
#include "core/symlink/symlink_replicator.hpp"
#include "core/tree_walker/tree_walker.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"

using GIT = lazycp::build_info::GitInfo;

constexpr auto load_from_cli = lazycp::infra::config_from_cli;
constexpr auto args_parser = lazycp::args_parser::parse_args;
constexpr auto git = lazycp::build_info::get_git_info();

static auto
out_git_verse(spdlog::logger& logger, const GIT& git)
-> void {
    logger.debug("Git branch: {}", git.branch);
    logger.debug("Git commit: {}", git.commit);
    logger.debug("Git dirty: {}", git.dirty ? "yes" : "no");
    logger.debug("Build timestamp (UTC): {}", git.timestamp);
}

static auto
out_summary(spdlog::logger& logger, const lazycp::core::WalkStats& stats, std::chrono::milliseconds elapsed)
-> void {
    logger.info("Files copied: {}", stats.files_copied);
    logger.info("Bytes copied: {} ({})", stats.bytes_copied, lazycp::infra::format_bytes(stats.bytes_copied));
    logger.info("Files skipped: {}", stats.files_skipped);
    logger.info("Links created: {}", stats.links_created);
    logger.info("Directories created: {}", stats.directories_created);
    logger.info("Errors: {}", stats.files_failed + stats.links_failed);
    logger.info("Time elapsed: {:.2f} seconds", elapsed.count() / 1000.0);
}

static auto
select_level(const lazycp::infra::Config& config)
-> spdlog::level::level_enum {
    if (config.verbose) return spdlog::level::debug;
    if (config.quiet) return spdlog::level::warn;
    if (config.log_level) return spdlog::level::from_str(*config.log_level);
    return spdlog::level::info;
}

int main(int argc, char** argv)
{
    try {
        auto logger = spdlog::stdout_color_mt("lazycp");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        lazycp::infra::install_signal_handler();

        auto args_res = args_parser(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help, --version или ошибка разбора
        }
        const auto& args = *args_res;

        // 1. Загрузить из файла
        auto config_res = lazycp::infra::load_config_from_file();
        if (!config_res) {
            logger->error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        auto cli_config = load_from_cli(args);
        if (!cli_config) {
            logger->error("Argument error: {}", cli_config.error());
            return 1;
        }
        config.merge_with(*cli_config); // CLI имеет приоритет
        spdlog::set_level(select_level(config));

        out_git_verse(*logger, git);

        const auto options = config.to_copy_options();
        logger->debug("Chunk size: {} bytes", options.chunk_size);
        logger->debug("Max latency: {} ms, priority: {} (advisory)",
                      options.max_latency_ms, lazycp::core::to_string(options.priority));

        const std::filesystem::path source_path(args.source);
        const std::filesystem::path destination_path(args.destination);

        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(source_path, ec))) {
            logger->error("Source does not exist: {}", source_path.string());
            return 1;
        }

        auto prepared = lazycp::adapters::fs::prepare_destination(destination_path);
        if (!prepared) {
            logger->error("{}", prepared.error().message);
            return 1;
        }
        if (*prepared) {
            logger->debug("Created destination directory {}", destination_path.string());
        }

        logger->info("Starting file copy from {} to {}", source_path.string(), destination_path.string());

        std::unique_ptr<lazycp::infra::ProgressReporter> progress;
        if (config.progress && !config.quiet) {
            progress = std::make_unique<lazycp::infra::ConsoleProgress>(std::cerr);
        } else {
            progress = std::make_unique<lazycp::infra::NullProgress>();
        }

        lazycp::core::PromptDecisionProvider prompt(std::cin, std::cout);
        lazycp::core::ConflictResolver resolver(prompt);
        lazycp::core::FileCopier copier(options, resolver, *progress, logger);
        lazycp::core::SymlinkReplicator linker(logger);
        lazycp::core::TreeWalker walker(copier, linker, logger);

        const auto start_time = std::chrono::steady_clock::now();
        auto result = walker.run(source_path, destination_path);
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            auto& err = result.error();
            if (err.code == lazycp::infra::ErrorCode::Interrupted) {
                logger->info("Keyboard interrupt received");
            } else if (err.code == lazycp::infra::ErrorCode::Aborted) {
                logger->warn("{}", err.message);
                return err.to_exit_code();
            } else {
                return lazycp::infra::log_and_return(*logger, std::move(err)).to_exit_code();
            }
        }

        out_summary(*logger, walker.stats(), duration);
        logger->info("File copy operation finished");
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
