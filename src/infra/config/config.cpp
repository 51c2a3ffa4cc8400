#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <vector>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace lazycp::infra {

void Config::merge_with(const Config& other) {
    if (other.chunk_size) chunk_size = other.chunk_size;
    if (other.max_latency_ms) max_latency_ms = other.max_latency_ms;
    if (other.priority) priority = other.priority;
    if (!other.progress) progress = false; // CLI может отключить
    if (other.quiet) quiet = true;
    if (other.verbose) verbose = true;
    if (other.log_level) log_level = other.log_level;
}

auto Config::to_copy_options() const -> core::CopyOptions {
    core::CopyOptions options{};
    options.chunk_size = chunk_size.value_or(core::default_chunk_size);
    options.max_latency_ms = max_latency_ms.value_or(core::default_max_latency_ms);
    options.priority = priority.value_or(core::Priority::Latency);
    return options;
}

static auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.push_back(".lazycp.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "lazycp" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "lazycp" / "config.yaml");
        }
    }

    return paths;
}

static auto parse_priority_value(const std::string& value) -> std::expected<core::Priority, std::string> {
    if (auto priority = core::parse_priority(value)) {
        return *priority;
    }
    return std::unexpected(fmt::format("invalid priority '{}' (expected latency or chunksize)", value));
}

// spdlog::level::from_str() молча отдаёт off для неизвестного имени
static auto parse_log_level_value(const std::string& value) -> std::expected<std::string, std::string> {
    if (value == "off" || spdlog::level::from_str(value) != spdlog::level::off) {
        return value;
    }
    return std::unexpected(fmt::format(
        "invalid log_level '{}' (expected trace, debug, info, warning, error, critical or off)", value));
}

auto load_config_from_file(const std::filesystem::path& path) -> std::expected<Config, std::string> {
    try {
        YAML::Node config = YAML::LoadFile(path.string());
        Config cfg{};

        if (config["chunk_size"]) {
            const auto chunk_size = config["chunk_size"].as<std::size_t>();
            if (chunk_size == 0) {
                return std::unexpected(fmt::format("{}: chunk_size must be positive", path.string()));
            }
            cfg.chunk_size = chunk_size;
        }
        if (config["max_latency"]) cfg.max_latency_ms = config["max_latency"].as<std::uint32_t>();
        if (config["priority"]) {
            auto priority = parse_priority_value(config["priority"].as<std::string>());
            if (!priority) {
                return std::unexpected(fmt::format("{}: {}", path.string(), priority.error()));
            }
            cfg.priority = *priority;
        }

        if (config["progress"]) cfg.progress = config["progress"].as<bool>();
        if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
        if (config["verbose"]) cfg.verbose = config["verbose"].as<bool>();
        if (config["log_level"]) {
            auto level = parse_log_level_value(config["log_level"].as<std::string>());
            if (!level) {
                return std::unexpected(fmt::format("{}: {}", path.string(), level.error()));
            }
            cfg.log_level = *level;
        }

        spdlog::debug("Loaded config from {}", path.string());
        return cfg;

    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto load_config_from_file() -> std::expected<Config, std::string> {
    for (const auto& path : get_config_paths()) {
        if (!std::filesystem::exists(path)) continue;
        return load_config_from_file(path);
    }

    // Файл не найден — возвращаем пустой конфиг (не ошибка!)
    return Config{};
}

auto config_from_cli(const args_parser::CLIArgs& args) -> std::expected<Config, std::string> {
    Config cfg{};
    cfg.chunk_size = args.chunk_size;
    cfg.max_latency_ms = args.max_latency_ms;
    if (args.priority) {
        auto priority = parse_priority_value(*args.priority);
        if (!priority) {
            return std::unexpected(priority.error());
        }
        cfg.priority = *priority;
    }
    cfg.progress = !args.no_progress;
    cfg.quiet = args.quiet;
    cfg.verbose = args.verbose;
    return cfg;
}

} // namespace lazycp::infra
