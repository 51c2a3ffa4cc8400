#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "core/copy_options.hpp"

namespace lazycp::args_parser {
    struct CLIArgs;
}

namespace lazycp::infra {

struct Config {
    // I/O
    std::optional<std::size_t> chunk_size;        // bytes
    std::optional<std::uint32_t> max_latency_ms;  // только подсказка
    std::optional<core::Priority> priority;       // только подсказка

    // Вывод
    bool progress = true;
    bool quiet = false;
    bool verbose = false;
    std::optional<std::string> log_level;  // trace|debug|info|warn|error

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto to_copy_options() const -> core::CopyOptions;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.lazycp.yaml
///   2. $XDG_CONFIG_HOME/lazycp/config.yaml или ~/.config/lazycp/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Loads one explicit YAML file; a missing file is an error here.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args)
    -> std::expected<Config, std::string>;

} // namespace lazycp::infra
