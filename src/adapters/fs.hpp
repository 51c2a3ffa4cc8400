#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace lazycp::adapters::fs {

/// Сколько байт читает проба is_binary().
inline constexpr std::size_t binary_probe_size = 16;

/// Эвристика: файл бинарный, если первые 16 байт не декодируются как UTF-8.
/// Бинарный файл с корректным UTF-8 префиксом будет принят за текст.
/// Файл, который не удалось открыть, считается бинарным: ошибку открытия
/// сообщит само копирование.
[[nodiscard]] auto is_binary(const std::filesystem::path& path) -> bool;

[[nodiscard]] auto file_size(const std::filesystem::path& path)
    -> infra::Result<std::uintmax_t>;

/// Создаёт каталог; уже существующий каталог не ошибка.
/// Возвращает true, только если каталог был создан этим вызовом.
[[nodiscard]] auto ensure_directory(const std::filesystem::path& dir)
    -> infra::Result<bool>;

/// Создаёт в dst символическую ссылку с той же строкой цели, что у src.
/// Возвращает цель ссылки.
[[nodiscard]] auto replicate_symlink(const std::filesystem::path& src,
                                     const std::filesystem::path& dst)
    -> infra::Result<std::filesystem::path>;

/// Если у пути назначения нет расширения и по нему ничего нет, создаёт его
/// как каталог (без промежуточных каталогов). Возвращает true, если каталог создан.
[[nodiscard]] auto prepare_destination(const std::filesystem::path& dest)
    -> infra::Result<bool>;

/// dest/basename(src), если dest является существующим каталогом, иначе dest.
[[nodiscard]] auto resolve_destination(const std::filesystem::path& src,
                                       const std::filesystem::path& dest)
    -> std::filesystem::path;

} // namespace lazycp::adapters::fs
