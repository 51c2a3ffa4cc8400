#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include "core/file_copier/file_copier.hpp"
#include "core/symlink/symlink_replicator.hpp"
#include "infra/error_handler/error.hpp"

namespace lazycp::core {

struct WalkStats {
    std::uint64_t files_copied = 0;
    std::uint64_t files_skipped = 0;
    std::uint64_t files_failed = 0;
    std::uint64_t links_created = 0;
    std::uint64_t links_failed = 0;
    std::uint64_t directories_created = 0;
    std::uint64_t bytes_copied = 0;
};

/// Рекурсивный обход источника.
///
/// Порядок дочерних элементов определяется файловой системой и ни на что не влияет.
/// Каталог назначения создаётся до спуска в него. Ошибки отдельных файлов
/// и ссылок логируются и учитываются в WalkStats; run() возвращает ошибку
/// только для Aborted и Interrupted.
class TreeWalker {
public:
    TreeWalker(FileCopier& copier,
               SymlinkReplicator& linker,
               std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] auto run(const std::filesystem::path& src_path,
                           const std::filesystem::path& dest_path)
        -> infra::Result<WalkStats>;

    /// Статистика текущего или прерванного обхода.
    [[nodiscard]] auto stats() const -> const WalkStats& { return stats_; }

private:
    [[nodiscard]] auto walk_(const std::filesystem::path& src_dir,
                             const std::filesystem::path& dest_dir)
        -> infra::VoidResult;
    [[nodiscard]] auto copy_file_(const std::filesystem::path& src,
                                  const std::filesystem::path& dest)
        -> infra::VoidResult;
    void link_(const std::filesystem::path& src, const std::filesystem::path& dest);

    FileCopier& copier_;
    SymlinkReplicator& linker_;
    std::shared_ptr<spdlog::logger> logger_;
    WalkStats stats_{};
};

} // namespace lazycp::core
