#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include "core/copy_options.hpp"
#include "core/conflict/conflict_resolver.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace lazycp::core {

enum class CopyOutcome {
    Copied,
    Skipped, // назначение существовало, выбран Skip
    Failed,  // ошибка ввода-вывода, уже залогирована
};

struct CopyFileResult {
    CopyOutcome outcome = CopyOutcome::Copied;
    std::uint64_t bytes = 0;
    std::uint64_t chunks = 0;
};

/// Потоковое копирование одного файла чанками по options.chunk_size.
///
/// Ошибки открытия, чтения и записи не выходят наружу: они логируются,
/// а результат получает outcome == Failed. Ошибкой возвращаются только
/// Aborted (пользователь выбрал Exit) и Interrupted (получен сигнал).
class FileCopier {
public:
    FileCopier(const CopyOptions& options,
               ConflictResolver& resolver,
               infra::ProgressReporter& progress,
               std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] auto copy(const std::filesystem::path& src,
                            const std::filesystem::path& dest)
        -> infra::Result<CopyFileResult>;

private:
    [[nodiscard]] auto stream_(const std::filesystem::path& src,
                               const std::filesystem::path& dest,
                               bool binary,
                               infra::ProgressScope& scope,
                               CopyFileResult& result)
        -> infra::VoidResult;

    const CopyOptions& options_;
    ConflictResolver& resolver_;
    infra::ProgressReporter& progress_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace lazycp::core
