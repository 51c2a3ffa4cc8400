#pragma once

#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace lazycp::core {

/// Воссоздаёт символическую ссылку: цель копируется строкой, без разрешения.
/// Ошибки (например, dest уже существует) только логируются.
class SymlinkReplicator {
public:
    explicit SymlinkReplicator(std::shared_ptr<spdlog::logger> logger);

    /// true, если ссылка создана.
    bool link(const std::filesystem::path& src, const std::filesystem::path& dest);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace lazycp::core
