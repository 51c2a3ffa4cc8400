#include "tree_walker.hpp"
#include <system_error>
#include <fmt/core.h>
#include "adapters/fs.hpp"
#include "infra/interrupt.hpp"

namespace lazycp::core {

namespace {

infra::Error interrupted_error() {
    return infra::make_error(infra::ErrorCode::Interrupted, "Interrupted during traversal");
}

} // namespace

TreeWalker::TreeWalker(FileCopier& copier,
                       SymlinkReplicator& linker,
                       std::shared_ptr<spdlog::logger> logger)
    : copier_(copier)
    , linker_(linker)
    , logger_(std::move(logger))
{}

auto TreeWalker::run(const std::filesystem::path& src_path,
                     const std::filesystem::path& dest_path)
    -> infra::Result<WalkStats>
{
    stats_ = WalkStats{};

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(src_path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                               fmt::format("Source does not exist: {}", src_path.string())));
    }
    if (ec) {
        return std::unexpected(infra::make_error_from(ec, fmt::format("Cannot stat {}", src_path.string())));
    }

    if (std::filesystem::is_symlink(status)) {
        link_(src_path, adapters::fs::resolve_destination(src_path, dest_path));
        return stats_;
    }

    if (std::filesystem::is_regular_file(status)) {
        auto res = copy_file_(src_path, adapters::fs::resolve_destination(src_path, dest_path));
        if (!res) return std::unexpected(std::move(res.error()));
        return stats_;
    }

    if (!std::filesystem::is_directory(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                               fmt::format("{} is not a file, link or directory", src_path.string())));
    }

    // Корень назначения обычно уже создан вызывающей стороной
    if (auto res = adapters::fs::ensure_directory(dest_path); !res) {
        logger_->error("Failed to create directory {}: {}", dest_path.string(), res.error().message);
        return stats_;
    }

    auto res = walk_(src_path, dest_path);
    if (!res) return std::unexpected(std::move(res.error()));
    return stats_;
}

auto TreeWalker::walk_(const std::filesystem::path& src_dir,
                       const std::filesystem::path& dest_dir)
    -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::directory_iterator it(src_dir, ec);
    if (ec) {
        logger_->error("Cannot read directory {}: {}", src_dir.string(), ec.message());
        return {};
    }

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            logger_->error("Cannot read directory {}: {}", src_dir.string(), ec.message());
            return {};
        }
        if (infra::is_interrupted()) {
            return std::unexpected(interrupted_error());
        }

        const auto& entry = *it;
        const auto src = entry.path();
        const auto dest = dest_dir / src.filename();

        std::error_code type_ec;
        if (entry.is_symlink(type_ec)) {
            link_(src, dest);
        } else if (entry.is_regular_file(type_ec)) {
            if (auto res = copy_file_(src, dest); !res) {
                return res;
            }
        } else if (entry.is_directory(type_ec)) {
            auto created = adapters::fs::ensure_directory(dest);
            if (!created) {
                logger_->error("Failed to create directory {}: {}", dest.string(), created.error().message);
                continue;
            }
            if (*created) {
                ++stats_.directories_created;
            }
            if (auto res = walk_(src, dest); !res) {
                return res;
            }
        } else {
            logger_->warn("Skipping {}: not a regular file, link or directory", src.string());
        }
    }
    return {};
}

auto TreeWalker::copy_file_(const std::filesystem::path& src,
                            const std::filesystem::path& dest)
    -> infra::VoidResult
{
    auto res = copier_.copy(src, dest);
    if (!res) {
        return std::unexpected(std::move(res.error()));
    }

    switch (res->outcome) {
        case CopyOutcome::Copied:
            ++stats_.files_copied;
            stats_.bytes_copied += res->bytes;
            break;
        case CopyOutcome::Skipped:
            ++stats_.files_skipped;
            break;
        case CopyOutcome::Failed:
            ++stats_.files_failed;
            break;
    }
    return {};
}

void TreeWalker::link_(const std::filesystem::path& src, const std::filesystem::path& dest) {
    if (linker_.link(src, dest)) {
        ++stats_.links_created;
    } else {
        ++stats_.links_failed;
    }
}

} // namespace lazycp::core
