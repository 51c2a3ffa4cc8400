#include "symlink_replicator.hpp"
#include "adapters/fs.hpp"

namespace lazycp::core {

SymlinkReplicator::SymlinkReplicator(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{}

bool SymlinkReplicator::link(const std::filesystem::path& src, const std::filesystem::path& dest) {
    auto target = adapters::fs::replicate_symlink(src, dest);
    if (!target) {
        logger_->error("Failed to link {} to {}: {}", src.string(), dest.string(), target.error().message);
        return false;
    }
    logger_->info("Success linking {} to {} (-> {})", src.string(), dest.string(), target->string());
    return true;
}

} // namespace lazycp::core
