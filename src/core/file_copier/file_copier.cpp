#include "file_copier.hpp"
#include <cerrno>
#include <chrono>
#include <fstream>
#include <span>
#include <system_error>
#include <vector>
#include <fmt/core.h>
#include "adapters/fs.hpp"
#include "adapters/utf8.hpp"
#include "infra/interrupt.hpp"

namespace lazycp::core {

namespace {

// errno после неудачной операции с fstream выставляет libstdc++, но стандарт этого не требует
infra::Error stream_error(infra::ErrorCode fallback, std::string_view context) {
    if (errno != 0) {
        return infra::make_error_from(std::error_code(errno, std::generic_category()), context);
    }
    return infra::make_error(fallback, context);
}

} // namespace

FileCopier::FileCopier(const CopyOptions& options,
                       ConflictResolver& resolver,
                       infra::ProgressReporter& progress,
                       std::shared_ptr<spdlog::logger> logger)
    : options_(options)
    , resolver_(resolver)
    , progress_(progress)
    , logger_(std::move(logger))
{}

auto FileCopier::copy(const std::filesystem::path& src,
                      const std::filesystem::path& dest)
    -> infra::Result<CopyFileResult>
{
    std::error_code ec;
    const auto dest_status = std::filesystem::symlink_status(dest, ec);
    if (std::filesystem::exists(dest_status)) {
        auto resolved = resolver_.resolve(dest);
        if (!resolved) {
            return std::unexpected(std::move(resolved.error()));
        }
        const auto decision = *resolved;
        logger_->debug("{} exists: {}", dest.string(), to_string(decision));
        switch (decision) {
            case ConflictDecision::Skip:
                logger_->debug("Skipping {}", dest.string());
                return CopyFileResult{.outcome = CopyOutcome::Skipped};
            case ConflictDecision::Abort:
                return std::unexpected(infra::make_error(infra::ErrorCode::Aborted,
                                       fmt::format("Copy aborted by user at {}", dest.string())));
            case ConflictDecision::Overwrite:
                break;
        }

        // Ссылку заменяем, а не пишем через неё
        if (std::filesystem::is_symlink(dest_status)) {
            std::filesystem::remove(dest, ec);
            if (ec) {
                logger_->error("Error copying {} to {}: {}", src.string(), dest.string(),
                               infra::make_error_from(ec, fmt::format("Cannot replace link {}", dest.string())).message);
                return CopyFileResult{.outcome = CopyOutcome::Failed};
            }
        }
    }

    const bool binary = adapters::fs::is_binary(src);

    auto size = adapters::fs::file_size(src);
    if (!size) {
        logger_->error("Error copying {} to {}: {}", src.string(), dest.string(), size.error().message);
        return CopyFileResult{.outcome = CopyOutcome::Failed};
    }

    CopyFileResult result{};
    infra::ProgressScope scope(progress_, *size, src.filename().string());

    auto streamed = stream_(src, dest, binary, scope, result);
    scope.close();

    if (!streamed) {
        if (streamed.error().stops_walk()) {
            return std::unexpected(std::move(streamed.error()));
        }
        logger_->error("Error copying {} to {}: {}", src.string(), dest.string(), streamed.error().message);
        result.outcome = CopyOutcome::Failed;
        return result;
    }

    logger_->info("Success copying {} to {}", src.string(), dest.string());
    result.outcome = CopyOutcome::Copied;
    return result;
}

auto FileCopier::stream_(const std::filesystem::path& src,
                         const std::filesystem::path& dest,
                         bool binary,
                         infra::ProgressScope& scope,
                         CopyFileResult& result)
    -> infra::VoidResult
{
    const auto in_mode = binary ? std::ios::in | std::ios::binary : std::ios::in;
    const auto out_mode = binary ? std::ios::out | std::ios::trunc | std::ios::binary
                                 : std::ios::out | std::ios::trunc;

    errno = 0;
    std::ifstream ifs(src, in_mode);
    if (!ifs) {
        return std::unexpected(stream_error(infra::ErrorCode::FileNotFound,
                                            fmt::format("Cannot open {}", src.string())));
    }

    errno = 0;
    std::ofstream ofs(dest, out_mode);
    if (!ofs) {
        return std::unexpected(stream_error(infra::ErrorCode::PermissionDenied,
                                            fmt::format("Cannot open {} for writing", dest.string())));
    }

    std::vector<char> buffer(options_.chunk_size > 0 ? options_.chunk_size : default_chunk_size);
    adapters::text::Utf8Validator validator;

    while (true) {
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                   fmt::format("Interrupted while copying {}", src.string())));
        }

        errno = 0;
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = ifs.gcount();
        if (got <= 0) {
            if (ifs.bad()) {
                return std::unexpected(stream_error(infra::ErrorCode::IoError,
                                                    fmt::format("Read error in {}", src.string())));
            }
            break; // конец файла
        }

        const std::span<const char> chunk(buffer.data(), static_cast<std::size_t>(got));
        if (!binary && !validator.feed(chunk)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::EncodingError,
                                   fmt::format("{} is not valid UTF-8 near byte {}",
                                               src.string(), result.bytes + chunk.size())));
        }

        const auto start = std::chrono::steady_clock::now();
        errno = 0;
        ofs.write(chunk.data(), got);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        if (!ofs) {
            return std::unexpected(stream_error(infra::ErrorCode::IoError,
                                                fmt::format("Write error in {}", dest.string())));
        }

        const double latency_ms = std::chrono::duration<double, std::milli>(elapsed).count();
        result.bytes += chunk.size();
        ++result.chunks;
        scope.advance(chunk.size(), latency_ms);
    }

    if (!binary && validator.pending()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::EncodingError,
                               fmt::format("{} ends inside a UTF-8 sequence", src.string())));
    }

    errno = 0;
    ofs.close();
    if (ofs.fail()) {
        return std::unexpected(stream_error(infra::ErrorCode::IoError,
                                            fmt::format("Cannot flush {}", dest.string())));
    }
    return {};
}

} // namespace lazycp::core
