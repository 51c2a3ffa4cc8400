#include "error.hpp"
#include <cerrno>
#include <cstdlib>
#include <fmt/core.h>

namespace lazycp::infra {

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::Interrupted:    return EXIT_SUCCESS; // прерывание не считается сбоем
        default:                        return EXIT_FAILURE;
    }
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_error_from(const std::error_code& ec, std::string_view context,
                      const std::source_location& loc) {
    auto code = ErrorCode::IoError;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        switch (ec.value()) {
            case ENOENT:
            case ENOTDIR:
                code = ErrorCode::FileNotFound;
                break;
            case EACCES:
            case EPERM:
            case EROFS:
                code = ErrorCode::PermissionDenied;
                break;
            case EEXIST:
                code = ErrorCode::AlreadyExists;
                break;
            case ENOSPC:
            case EDQUOT:
                code = ErrorCode::DiskFull;
                break;
            case ENAMETOOLONG:
            case EINVAL:
                code = ErrorCode::InvalidPath;
                break;
            default:
                break;
        }
    }
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:     return "file not found";
        case ErrorCode::PermissionDenied: return "permission denied";
        case ErrorCode::InvalidPath:      return "invalid path";
        case ErrorCode::AlreadyExists:    return "already exists";
        case ErrorCode::DiskFull:         return "disk full";
        case ErrorCode::EncodingError:    return "encoding error";
        case ErrorCode::IoError:          return "i/o error";
        case ErrorCode::InvalidConfig:    return "invalid config";
        case ErrorCode::Aborted:          return "aborted";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::Unknown:          break;
    }
    return "unknown";
}

Error log_and_return(spdlog::logger& logger, Error&& err) {
    auto level = err.stops_walk() ? spdlog::level::warn : spdlog::level::err;
    logger.log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace lazycp::infra
