#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace lazycp::infra {

enum class ErrorCode {
    // Ошибки отдельного файла (логируются, обход продолжается)
    FileNotFound,
    PermissionDenied,
    InvalidPath,
    AlreadyExists,
    DiskFull,
    EncodingError,
    IoError,

    // Ошибки запуска
    InvalidConfig,

    // Прерывают весь обход
    Aborted,
    Interrupted,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    /// true для ошибок, которые останавливают обход дерева целиком.
    [[nodiscard]] auto stops_walk() const -> bool {
        return code == ErrorCode::Aborted || code == ErrorCode::Interrupted;
    }

    [[nodiscard]] auto to_exit_code() const -> int;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Maps an OS error (errno category) onto ErrorCode, keeping ec.message() in the text.
[[nodiscard]] auto make_error_from(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(spdlog::logger& logger, Error&& err) -> Error;

} // namespace lazycp::infra
