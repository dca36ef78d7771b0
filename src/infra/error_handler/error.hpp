#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace rmirror::infra {

enum class ErrorCode {
    // Фатальные ошибки (конфигурация и локальные пути, не повторяются)
    InvalidConfig,
    InvalidPath,
    PermissionDenied,
    FileNotFound,

    // Ресурсы и отмена (не повторяются, возвращаются сразу)
    DiskFull,
    Interrupted,

    // Временные ошибки передачи (retry с backoff)
    ConnectionFailed,
    NetworkTimeout,
    ProtocolError,
    RemoteRejected,
    SizeMismatch,
    IoError,

    // Уровень каталога / журнала
    ListingFailed,
    LedgerCorrupt,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto is_transient() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Переводит std::error_code файловой системы в наш ErrorCode.
[[nodiscard]] auto from_error_code(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace rmirror::infra
