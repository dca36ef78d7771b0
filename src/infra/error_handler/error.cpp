#include "error.hpp"
#include <fmt/core.h>
#include <cerrno>
#include <cstdlib>

namespace rmirror::infra {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:    return "invalid_config";
        case ErrorCode::InvalidPath:      return "invalid_path";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::FileNotFound:     return "file_not_found";
        case ErrorCode::DiskFull:         return "disk_full";
        case ErrorCode::Interrupted:      return "interrupted";
        case ErrorCode::ConnectionFailed: return "connection_error";
        case ErrorCode::NetworkTimeout:   return "timeout";
        case ErrorCode::ProtocolError:    return "protocol_error";
        case ErrorCode::RemoteRejected:   return "remote_rejected";
        case ErrorCode::SizeMismatch:     return "size_mismatch";
        case ErrorCode::IoError:          return "io_error";
        case ErrorCode::ListingFailed:    return "listing_failed";
        case ErrorCode::LedgerCorrupt:    return "ledger_corrupt";
        case ErrorCode::Unknown:          break;
    }
    return "unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::InvalidPath:
        case ErrorCode::PermissionDenied:
        case ErrorCode::FileNotFound:
            return true;
        default:
            return false;
    }
}

bool Error::is_transient() const {
    switch (code) {
        case ErrorCode::ConnectionFailed:
        case ErrorCode::NetworkTimeout:
        case ErrorCode::ProtocolError:
        case ErrorCode::RemoteRejected:
        case ErrorCode::SizeMismatch:
        case ErrorCode::IoError:
        case ErrorCode::Unknown:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::DiskFull:      return 20;
        case ErrorCode::ListingFailed: return 21;
        case ErrorCode::SizeMismatch:  return 22;
        case ErrorCode::Interrupted:   return 130; // SIGINT
        default:                       return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error from_error_code(const std::error_code& ec, std::string_view context,
                     const std::source_location& loc) {
    auto code = ErrorCode::IoError;
    if (ec == std::errc::no_space_on_device) {
        code = ErrorCode::DiskFull;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PermissionDenied;
    } else if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::FileNotFound;
    }
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace rmirror::infra
