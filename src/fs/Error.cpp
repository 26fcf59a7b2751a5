#include "fs/Error.hpp"

#include <cerrno>
#include <fmt/format.h>

namespace dp::fs {

std::string_view to_string(const ErrorCode code) {
    switch (code) {
    case ErrorCode::RootNotFound:     return "root not found";
    case ErrorCode::OutsideRoot:      return "outside root";
    case ErrorCode::NotFound:         return "not found";
    case ErrorCode::PermissionDenied: return "permission denied";
    case ErrorCode::NotADirectory:    return "not a directory";
    case ErrorCode::StatFailure:      return "stat failure";
    case ErrorCode::Canceled:         return "canceled";
    case ErrorCode::InvalidRoot:      return "invalid root";
    }
    return "unknown";
}

Error::Error(const ErrorCode code, const std::string& message, std::string virtualPath)
    : std::runtime_error(message), code_(code), virtualPath_(std::move(virtualPath)) {}

Error errorFromSystem(const std::error_code& ec, const std::string_view op, const std::string& virtualPath) {
    ErrorCode code = ErrorCode::StatFailure;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        switch (ec.value()) {
        case ENOENT:
        case ENOTDIR:
        case ELOOP:
            code = ErrorCode::NotFound;
            break;
        case EACCES:
        case EPERM:
            code = ErrorCode::PermissionDenied;
            break;
        default:
            break;
        }
    }
    return {code, fmt::format("{} {}: {}", op, virtualPath, to_string(code)), virtualPath};
}

}
