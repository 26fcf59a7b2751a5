#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace dp::fs {

enum class ErrorCode {
    RootNotFound,
    OutsideRoot,
    NotFound,
    PermissionDenied,
    NotADirectory,
    StatFailure,
    Canceled,
    InvalidRoot
};

std::string_view to_string(ErrorCode code);

// Messages carry the virtual path only. Host paths stay in the log.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message, std::string virtualPath = {});

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& virtualPath() const noexcept { return virtualPath_; }

private:
    ErrorCode code_;
    std::string virtualPath_;
};

/// Maps a failed syscall (stat, lstat, realpath, opendir...) to the fs error taxonomy.
[[nodiscard]] Error errorFromSystem(const std::error_code& ec, std::string_view op, const std::string& virtualPath);

}
