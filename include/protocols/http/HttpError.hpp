#pragma once

#include <ostream>
#include <boost/beast/http/status.hpp>
#include <exception>
#include <stdexcept>
#include <string>

namespace dp::protocols::http {

using status = boost::beast::http::status;

// Raised by the transport itself (bad target, unknown root). The message is the client-facing detail.
class HttpError : public std::runtime_error {
public:
    HttpError(const status code, const std::string& detail) : std::runtime_error(detail), code_(code) {}

    [[nodiscard]] status code() const noexcept { return code_; }

private:
    status code_;
};

inline constexpr const char* INTERNAL_ERROR_DETAIL = "An unexpected error occurred.";

struct ErrorReply {
    status code{status::internal_server_error};
    std::string detail;
};

/// Client-safe status and detail for anything a handler throws. Unknown exceptions become a generic 500.
ErrorReply toErrorReply(const std::exception& e);

}
