#include "protocols/http/HttpError.hpp"
#include "fs/Error.hpp"
#include "query/ListParams.hpp"

using namespace dp::fs;

namespace dp::protocols::http {

ErrorReply toErrorReply(const std::exception& e) {
    if (const auto* httpErr = dynamic_cast<const HttpError*>(&e))
        return {httpErr->code(), httpErr->what()};

    if (const auto* queryErr = dynamic_cast<const query::InvalidQueryParameter*>(&e))
        return {status::bad_request, queryErr->what()};

    if (const auto* fsErr = dynamic_cast<const Error*>(&e)) {
        switch (fsErr->code()) {
        case ErrorCode::RootNotFound:     return {status::not_found, "file root not found"};
        case ErrorCode::OutsideRoot:      return {status::bad_request, "path escapes configured root"};
        case ErrorCode::NotFound:         return {status::not_found, "file not found"};
        case ErrorCode::PermissionDenied: return {status::forbidden, "permission denied"};
        case ErrorCode::NotADirectory:    return {status::bad_request, "not a directory"};
        case ErrorCode::Canceled:         return {status::request_timeout, "request canceled"};
        case ErrorCode::StatFailure:
        case ErrorCode::InvalidRoot:
            break;
        }
    }

    return {status::internal_server_error, INTERNAL_ERROR_DETAIL};
}

}
