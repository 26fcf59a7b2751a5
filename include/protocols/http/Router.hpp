#pragma once

#include "protocols/http/model/Response.hpp"
#include "concurrency/RequestContext.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/http/file_body.hpp>
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace dp::fs { class Service; }

namespace dp::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;

template<class Body>
using response = boost::beast::http::response<Body>;

using string_body = boost::beast::http::string_body;
using file_body   = boost::beast::http::file_body;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

using string_response = response<string_body>;
using file_response   = response<file_body>;

inline std::string_view targetOf(const request& req) {
    const auto t = req.target();
    return {t.data(), t.size()};
}

struct RouterOptions {
    // Raised at shutdown; in-flight listings stop at their next child.
    std::shared_ptr<std::atomic<bool>> interruptFlag{};
    std::chrono::milliseconds requestTimeout{0};
};

class Router {
public:
    explicit Router(const fs::Service& service, RouterOptions opts = {});

    /// Never throws for handler failures: they come back as JSON:API error responses.
    /// Every response carries X-Request-ID.
    [[nodiscard]] model::Response route(request&& req, std::string_view remoteIp = {}) const;

    static model::Response makeFileResponse(const request& req,
                                            file_body::value_type data,
                                            const std::string& mime_type,
                                            const std::string& attachmentName = {});

    static model::Response makeJsonResponse(const request& req,
                                            const nlohmann::json& j,
                                            status status = status::ok);

    static model::Response makeErrorResponse(const request& req,
                                             status status,
                                             const std::string& detail);

    /// 500 for failures outside route(); the connection closes after it is written.
    static model::Response makeInternalErrorResponse(unsigned int version);

    /// Path without query and without trailing slashes ("/" stays "/").
    [[nodiscard]] static std::string routePath(std::string_view target);

private:
    const fs::Service& service_;
    RouterOptions opts_;

    [[nodiscard]] model::Response dispatch(const request& req, const concurrency::RequestContext& ctx) const;
};

}
