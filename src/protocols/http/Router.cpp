#include "protocols/http/Router.hpp"
#include "protocols/http/HttpError.hpp"
#include "protocols/http/handler/Files.hpp"
#include "protocols/http/handler/Ping.hpp"
#include "protocols/http/model/JsonApi.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cstring>

using namespace dp::protocols::http;
using namespace dp::protocols::http::model;
using namespace dp::concurrency;

namespace {

constexpr const auto* REQUEST_ID_HEADER = "X-Request-ID";

std::string newRequestId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string_view methodOf(const request& req) {
    const auto m = req.method_string();
    return {m.data(), m.size()};
}

std::string headerValue(const request& req, const field f) {
    const auto it = req.find(f);
    if (it == req.end()) return {};
    return {it->value().data(), it->value().size()};
}

bool isPlainAscii(const unsigned char c) { return c >= 0x20 && c < 0x7f; }

bool isAttrChar(const unsigned char c) {
    return std::isalnum(c) || (c != 0 && std::strchr("!#$&+-.^_`|~", c) != nullptr);
}

// RFC 6266: quoted ASCII fallback, plus filename* when the name has bytes the fallback cannot carry.
std::string attachmentDisposition(const std::string& name) {
    std::string out = "attachment; filename=\"";
    bool needsExtended = false;
    for (const char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        if (!isPlainAscii(c)) {
            out += '_';
            needsExtended = true;
            continue;
        }
        if (c == '"' || c == '\\') out += '\\';
        out += ch;
    }
    out += '"';

    if (needsExtended) {
        out += "; filename*=UTF-8''";
        for (const char ch : name) {
            const auto c = static_cast<unsigned char>(ch);
            if (c < 0x80 && isAttrChar(c)) out += ch;
            else out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

}

Router::Router(const fs::Service& service, RouterOptions opts)
    : service_(service), opts_(std::move(opts)) {}

std::string Router::routePath(const std::string_view target) {
    std::string path(target.substr(0, target.find('?')));
    while (path.size() > 1 && path.ends_with('/')) path.pop_back();
    if (path.empty()) path = "/";
    return path;
}

Response Router::route(request&& req, const std::string_view remoteIp) const {
    const auto incomingId = req.find(REQUEST_ID_HEADER);
    const auto requestId = incomingId != req.end() && !incomingId->value().empty()
        ? std::string(incomingId->value().data(), incomingId->value().size())
        : newRequestId();

    const RequestContext ctx(opts_.interruptFlag, opts_.requestTimeout);

    Response res;
    try {
        res = dispatch(req, ctx);
    } catch (const std::exception& e) {
        const auto reply = toErrorReply(e);
        if (reply.code == status::internal_server_error)
            log::Registry::http()->error("[Router] {} {} failed: {}", methodOf(req), targetOf(req), e.what());
        else
            log::Registry::http()->debug("[Router] {} {}: {}", methodOf(req), targetOf(req), e.what());
        res = makeErrorResponse(req, reply.code, reply.detail);
    }

    unsigned int code = 0;
    std::visit([&](auto& r) {
        r.set(REQUEST_ID_HEADER, requestId);
        code = r.result_int();
    }, res);

    log::Registry::http()->debug("new request request_id={} path={} method={} remote_ip={} user_agent={} status={}",
                                 requestId, routePath(targetOf(req)), methodOf(req), remoteIp,
                                 headerValue(req, field::user_agent), code);
    return res;
}

Response Router::dispatch(const request& req, const RequestContext& ctx) const {
    const auto path = routePath(targetOf(req));
    const std::string filesPrefix = jsonapi::FILES_PREFIX;

    const bool isPing = path == jsonapi::PING_PATH;
    const bool isFiles = path == filesPrefix || path.starts_with(filesPrefix + "/");

    if (!isPing && !isFiles) throw HttpError(status::not_found, "Not Found");
    if (req.method() != verb::get) throw HttpError(status::method_not_allowed, "Method Not Allowed");

    if (isPing) return handler::Ping::handle(req);
    if (path == filesPrefix) return handler::Files::listRoots(req, service_, ctx);
    return handler::Files::getResource(req, std::string_view(path).substr(filesPrefix.size()), service_, ctx);
}

Response Router::makeFileResponse(const request& req, file_body::value_type data,
                                  const std::string& mime_type, const std::string& attachmentName) {
    const auto size = data.size();

    file_response res{
        std::piecewise_construct,
        std::make_tuple(std::move(data)),
        std::make_tuple(status::ok, req.version())
    };

    res.set(field::content_type, mime_type);
    if (!attachmentName.empty())
        res.set(field::content_disposition, attachmentDisposition(attachmentName));
    res.content_length(size);
    res.keep_alive(req.keep_alive());
    return res;
}

Response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status status) {
    string_response res{status, req.version()};
    res.set(field::content_type, jsonapi::CONTENT_TYPE);
    res.body() = j.dump();
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

Response Router::makeErrorResponse(const request& req, const status status, const std::string& detail) {
    const auto reason = boost::beast::http::obsolete_reason(status);
    const auto body = jsonapi::error(static_cast<unsigned int>(status), std::string(reason.data(), reason.size()), detail);
    return makeJsonResponse(req, body, status);
}

Response Router::makeInternalErrorResponse(const unsigned int version) {
    request req{verb::get, "/", version};
    req.keep_alive(false);
    return makeErrorResponse(req, status::internal_server_error, INTERNAL_ERROR_DETAIL);
}
