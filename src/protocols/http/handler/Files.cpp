#include "protocols/http/handler/Files.hpp"
#include "protocols/http/HttpError.hpp"
#include "protocols/http/model/JsonApi.hpp"
#include "fs/Error.hpp"
#include "fs/MetadataExtractor.hpp"
#include "fs/Service.hpp"
#include "query/ListQuery.hpp"
#include "util/parse.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>

using namespace dp::protocols::http;
using namespace dp::protocols::http::handler;
using namespace dp::fs::model;
using namespace dp::concurrency;
using namespace dp::query;

namespace {

constexpr const auto* OCTET_STREAM = "application/octet-stream";

std::unordered_map<std::string, std::string> queryOf(const request& req) {
    try {
        return dp::util::parse_query_params(targetOf(req));
    } catch (const std::invalid_argument& e) {
        throw HttpError(status::bad_request, fmt::format("invalid query string: {}", e.what()));
    }
}

model::Response collectionResponse(const request& req, std::vector<Descriptor>&& entries,
                                   const ListParams& params, const std::string_view basePath) {
    const auto page = apply(std::move(entries), params, basePath);
    return Router::makeJsonResponse(req, model::jsonapi::collection(page));
}

model::Response serveFile(const request& req, const Descriptor& desc,
                          const std::unordered_map<std::string, std::string>& query) {
    boost::beast::error_code ec;
    file_body::value_type body;
    body.open(desc.absolutePath.c_str(), boost::beast::file_mode::scan, ec);
    if (ec) throw dp::fs::errorFromSystem(std::error_code(ec.value(), std::generic_category()), "open", desc.virtualPath);

    // A link's own sentinel type says nothing about the bytes being sent.
    auto mime = desc.kind == Kind::Symlink
        ? dp::fs::MetadataExtractor::sniffMimeType(desc.absolutePath)
        : desc.metadata.mimeType;
    if (mime.empty()) mime = OCTET_STREAM;

    const auto download = query.find("download");
    const bool attachment = download != query.end() && download->second == "1";

    return Router::makeFileResponse(req, std::move(body), mime, attachment ? desc.metadata.name : std::string{});
}

}

model::Response Files::listRoots(const request& req, const fs::Service& service, const RequestContext& ctx) {
    const auto params = parseListParams(queryOf(req));

    // A lone "/" root is listed directly, never as a nested "/" folder.
    auto entries = service.hasSingleSlashRoot() ? service.list("/", "", ctx) : service.listRoots(ctx);
    return collectionResponse(req, std::move(entries), params, model::jsonapi::FILES_PREFIX);
}

model::Response Files::getResource(const request& req, const std::string_view rest,
                                   const fs::Service& service, const RequestContext& ctx) {
    if (rest.empty() || rest == "/") throw HttpError(status::not_found, "file path required");

    std::string decoded;
    try {
        decoded = util::url_decode(rest.substr(1), false);
    } catch (const std::invalid_argument& e) {
        throw HttpError(status::bad_request, fmt::format("invalid path: {}", e.what()));
    }

    const auto requestPath = "/" + decoded;
    const auto match = matchRoot(requestPath, service.roots());
    if (!match) throw HttpError(status::not_found, "file root not found");

    const auto& [root, rel] = *match;
    const auto desc = service.resolve(root.virtualName, rel);

    const auto query = queryOf(req);
    if (desc.isFolder()) {
        const auto params = parseListParams(query);
        auto entries = service.list(root.virtualName, rel, ctx);
        return collectionResponse(req, std::move(entries), params, model::jsonapi::FILES_PREFIX + requestPath);
    }

    log::Registry::http()->debug("[Files] serving {}", desc.virtualPath);
    return serveFile(req, desc, query);
}

std::optional<std::pair<Root, std::string>>
Files::matchRoot(const std::string_view requestPath, const std::vector<Root>& roots) {
    auto sorted = roots;
    std::ranges::stable_sort(sorted, [](const Root& a, const Root& b) {
        return a.virtualName.size() > b.virtualName.size();
    });

    for (const auto& root : sorted) {
        if (root.virtualName == "/") {
            const auto rel = requestPath.starts_with('/') ? requestPath.substr(1) : requestPath;
            return std::make_pair(root, std::string(rel));
        }

        if (requestPath == root.virtualName) return std::make_pair(root, std::string{});

        const auto prefix = root.virtualName + "/";
        if (requestPath.starts_with(prefix))
            return std::make_pair(root, std::string(requestPath.substr(prefix.size())));
    }

    return std::nullopt;
}
