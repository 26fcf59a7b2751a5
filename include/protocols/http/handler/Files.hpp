#pragma once

#include "protocols/http/Router.hpp"
#include "fs/model/Root.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dp::fs { class Service; }

namespace dp::protocols::http::handler {

struct Files {
    /// GET /api/v1/files. Lists the configured roots, or the contents of a lone "/" root.
    static model::Response listRoots(const request& req, const fs::Service& service,
                                     const concurrency::RequestContext& ctx);

    /// GET /api/v1/files/<virtual>/<rel>. Lists a folder or streams a file.
    /// rest is the route path after the "/api/v1/files" prefix, still percent-encoded.
    static model::Response getResource(const request& req, std::string_view rest, const fs::Service& service,
                                       const concurrency::RequestContext& ctx);

    /// Longest virtual name first; "/" matches every path. Returns the root and the path below it.
    static std::optional<std::pair<fs::model::Root, std::string>>
    matchRoot(std::string_view requestPath, const std::vector<fs::model::Root>& roots);
};

}
