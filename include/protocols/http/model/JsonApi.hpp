#pragma once

#include "fs/model/Descriptor.hpp"
#include "query/ListQuery.hpp"

#include <nlohmann/json.hpp>
#include <string_view>

namespace dp::protocols::http::model::jsonapi {

inline constexpr const auto* CONTENT_TYPE = "application/vnd.api+json";
inline constexpr const auto* FILES_PREFIX = "/api/v1/files";
inline constexpr const auto* PING_PATH = "/api/v1/ping";

/// {"id", "type": "files", "attributes", "links": {"self"}}. Absent attributes are null.
nlohmann::json resource(const fs::model::Descriptor& desc);

/// {"meta": {total_count, offset, limit}, "data": [...], "links": {self, first, last, prev, next}}
nlohmann::json collection(const query::Page& page);

/// {"errors": [{"status", "title", "detail"}]}
nlohmann::json error(unsigned int status, std::string_view title, std::string_view detail);

nlohmann::json ping();

}
