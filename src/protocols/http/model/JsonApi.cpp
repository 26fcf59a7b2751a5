#include "protocols/http/model/JsonApi.hpp"
#include "util/timestamp.hpp"

#include <optional>

using namespace dp::fs::model;
using json = nlohmann::json;

namespace dp::protocols::http::model::jsonapi {

static json timestamp(const std::optional<Timestamp>& t) {
    if (!t) return nullptr;
    return util::formatRfc3339Nano(*t);
}

json resource(const Descriptor& desc) {
    const auto& m = desc.metadata;

    json attributes = {
        {"name", m.name},
        {"resource_kind", std::string(to_string(m.resourceKind))},
        {"size_bytes", m.sizeBytes ? json(*m.sizeBytes) : json(nullptr)},
        {"permission_mode", m.permissionMode},
        {"user", m.user},
        {"group", m.group},
        {"user_id", m.userId},
        {"group_id", m.groupId},
        {"mime_type", m.mimeType},
        {"accessed_at", timestamp(m.accessedAt)},
        {"modified_at", timestamp(m.modifiedAt)},
        {"changed_at", timestamp(m.changedAt)},
        {"born_at", timestamp(m.bornAt)}
    };

    const auto self = m.virtualPath == "/" ? std::string(FILES_PREFIX) : FILES_PREFIX + m.virtualPath;

    return {
        {"id", m.virtualPath},
        {"type", "files"},
        {"attributes", std::move(attributes)},
        {"links", {{"self", self}}}
    };
}

json collection(const query::Page& page) {
    json data = json::array();
    for (const auto& entry : page.entries) data.push_back(resource(entry));

    const auto& l = page.links;
    return {
        {"meta", {{"total_count", page.totalCount}, {"offset", page.offset}, {"limit", page.limit}}},
        {"data", std::move(data)},
        {"links", {
            {"self", l.self},
            {"first", l.first},
            {"last", l.last},
            {"prev", l.prev ? json(*l.prev) : json(nullptr)},
            {"next", l.next ? json(*l.next) : json(nullptr)}
        }}
    };
}

json error(const unsigned int status, const std::string_view title, const std::string_view detail) {
    const json object = {
        {"status", std::to_string(status)},
        {"title", std::string(title)},
        {"detail", std::string(detail)}
    };
    return {{"errors", json::array({object})}};
}

json ping() {
    return {
        {"meta", {{"page", {
            {"currentPage", 1}, {"from", 1}, {"lastPage", 1}, {"perPage", 1}, {"to", 1}, {"total", 1}
        }}}},
        {"links", {{"self", PING_PATH}, {"first", PING_PATH}, {"last", PING_PATH}}},
        {"data", {{"type", "ping"}, {"id", "ping"}, {"attributes", {{"message", "pong"}}}}}
    };
}

}
