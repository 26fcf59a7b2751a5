#include "query/ListParams.hpp"

#include <array>
#include <charconv>
#include <limits>
#include <fmt/format.h>
#include <utility>

using namespace dp::query;

namespace {

constexpr std::array<std::pair<SortField, std::string_view>, 13> SORT_FIELDS{{
    {SortField::Name, "name"},
    {SortField::ResourceKind, "resource_kind"},
    {SortField::SizeBytes, "size_bytes"},
    {SortField::PermissionMode, "permission_mode"},
    {SortField::User, "user"},
    {SortField::Group, "group"},
    {SortField::UserId, "user_id"},
    {SortField::GroupId, "group_id"},
    {SortField::MimeType, "mime_type"},
    {SortField::AccessedAt, "accessed_at"},
    {SortField::ModifiedAt, "modified_at"},
    {SortField::ChangedAt, "changed_at"},
    {SortField::BornAt, "born_at"},
}};

std::optional<long long> parseInt(const std::string& s) {
    long long v = 0;
    const auto* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data() + (s.starts_with('+') ? 1 : 0), end, v);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return v;
}

const std::string* find(const std::unordered_map<std::string, std::string>& query, const std::string& key) {
    const auto it = query.find(key);
    if (it == query.end() || it->second.empty()) return nullptr;
    return &it->second;
}

}

std::string_view dp::query::to_string(const SortField field) {
    for (const auto& [f, name] : SORT_FIELDS)
        if (f == field) return name;
    return "name";
}

std::optional<SortField> dp::query::sortFieldFromString(const std::string_view name) {
    for (const auto& [f, n] : SORT_FIELDS)
        if (n == name) return f;
    return std::nullopt;
}

ListParams dp::query::parseListParams(const std::unordered_map<std::string, std::string>& query) {
    ListParams params;

    if (const auto* limitStr = find(query, "page[limit]")) {
        const auto limit = parseInt(*limitStr);
        if (!limit || *limit < 1)
            throw InvalidQueryParameter("invalid page[limit]: must be a positive integer");
        if (*limit > MAX_LIMIT)
            throw InvalidQueryParameter(fmt::format("page[limit] exceeds maximum of {}", MAX_LIMIT));
        params.limit = static_cast<unsigned int>(*limit);
    }

    if (const auto* offsetStr = find(query, "page[offset]")) {
        const auto offset = parseInt(*offsetStr);
        if (!offset || *offset < 0 || *offset > std::numeric_limits<unsigned int>::max())
            throw InvalidQueryParameter("invalid page[offset]: must be a non-negative integer");
        params.offset = static_cast<unsigned int>(*offset);
    }

    if (const auto* sortStr = find(query, "sort")) {
        if (sortStr->find(',') != std::string::npos)
            throw InvalidQueryParameter("sorting by multiple fields is not supported");

        std::string_view field = *sortStr;
        if (field.starts_with('-')) {
            params.descending = true;
            field.remove_prefix(1);
        }

        const auto parsed = sortFieldFromString(field);
        if (!parsed) throw InvalidQueryParameter(fmt::format("invalid sort field: {}", field));
        params.sortField = *parsed;
    }

    return params;
}
