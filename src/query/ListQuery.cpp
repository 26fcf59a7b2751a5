#include "query/ListQuery.hpp"

#include <algorithm>
#include <iterator>
#include <fmt/format.h>

using namespace dp::query;
using namespace dp::fs::model;

namespace {

template <typename T>
bool lessOptional(const std::optional<T>& a, const std::optional<T>& b) {
    if (!a) return b.has_value();
    if (!b) return false;
    return *a < *b;
}

bool lessBy(const SortField field, const Metadata& a, const Metadata& b) {
    switch (field) {
    case SortField::Name:           return a.name < b.name;
    case SortField::ResourceKind:   return to_string(a.resourceKind) < to_string(b.resourceKind);
    case SortField::SizeBytes:      return lessOptional(a.sizeBytes, b.sizeBytes);
    case SortField::PermissionMode: return a.permissionMode < b.permissionMode;
    case SortField::User:           return a.user < b.user;
    case SortField::Group:          return a.group < b.group;
    case SortField::UserId:         return a.userId < b.userId;
    case SortField::GroupId:        return a.groupId < b.groupId;
    case SortField::MimeType:       return a.mimeType < b.mimeType;
    case SortField::AccessedAt:     return lessOptional(a.accessedAt, b.accessedAt);
    case SortField::ModifiedAt:     return lessOptional(a.modifiedAt, b.modifiedAt);
    case SortField::ChangedAt:      return lessOptional(a.changedAt, b.changedAt);
    case SortField::BornAt:         return lessOptional(a.bornAt, b.bornAt);
    }
    return a.name < b.name;
}

}

void dp::query::sortDescriptors(std::vector<Descriptor>& entries, const SortField field, const bool descending) {
    // Descending swaps the operands. A negated comparator is not a strict weak ordering.
    std::ranges::stable_sort(entries, [field, descending](const Descriptor& a, const Descriptor& b) {
        return descending ? lessBy(field, b.metadata, a.metadata) : lessBy(field, a.metadata, b.metadata);
    });
}

PaginationLinks dp::query::buildPaginationLinks(const std::string_view basePath, const ListParams& params, const std::size_t total) {
    const auto url = [&](const std::size_t offset) {
        auto u = fmt::format("{}?page[offset]={}&page[limit]={}", basePath, offset, params.limit);
        if (!params.isDefaultSort())
            u += fmt::format("&sort={}{}", params.descending ? "-" : "", to_string(params.sortField));
        return u;
    };

    const std::size_t lastOffset = total > 0 ? ((total - 1) / params.limit) * params.limit : 0;

    PaginationLinks links{url(params.offset), url(0), url(lastOffset)};

    if (params.offset > 0)
        links.prev = url(params.offset > params.limit ? params.offset - params.limit : 0);

    if (static_cast<std::size_t>(params.offset) + params.limit < total)
        links.next = url(static_cast<std::size_t>(params.offset) + params.limit);

    return links;
}

Page dp::query::apply(std::vector<Descriptor> entries, const ListParams& params, const std::string_view basePath) {
    sortDescriptors(entries, params.sortField, params.descending);

    Page page;
    page.totalCount = entries.size();
    page.offset = params.offset;
    page.limit = params.limit;
    page.links = buildPaginationLinks(basePath, params, page.totalCount);

    const auto start = std::min<std::size_t>(params.offset, page.totalCount);
    const auto end = std::min<std::size_t>(start + params.limit, page.totalCount);
    page.entries.assign(std::make_move_iterator(entries.begin() + static_cast<std::ptrdiff_t>(start)),
                        std::make_move_iterator(entries.begin() + static_cast<std::ptrdiff_t>(end)));
    return page;
}
