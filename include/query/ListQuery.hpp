#pragma once

#include "fs/model/Descriptor.hpp"
#include "query/ListParams.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dp::query {

struct PaginationLinks {
    std::string self, first, last;
    std::optional<std::string> prev{}, next{};
};

struct Page {
    std::vector<fs::model::Descriptor> entries;
    PaginationLinks links;
    std::size_t totalCount{0};
    unsigned int offset{0}, limit{DEFAULT_LIMIT};
};

/// Stable sort over the whole set. Absent sizes and timestamps order before present ones;
/// descending reverses the comparison, so absent values end up last.
void sortDescriptors(std::vector<fs::model::Descriptor>& entries, SortField field, bool descending);

/// self, first and last are always set. prev only when offset > 0, next only when more entries follow.
PaginationLinks buildPaginationLinks(std::string_view basePath, const ListParams& params, std::size_t total);

/// Sorts, then slices [min(offset, total), min(offset + limit, total)).
Page apply(std::vector<fs::model::Descriptor> entries, const ListParams& params, std::string_view basePath);

}
