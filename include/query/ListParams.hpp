#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace dp::query {

inline constexpr unsigned int DEFAULT_LIMIT = 200;
inline constexpr unsigned int MAX_LIMIT = 500;

enum class SortField {
    Name,
    ResourceKind,
    SizeBytes,
    PermissionMode,
    User,
    Group,
    UserId,
    GroupId,
    MimeType,
    AccessedAt,
    ModifiedAt,
    ChangedAt,
    BornAt
};

std::string_view to_string(SortField field);
std::optional<SortField> sortFieldFromString(std::string_view name);

// Message is safe to hand back to the client verbatim.
class InvalidQueryParameter : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ListParams {
    unsigned int limit{DEFAULT_LIMIT};
    unsigned int offset{0};
    SortField sortField{SortField::Name};
    bool descending{false};

    [[nodiscard]] bool isDefaultSort() const { return sortField == SortField::Name && !descending; }
};

/// Reads page[limit], page[offset] and sort. Absent or empty values keep their defaults.
ListParams parseListParams(const std::unordered_map<std::string, std::string>& query);

}
