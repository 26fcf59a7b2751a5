#include <gtest/gtest.h>
#include "query/ListQuery.hpp"

#include <chrono>

using namespace dp::query;
using namespace dp::fs::model;

namespace {

Descriptor entry(const std::string& name, std::optional<uintmax_t> size = std::nullopt) {
    Descriptor d;
    d.name = name;
    d.virtualPath = "/" + name;
    d.metadata.name = name;
    d.metadata.virtualPath = d.virtualPath;
    d.metadata.sizeBytes = size;
    return d;
}

std::vector<std::string> names(const std::vector<Descriptor>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.name);
    return out;
}

ListParams params(const std::unordered_map<std::string, std::string>& q) { return parseListParams(q); }

}

TEST(ListParamsTest, Defaults) {
    const auto p = params({});
    EXPECT_EQ(p.limit, DEFAULT_LIMIT);
    EXPECT_EQ(p.offset, 0u);
    EXPECT_EQ(p.sortField, SortField::Name);
    EXPECT_FALSE(p.descending);
    EXPECT_TRUE(p.isDefaultSort());
}

TEST(ListParamsTest, ParsesAllParameters) {
    const auto p = params({{"page[limit]", "25"}, {"page[offset]", "50"}, {"sort", "-modified_at"}});
    EXPECT_EQ(p.limit, 25u);
    EXPECT_EQ(p.offset, 50u);
    EXPECT_EQ(p.sortField, SortField::ModifiedAt);
    EXPECT_TRUE(p.descending);
}

TEST(ListParamsTest, LimitBounds) {
    EXPECT_EQ(params({{"page[limit]", "500"}}).limit, MAX_LIMIT);
    EXPECT_EQ(params({{"page[limit]", "1"}}).limit, 1u);
    EXPECT_THROW(params({{"page[limit]", "501"}}), InvalidQueryParameter);
    EXPECT_THROW(params({{"page[limit]", "0"}}), InvalidQueryParameter);
    EXPECT_THROW(params({{"page[limit]", "-3"}}), InvalidQueryParameter);
    EXPECT_THROW(params({{"page[limit]", "ten"}}), InvalidQueryParameter);
    EXPECT_THROW(params({{"page[limit]", "10x"}}), InvalidQueryParameter);
}

TEST(ListParamsTest, OffsetMustBeNonNegative) {
    EXPECT_EQ(params({{"page[offset]", "0"}}).offset, 0u);
    EXPECT_THROW(params({{"page[offset]", "-1"}}), InvalidQueryParameter);
    EXPECT_THROW(params({{"page[offset]", "abc"}}), InvalidQueryParameter);
}

TEST(ListParamsTest, SortValidation) {
    EXPECT_THROW(params({{"sort", "unknown_field"}}), InvalidQueryParameter);
    EXPECT_THROW(params({{"sort", "-"}}), InvalidQueryParameter);
    try {
        params({{"sort", "name,size_bytes"}});
        FAIL() << "expected multi-field sort to be rejected";
    } catch (const InvalidQueryParameter& e) {
        EXPECT_STREQ(e.what(), "sorting by multiple fields is not supported");
    }
    try {
        params({{"sort", "colour"}});
        FAIL() << "expected unknown field to be rejected";
    } catch (const InvalidQueryParameter& e) {
        EXPECT_STREQ(e.what(), "invalid sort field: colour");
    }
}

TEST(ListParamsTest, EveryAllowListedFieldRoundTrips) {
    for (const auto* f : {"name", "resource_kind", "size_bytes", "permission_mode", "user", "group", "user_id",
                          "group_id", "mime_type", "accessed_at", "modified_at", "changed_at", "born_at"}) {
        const auto p = params({{"sort", f}});
        EXPECT_EQ(to_string(p.sortField), f);
    }
}

TEST(SortDescriptorsTest, AbsentSizesFirstAscendingLastDescending) {
    std::vector<Descriptor> entries{entry("A"), entry("B", 5), entry("C", 2)};

    sortDescriptors(entries, SortField::SizeBytes, false);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"A", "C", "B"}));

    sortDescriptors(entries, SortField::SizeBytes, true);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"B", "C", "A"}));
}

TEST(SortDescriptorsTest, AbsentTimestampsFollowTheSameRule) {
    std::vector<Descriptor> entries{entry("new"), entry("none"), entry("old")};
    const auto now = std::chrono::system_clock::now();
    entries[0].metadata.bornAt = now;
    entries[2].metadata.bornAt = now - std::chrono::hours(1);

    sortDescriptors(entries, SortField::BornAt, false);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"none", "old", "new"}));

    sortDescriptors(entries, SortField::BornAt, true);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"new", "old", "none"}));
}

TEST(SortDescriptorsTest, StableForEqualKeys) {
    std::vector<Descriptor> entries{entry("x", 1), entry("y", 1), entry("z", 1)};
    sortDescriptors(entries, SortField::SizeBytes, false);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"x", "y", "z"}));
    sortDescriptors(entries, SortField::SizeBytes, true);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"x", "y", "z"}));
}

TEST(SortDescriptorsTest, ByName) {
    std::vector<Descriptor> entries{entry("zebra.txt"), entry("alpha.txt")};
    sortDescriptors(entries, SortField::Name, false);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"alpha.txt", "zebra.txt"}));
    sortDescriptors(entries, SortField::Name, true);
    EXPECT_EQ(names(entries), (std::vector<std::string>{"zebra.txt", "alpha.txt"}));
}

TEST(PaginationTest, SliceIsTakenFromTheFullySortedSet) {
    std::vector<Descriptor> entries;
    for (int i = 9; i >= 0; --i) entries.push_back(entry("f" + std::to_string(i)));

    const auto page = apply(entries, params({{"page[limit]", "3"}, {"page[offset]", "3"}}), "/api/v1/files/docs");
    EXPECT_EQ(names(page.entries), (std::vector<std::string>{"f3", "f4", "f5"}));
    EXPECT_EQ(page.totalCount, 10u);
    EXPECT_EQ(page.offset, 3u);
    EXPECT_EQ(page.limit, 3u);
}

TEST(PaginationTest, PageSizeIsMinOfLimitAndRemainder) {
    std::vector<Descriptor> entries;
    for (int i = 0; i < 7; ++i) entries.push_back(entry("f" + std::to_string(i)));

    EXPECT_EQ(apply(entries, params({{"page[limit]", "5"}, {"page[offset]", "5"}}), "/x").entries.size(), 2u);
    EXPECT_EQ(apply(entries, params({{"page[limit]", "5"}, {"page[offset]", "7"}}), "/x").entries.size(), 0u);
    EXPECT_EQ(apply(entries, params({{"page[limit]", "5"}, {"page[offset]", "70"}}), "/x").entries.size(), 0u);
    EXPECT_EQ(apply(entries, params({}), "/x").entries.size(), 7u);
}

TEST(PaginationLinksTest, MiddlePage) {
    const auto links = buildPaginationLinks("/api/v1/files/docs", params({{"page[limit]", "3"}, {"page[offset]", "3"}}), 10);
    EXPECT_EQ(links.self, "/api/v1/files/docs?page[offset]=3&page[limit]=3");
    EXPECT_EQ(links.first, "/api/v1/files/docs?page[offset]=0&page[limit]=3");
    EXPECT_EQ(links.last, "/api/v1/files/docs?page[offset]=9&page[limit]=3");
    ASSERT_TRUE(links.prev);
    EXPECT_EQ(*links.prev, "/api/v1/files/docs?page[offset]=0&page[limit]=3");
    ASSERT_TRUE(links.next);
    EXPECT_EQ(*links.next, "/api/v1/files/docs?page[offset]=6&page[limit]=3");
}

TEST(PaginationLinksTest, FirstAndLastPages) {
    const auto first = buildPaginationLinks("/b", params({{"page[limit]", "5"}}), 10);
    EXPECT_FALSE(first.prev);
    ASSERT_TRUE(first.next);
    EXPECT_EQ(*first.next, "/b?page[offset]=5&page[limit]=5");
    EXPECT_EQ(first.last, "/b?page[offset]=5&page[limit]=5");

    const auto last = buildPaginationLinks("/b", params({{"page[limit]", "5"}, {"page[offset]", "5"}}), 10);
    ASSERT_TRUE(last.prev);
    EXPECT_EQ(*last.prev, "/b?page[offset]=0&page[limit]=5");
    EXPECT_FALSE(last.next);
}

TEST(PaginationLinksTest, PrevClampsToZero) {
    const auto links = buildPaginationLinks("/b", params({{"page[limit]", "5"}, {"page[offset]", "2"}}), 10);
    ASSERT_TRUE(links.prev);
    EXPECT_EQ(*links.prev, "/b?page[offset]=0&page[limit]=5");
}

TEST(PaginationLinksTest, EmptySetLastIsZero) {
    const auto links = buildPaginationLinks("/b", params({}), 0);
    EXPECT_EQ(links.last, "/b?page[offset]=0&page[limit]=200");
    EXPECT_FALSE(links.prev);
    EXPECT_FALSE(links.next);
}

TEST(PaginationLinksTest, NonDefaultSortIsCarried) {
    EXPECT_EQ(buildPaginationLinks("/b", params({{"sort", "-name"}}), 1).self,
              "/b?page[offset]=0&page[limit]=200&sort=-name");
    EXPECT_EQ(buildPaginationLinks("/b", params({{"sort", "size_bytes"}}), 1).self,
              "/b?page[offset]=0&page[limit]=200&sort=size_bytes");
    EXPECT_EQ(buildPaginationLinks("/b", params({{"sort", "name"}}), 1).self,
              "/b?page[offset]=0&page[limit]=200");
}
