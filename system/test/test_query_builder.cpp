// ============= test/test_query_builder.cpp =============
#include "database/query_builder.hpp"
#include <gtest/gtest.h>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(QueryBuilder, EscapesLikeWildcards) {
    EXPECT_EQ(escape_like("50%_off\\"), "50\\%\\_off\\\\");
    EXPECT_EQ(escape_like("plain"), "plain");
}

TEST(QueryBuilder, DefaultQuerySortsByNameAndPaginates) {
    EntityQuery query;
    auto stmt = build_entity_list_query(query, SqlDialect::Sqlite);

    // The rating_count subquery has its own WHERE; the outer query must not
    std::string outer = stmt.text.substr(stmt.text.find("FROM entities e"));
    EXPECT_FALSE(contains(outer, "WHERE"));
    EXPECT_FALSE(contains(stmt.text, "e.category = ?"));
    EXPECT_TRUE(contains(stmt.text, "ORDER BY e.name ASC, e.id ASC"));
    EXPECT_TRUE(contains(stmt.text, "LIMIT ? OFFSET ?"));

    ASSERT_EQ(stmt.params.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(stmt.params[0]), 50);
    EXPECT_EQ(std::get<int64_t>(stmt.params[1]), 0);
}

TEST(QueryBuilder, SearchIsBoundAndEscaped) {
    EntityQuery query;
    query.search = "100%";
    auto stmt = build_entity_list_query(query, SqlDialect::Sqlite);

    EXPECT_TRUE(contains(stmt.text, "e.name LIKE ? ESCAPE"));
    EXPECT_TRUE(contains(stmt.text, "e.notes LIKE ?"));
    EXPECT_FALSE(contains(stmt.text, "100"));

    ASSERT_EQ(stmt.params.size(), 5u);
    EXPECT_EQ(std::get<std::string>(stmt.params[0]), "%100\\%%");
}

TEST(QueryBuilder, DuckDbUsesIlike) {
    EntityQuery query;
    query.search = "ada";
    auto stmt = build_entity_list_query(query, SqlDialect::DuckDb);
    EXPECT_TRUE(contains(stmt.text, "e.name ILIKE ?"));
}

TEST(QueryBuilder, CategoryAndKindFiltersAreAnded) {
    EntityQuery query;
    query.category = "anime";
    query.kind = EntityKind::FictionalCharacter;
    query.limit = 5;
    query.offset = 10;
    auto stmt = build_entity_list_query(query, SqlDialect::Sqlite);

    EXPECT_TRUE(contains(stmt.text, "WHERE e.category = ? AND e.entity_kind = ?"));
    ASSERT_EQ(stmt.params.size(), 4u);
    EXPECT_EQ(std::get<std::string>(stmt.params[0]), "anime");
    EXPECT_EQ(std::get<std::string>(stmt.params[1]), "fictional_character");
    EXPECT_EQ(std::get<int64_t>(stmt.params[2]), 5);
    EXPECT_EQ(std::get<int64_t>(stmt.params[3]), 10);
}

TEST(QueryBuilder, SortOrders) {
    EntityQuery query;

    query.sort = EntitySort::NameDesc;
    EXPECT_TRUE(contains(build_entity_list_query(query, SqlDialect::Sqlite).text,
                         "ORDER BY e.name DESC"));

    query.sort = EntitySort::Category;
    EXPECT_TRUE(contains(build_entity_list_query(query, SqlDialect::Sqlite).text,
                         "ORDER BY e.category ASC, e.name ASC"));

    query.sort = EntitySort::RatingCount;
    EXPECT_TRUE(contains(build_entity_list_query(query, SqlDialect::Sqlite).text,
                         "ORDER BY rating_count DESC, e.name ASC"));

    query.sort = EntitySort::Recent;
    EXPECT_TRUE(contains(build_entity_list_query(query, SqlDialect::Sqlite).text,
                         "ORDER BY e.updated_at DESC, e.name ASC"));
}

TEST(QueryBuilder, SortNamesParse) {
    EXPECT_EQ(parse_entity_sort("name"), EntitySort::NameAsc);
    EXPECT_EQ(parse_entity_sort("name-desc"), EntitySort::NameDesc);
    EXPECT_EQ(parse_entity_sort("ratings"), EntitySort::RatingCount);
    EXPECT_EQ(parse_entity_sort("recent"), EntitySort::Recent);
}

TEST(QueryBuilder, TypingAssignmentQueryHasOnePlaceholderPerId) {
    auto stmt = build_typing_assignment_query({"a", "b", "c"});
    EXPECT_TRUE(contains(stmt.text, "IN (?, ?, ?)"));
    EXPECT_TRUE(contains(stmt.text, "GROUP BY entity_id, system_name, type_code"));
    EXPECT_EQ(stmt.params.size(), 3u);
}
