// ============= test/test_schema_manager.cpp =============
#include "database/schema_manager.hpp"
#include "database/sqlite_connection.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

namespace {

int64_t count(SqliteConnection& conn, const std::string& sql) {
    auto rows = conn.query({sql, {}});
    return rows.empty() ? 0 : int_at(rows[0], 0);
}

}  // namespace

TEST(SchemaManager, CreatesEveryTable) {
    SqliteConnection conn(":memory:");
    SchemaManager::ensure_schema(conn);

    for (const auto& table : SchemaManager::table_names()) {
        auto rows = conn.query({"SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?",
                                {table}});
        EXPECT_EQ(rows.size(), 1u) << table;
    }
}

TEST(SchemaManager, CreatesIndexes) {
    SqliteConnection conn(":memory:");
    SchemaManager::ensure_schema(conn);

    EXPECT_EQ(count(conn, "SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' "
                          "AND name LIKE 'idx_%'"), 5);
}

TEST(SchemaManager, SeedsCatalogOnce) {
    SqliteConnection conn(":memory:");
    SchemaManager::ensure_schema(conn);
    SchemaManager::ensure_schema(conn);

    EXPECT_EQ(count(conn, "SELECT COUNT(*) FROM typing_systems"), 3);
    EXPECT_EQ(count(conn, "SELECT COUNT(*) FROM type_codes"), 16 + 16 + 9);
    EXPECT_EQ(count(conn, "SELECT COUNT(*) FROM type_codes WHERE system_name = 'mbti' "
                          "AND code = 'INTJ'"), 1);
}

TEST(SchemaManager, InsertCatalogMergesCodes) {
    SqliteConnection conn(":memory:");
    SchemaManager::ensure_schema(conn);

    SchemaManager::insert_catalog(conn, {{"enneagram", "", "", {"9", "1w9", "2w1"}}});

    EXPECT_EQ(count(conn, "SELECT COUNT(*) FROM type_codes WHERE system_name = 'enneagram'"), 11);
    EXPECT_EQ(count(conn, "SELECT position FROM type_codes WHERE system_name = 'enneagram' "
                          "AND code = '2w1'"), 10);
}

TEST(SchemaManager, RejectedDdlRaisesBackendError) {
    SqliteConnection conn(":memory:");
    EXPECT_THROW(conn.execute_script("CREATE TABLE broken ("), BackendError);
}
