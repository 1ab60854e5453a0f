// ============= test/test_backend_prober.cpp =============
#include "database/backend.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <fstream>

TEST(BackendProber, PrefersSqliteWhenDuckDbDisabled) {
    TempDir tmp;
    StoreConfig cfg = sqlite_config(tmp);

    BackendHandle handle = select_backend(cfg);
    EXPECT_EQ(handle.kind(), BackendKind::Sqlite);
    EXPECT_TRUE(std::filesystem::exists(cfg.sqlite_path));
}

TEST(BackendProber, FallsBackWhenSqliteCannotOpen) {
    TempDir tmp;
    std::string blocker = tmp.file("blocker");
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    StoreConfig cfg = sqlite_config(tmp);
    cfg.sqlite_path = blocker + "/store.sqlite";

    BackendHandle handle = select_backend(cfg);
    EXPECT_EQ(handle.kind(), BackendKind::Fallback);
}

TEST(BackendProber, FallbackWhenNativeBackendsDisabled) {
    TempDir tmp;
    StoreConfig cfg = fallback_config(tmp);

    BackendHandle handle = select_backend(cfg);
    EXPECT_EQ(handle.kind(), BackendKind::Fallback);

    // Handle dispatches to the live store
    handle.visit([](auto& store) { store.ensure_schema(); });
    auto stats = handle.visit([](auto& store) { return store.stats(); });
    EXPECT_EQ(stats.type_count, 41);
}

TEST(BackendProber, DuckDbSelectedWhenCompiledIn) {
    if (!duckdb_compiled_in()) {
        GTEST_SKIP() << "built without DuckDB";
    }

    TempDir tmp;
    StoreConfig cfg = sqlite_config(tmp);
    cfg.enable_duckdb = true;
    cfg.duckdb_path = tmp.file("store.duckdb");

    BackendHandle handle = select_backend(cfg);
    EXPECT_EQ(handle.kind(), BackendKind::DuckDb);
}

TEST(BackendProber, BackendNames) {
    EXPECT_STREQ(to_string(BackendKind::DuckDb), "duckdb");
    EXPECT_STREQ(to_string(BackendKind::Sqlite), "sqlite");
    EXPECT_STREQ(to_string(BackendKind::Fallback), "fallback");
}
