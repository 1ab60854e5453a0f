// ============= test/test_config.cpp =============
#include "config.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <fstream>

TEST(SimpleToml, SectionsQuotesAndComments) {
    SimpleToml toml;
    ASSERT_TRUE(toml.parse(
        "# top comment\n"
        "[storage]\n"
        "sqlite_path = \"data/a#b.sqlite\"  # trailing comment\n"
        "enable_duckdb = false\n"
        "\n"
        "[index]\n"
        "dimension = 128\n"
        "ratio = 0.25\n"));

    EXPECT_EQ(toml.get("storage.sqlite_path"), "data/a#b.sqlite");
    EXPECT_FALSE(toml.get_bool("storage.enable_duckdb", true));
    EXPECT_EQ(toml.get_int("index.dimension"), 128);
    EXPECT_FLOAT_EQ(toml.get_float("index.ratio"), 0.25f);
    EXPECT_EQ(toml.get("missing.key", "fallback"), "fallback");
}

TEST(SimpleToml, InvalidNumbersUseDefaults) {
    SimpleToml toml;
    toml.parse("[index]\ndimension = lots\ncapacity = 99999999999999999999\n");

    EXPECT_EQ(toml.get_int("index.dimension", 7), 7);
    EXPECT_EQ(toml.get_int("index.capacity", 5), 5);
}

TEST(StoreConfig, DefaultsWithoutFile) {
    StoreConfig cfg = StoreConfig::load("/nonexistent/personadb.toml");
    EXPECT_EQ(cfg.dimension, 384);
    EXPECT_EQ(cfg.capacity, 10000);
    EXPECT_EQ(cfg.m, 16);
    EXPECT_TRUE(cfg.enable_duckdb);
    EXPECT_TRUE(cfg.enable_sqlite);
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(StoreConfig, LoadsEveryKey) {
    TempDir tmp;
    std::string path = tmp.file("personadb.toml");
    {
        std::ofstream out(path);
        out << "[storage]\n"
               "duckdb_path = \"x.duckdb\"\n"
               "sqlite_path = \"x.sqlite\"\n"
               "snapshot_path = \"x.json\"\n"
               "enable_duckdb = false\n"
               "enable_sqlite = 0\n"
               "[index]\n"
               "dimension = 16\n"
               "capacity = 500\n"
               "m = 8\n"
               "ef_construction = 50\n"
               "ef_search = 20\n"
               "exact_search_threshold = 10\n"
               "seed = 42\n"
               "[runtime]\n"
               "worker_threads = 3\n"
               "[log]\n"
               "level = \"debug\"\n";
    }

    StoreConfig cfg = StoreConfig::load(path);
    EXPECT_EQ(cfg.duckdb_path, "x.duckdb");
    EXPECT_EQ(cfg.sqlite_path, "x.sqlite");
    EXPECT_EQ(cfg.snapshot_path, "x.json");
    EXPECT_FALSE(cfg.enable_duckdb);
    EXPECT_FALSE(cfg.enable_sqlite);
    EXPECT_EQ(cfg.dimension, 16);
    EXPECT_EQ(cfg.capacity, 500);
    EXPECT_EQ(cfg.m, 8);
    EXPECT_EQ(cfg.ef_construction, 50);
    EXPECT_EQ(cfg.ef_search, 20);
    EXPECT_EQ(cfg.exact_search_threshold, 10);
    EXPECT_EQ(cfg.seed, 42u);
    EXPECT_EQ(cfg.worker_threads, 3);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(StoreConfig, NonPositiveIndexSettingsFallBack) {
    SimpleToml toml;
    toml.parse("[index]\ndimension = 0\ncapacity = -4\nm = 1\n");

    StoreConfig cfg = StoreConfig::from_toml(toml);
    EXPECT_EQ(cfg.dimension, 384);
    EXPECT_EQ(cfg.capacity, 10000);
    EXPECT_EQ(cfg.m, 16);
}
