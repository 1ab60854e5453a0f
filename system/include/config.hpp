// ============= include/config.hpp =============
/*
 * Store configuration
 *
 * SimpleToml: minimal TOML reader ([section], key = value, "strings", # comments)
 * StoreConfig: typed settings with defaults, filled from a SimpleToml file
 *
 *   [storage]  duckdb_path, sqlite_path, snapshot_path, enable_duckdb, enable_sqlite
 *   [index]    dimension, capacity, m, ef_construction, ef_search,
 *              exact_search_threshold, seed
 *   [runtime]  worker_threads
 *   [log]      level
 */

#pragma once
#include <cstdint>
#include <map>
#include <string>

class SimpleToml {
public:
    bool load(const std::string& filename);
    bool parse(const std::string& text);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

private:
    std::map<std::string, std::string> values;
};

struct StoreConfig {
    // Storage
    std::string duckdb_path = "data/personadb.duckdb";
    std::string sqlite_path = "data/personadb.sqlite";
    std::string snapshot_path = "data/personadb.json";
    bool enable_duckdb = true;
    bool enable_sqlite = true;

    // Vector index
    int dimension = 384;
    int capacity = 10000;
    int m = 16;
    int ef_construction = 200;
    int ef_search = 64;
    int exact_search_threshold = 2048;
    uint32_t seed = 100;

    // Runtime
    int worker_threads = 2;
    std::string log_level = "info";

    static StoreConfig from_toml(const SimpleToml& toml);

    // Missing file -> defaults with a warning
    static StoreConfig load(const std::string& filename);
};
