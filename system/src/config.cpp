// ============= src/config.cpp =============
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Drops a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

}  // namespace

// ==================== SIMPLE TOML ====================

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

bool SimpleToml::parse(const std::string& text) {
    std::istringstream input(text);
    std::string line, section;

    while (std::getline(input, line)) {
        line = trim(strip_comment(line));
        if (line.empty()) continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("config: ignoring malformed line '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.length() - 2);
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
    return true;
}

bool SimpleToml::has(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try {
        return std::stoi(get(key));
    } catch (const std::invalid_argument&) {
        spdlog::warn("config: '{}' is not an integer, using {}", key, def);
    } catch (const std::out_of_range&) {
        spdlog::warn("config: '{}' is out of range, using {}", key, def);
    }
    return def;
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try {
        return std::stof(get(key));
    } catch (const std::invalid_argument&) {
        spdlog::warn("config: '{}' is not a number, using {}", key, def);
    } catch (const std::out_of_range&) {
        spdlog::warn("config: '{}' is out of range, using {}", key, def);
    }
    return def;
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    if (v == "true" || v == "1") return true;
    if (v == "false" || v == "0") return false;
    spdlog::warn("config: '{}' is not a boolean, using {}", key, def);
    return def;
}

// ==================== STORE CONFIG ====================

StoreConfig StoreConfig::from_toml(const SimpleToml& toml) {
    StoreConfig cfg;

    cfg.duckdb_path = toml.get("storage.duckdb_path", cfg.duckdb_path);
    cfg.sqlite_path = toml.get("storage.sqlite_path", cfg.sqlite_path);
    cfg.snapshot_path = toml.get("storage.snapshot_path", cfg.snapshot_path);
    cfg.enable_duckdb = toml.get_bool("storage.enable_duckdb", cfg.enable_duckdb);
    cfg.enable_sqlite = toml.get_bool("storage.enable_sqlite", cfg.enable_sqlite);

    cfg.dimension = toml.get_int("index.dimension", cfg.dimension);
    cfg.capacity = toml.get_int("index.capacity", cfg.capacity);
    cfg.m = toml.get_int("index.m", cfg.m);
    cfg.ef_construction = toml.get_int("index.ef_construction", cfg.ef_construction);
    cfg.ef_search = toml.get_int("index.ef_search", cfg.ef_search);
    cfg.exact_search_threshold = toml.get_int("index.exact_search_threshold",
                                              cfg.exact_search_threshold);
    cfg.seed = static_cast<uint32_t>(toml.get_int("index.seed", static_cast<int>(cfg.seed)));

    cfg.worker_threads = toml.get_int("runtime.worker_threads", cfg.worker_threads);
    cfg.log_level = toml.get("log.level", cfg.log_level);

    StoreConfig defaults;
    if (cfg.dimension <= 0) {
        spdlog::warn("config: index.dimension must be positive, using {}", defaults.dimension);
        cfg.dimension = defaults.dimension;
    }
    if (cfg.capacity <= 0) {
        spdlog::warn("config: index.capacity must be positive, using {}", defaults.capacity);
        cfg.capacity = defaults.capacity;
    }
    if (cfg.m < 2) {
        spdlog::warn("config: index.m must be at least 2, using {}", defaults.m);
        cfg.m = defaults.m;
    }
    if (cfg.worker_threads <= 0) {
        cfg.worker_threads = defaults.worker_threads;
    }

    return cfg;
}

StoreConfig StoreConfig::load(const std::string& filename) {
    SimpleToml toml;
    if (!toml.load(filename)) {
        spdlog::warn("config: could not open {}, using defaults", filename);
        return StoreConfig{};
    }
    return from_toml(toml);
}
