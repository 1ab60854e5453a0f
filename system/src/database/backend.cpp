// ============= src/database/backend.cpp =============
#include "database/backend.hpp"
#include "database/sqlite_connection.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

#if PERSONADB_HAVE_DUCKDB
#include "database/duckdb_connection.hpp"
#endif

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::DuckDb: return "duckdb";
        case BackendKind::Sqlite: return "sqlite";
        case BackendKind::Fallback: return "fallback";
    }
    return "fallback";
}

BackendKind BackendHandle::kind() const {
    if (std::holds_alternative<std::unique_ptr<FallbackStore>>(store)) {
        return BackendKind::Fallback;
    }
    if (std::holds_alternative<std::unique_ptr<SqliteRecordStore>>(store)) {
        return BackendKind::Sqlite;
    }
    return BackendKind::DuckDb;
}

bool duckdb_compiled_in() {
#if PERSONADB_HAVE_DUCKDB
    return true;
#else
    return false;
#endif
}

BackendHandle select_backend(const StoreConfig& config) {
    if (config.enable_duckdb) {
#if PERSONADB_HAVE_DUCKDB
        try {
            auto store = std::make_unique<DuckDbRecordStore>(
                std::make_unique<DuckDbConnection>(config.duckdb_path));
            spdlog::info("✓ Backend: duckdb ({})", config.duckdb_path);
            return BackendHandle(std::move(store));
        } catch (const BackendError& e) {
            spdlog::warn("DuckDB unavailable: {}", e.what());
        }
#else
        spdlog::info("DuckDB support not compiled in, skipping");
#endif
    }

    if (config.enable_sqlite) {
        try {
            auto store = std::make_unique<SqliteRecordStore>(
                std::make_unique<SqliteConnection>(config.sqlite_path));
            spdlog::info("✓ Backend: sqlite ({})", config.sqlite_path);
            return BackendHandle(std::move(store));
        } catch (const BackendError& e) {
            spdlog::warn("SQLite unavailable: {}", e.what());
        }
    }

    BackendUnavailableError unavailable("no native backend could be opened");
    spdlog::warn("{}; using fallback snapshot {}", unavailable.what(), config.snapshot_path);

    return BackendHandle(std::make_unique<FallbackStore>(config.snapshot_path));
}
