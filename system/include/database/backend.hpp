// ============= include/database/backend.hpp =============
/*
 * Backend selection
 *
 * Preference order: DuckDB -> SQLite -> fallback JSON snapshot.
 * Chosen once per PersonaStore; there is no switching at runtime.
 *
 * BackendHandle owns exactly one record store and forwards calls with
 * visit(), so every store only has to share member names, not a base class.
 */

#pragma once
#include "config.hpp"
#include "database/record_store.hpp"
#include "database/fallback_store.hpp"
#include <memory>
#include <variant>

enum class BackendKind {
    DuckDb,
    Sqlite,
    Fallback
};

const char* to_string(BackendKind kind);

class BackendHandle {
public:
    using Variant = std::variant<
#if PERSONADB_HAVE_DUCKDB
        std::unique_ptr<DuckDbRecordStore>,
#endif
        std::unique_ptr<SqliteRecordStore>,
        std::unique_ptr<FallbackStore>>;

    explicit BackendHandle(Variant store) : store(std::move(store)) {}

    BackendKind kind() const;

    template<typename Fn>
    decltype(auto) visit(Fn&& fn) {
        return std::visit([&](auto& ptr) -> decltype(auto) { return fn(*ptr); }, store);
    }

private:
    Variant store;
};

// Whether the DuckDB backend was compiled in
bool duckdb_compiled_in();

// Never fails: the fallback store is the last resort
BackendHandle select_backend(const StoreConfig& config);
