// ============= include/database/schema_manager.hpp =============
/*
 * Relational schema + typing catalog seed
 *
 * TABLES:
 * - entities, users, ratings, comments, edit_history
 * - typing_systems, type_codes (catalog)
 * - entity_embeddings (one float BLOB per entity)
 *
 * ensure_schema() is idempotent: CREATE ... IF NOT EXISTS, and the catalog
 * is only seeded while typing_systems is empty (one transaction).
 */

#pragma once
#include "core/types.hpp"
#include "database/sql_value.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

class SchemaManager {
public:
    static const char* ddl();
    static const std::vector<std::string>& table_names();

    // socionics (16), mbti (16), enneagram (1..9)
    static const std::vector<TypingSystem>& default_catalog();

    template<typename Connection>
    static void ensure_schema(Connection& conn);

    // Inserts missing systems/codes; existing rows are left untouched
    template<typename Connection>
    static void insert_catalog(Connection& conn, const std::vector<TypingSystem>& systems);
};

// ==================== IMPLEMENTATION ====================

template<typename Connection>
void SchemaManager::ensure_schema(Connection& conn) {
    conn.execute_script(ddl());

    auto rows = conn.query({"SELECT COUNT(*) FROM typing_systems", {}});
    if (!rows.empty() && int_at(rows[0], 0) > 0) {
        spdlog::debug("{} schema ready, catalog present", Connection::backend_name());
        return;
    }

    conn.begin();
    try {
        insert_catalog(conn, default_catalog());
        conn.commit();
    } catch (const std::exception&) {
        conn.rollback();
        throw;
    }

    size_t codes = 0;
    for (const auto& system : default_catalog()) {
        codes += system.type_codes.size();
    }
    spdlog::info("✓ Seeded typing catalog on {} ({} systems, {} codes)",
                 Connection::backend_name(), default_catalog().size(), codes);
}

template<typename Connection>
void SchemaManager::insert_catalog(Connection& conn, const std::vector<TypingSystem>& systems) {
    for (const auto& system : systems) {
        conn.execute({
            "INSERT INTO typing_systems (name, display_name, description) VALUES (?, ?, ?) "
            "ON CONFLICT (name) DO NOTHING",
            {system.name, system.display_name, system.description}});

        auto rows = conn.query({
            "SELECT COALESCE(MAX(position), -1) FROM type_codes WHERE system_name = ?",
            {system.name}});
        int64_t position = rows.empty() ? 0 : int_at(rows[0], 0) + 1;

        for (const auto& code : system.type_codes) {
            int64_t changed = conn.execute({
                "INSERT INTO type_codes (system_name, code, position) VALUES (?, ?, ?) "
                "ON CONFLICT (system_name, code) DO NOTHING",
                {system.name, code, position}});
            if (changed > 0) {
                ++position;
            }
        }
    }
}
