// ============= include/database/query_builder.hpp =============
/*
 * EntityQuery -> parameterized SQL
 *
 * Result columns of build_entity_list_query() (see ENTITY_COLUMNS):
 *   0 id, 1 name, 2 description, 3 entity_kind, 4 category, 5 source,
 *   6 notes, 7 external_id, 8 external_source, 9 metadata, 10 created_at,
 *   11 updated_at, 12 last_modified_by, 13 rating_count
 *
 * Every user value is a bound parameter. Search terms are wrapped in %..%
 * with LIKE wildcards escaped by '\'. SQLite's LIKE is already
 * ASCII case-insensitive; DuckDB needs ILIKE.
 */

#pragma once
#include "core/types.hpp"
#include "database/sql_value.hpp"
#include <string>
#include <vector>

extern const char* const ENTITY_COLUMNS;

std::string escape_like(const std::string& term);

// Validated query in, SELECT ... LIMIT ? OFFSET ? out
SqlStatement build_entity_list_query(const EntityQuery& query, SqlDialect dialect);

// Single entity with the same column layout
SqlStatement build_entity_get_query(const std::string& id);

// Oldest entity imported under (external_source, external_id)
SqlStatement build_entity_external_query(const std::string& external_source,
                                         const std::string& external_id);

// (entity_id, system_name, type_code, count, mean confidence), ordered
SqlStatement build_typing_assignment_query(const std::vector<std::string>& entity_ids);
