// ============= src/database/query_builder.cpp =============
#include "database/query_builder.hpp"

const char* const ENTITY_COLUMNS =
    "e.id, e.name, e.description, e.entity_kind, e.category, e.source, e.notes, "
    "e.external_id, e.external_source, e.metadata, e.created_at, e.updated_at, "
    "e.last_modified_by, "
    "(SELECT COUNT(*) FROM ratings r WHERE r.entity_id = e.id) AS rating_count";

std::string escape_like(const std::string& term) {
    std::string out;
    out.reserve(term.size());
    for (char c : term) {
        if (c == '\\' || c == '%' || c == '_') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

static const char* order_clause(EntitySort sort) {
    switch (sort) {
        case EntitySort::NameAsc:
            return "e.name ASC, e.id ASC";
        case EntitySort::NameDesc:
            return "e.name DESC, e.id ASC";
        case EntitySort::Category:
            return "e.category ASC, e.name ASC, e.id ASC";
        case EntitySort::RatingCount:
            return "rating_count DESC, e.name ASC, e.id ASC";
        case EntitySort::Recent:
            return "e.updated_at DESC, e.name ASC, e.id ASC";
    }
    return "e.name ASC, e.id ASC";
}

SqlStatement build_entity_list_query(const EntityQuery& query, SqlDialect dialect) {
    SqlStatement stmt;
    std::string sql = std::string("SELECT ") + ENTITY_COLUMNS + " FROM entities e";

    std::vector<std::string> conditions;

    if (!query.search.empty()) {
        const char* like = dialect == SqlDialect::DuckDb ? "ILIKE" : "LIKE";
        std::string pattern = "%" + escape_like(query.search) + "%";

        std::string clause = "(";
        const char* columns[] = {"e.name", "e.description", "e.notes"};
        for (size_t i = 0; i < 3; ++i) {
            if (i > 0) clause += " OR ";
            clause += std::string(columns[i]) + " " + like + " ? ESCAPE '\\'";
            stmt.params.emplace_back(pattern);
        }
        clause += ")";
        conditions.push_back(clause);
    }

    if (!query.category.empty()) {
        conditions.push_back("e.category = ?");
        stmt.params.emplace_back(query.category);
    }

    if (query.kind) {
        conditions.push_back("e.entity_kind = ?");
        stmt.params.emplace_back(std::string(to_string(*query.kind)));
    }

    for (size_t i = 0; i < conditions.size(); ++i) {
        sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
    }

    sql += " ORDER BY ";
    sql += order_clause(query.sort);
    sql += " LIMIT ? OFFSET ?";
    stmt.params.emplace_back(query.limit);
    stmt.params.emplace_back(query.offset);

    stmt.text = std::move(sql);
    return stmt;
}

SqlStatement build_entity_get_query(const std::string& id) {
    SqlStatement stmt;
    stmt.text = std::string("SELECT ") + ENTITY_COLUMNS + " FROM entities e WHERE e.id = ?";
    stmt.params.emplace_back(id);
    return stmt;
}

SqlStatement build_entity_external_query(const std::string& external_source,
                                         const std::string& external_id) {
    SqlStatement stmt;
    stmt.text = std::string("SELECT ") + ENTITY_COLUMNS +
                " FROM entities e WHERE e.external_source = ? AND e.external_id = ?"
                " ORDER BY e.created_at ASC, e.id ASC LIMIT 1";
    stmt.params.emplace_back(external_source);
    stmt.params.emplace_back(external_id);
    return stmt;
}

SqlStatement build_typing_assignment_query(const std::vector<std::string>& entity_ids) {
    SqlStatement stmt;
    std::string placeholders;
    for (size_t i = 0; i < entity_ids.size(); ++i) {
        placeholders += (i == 0 ? "?" : ", ?");
        stmt.params.emplace_back(entity_ids[i]);
    }

    stmt.text =
        "SELECT entity_id, system_name, type_code, COUNT(*), AVG(confidence) "
        "FROM ratings WHERE entity_id IN (" + placeholders + ") "
        "GROUP BY entity_id, system_name, type_code "
        "ORDER BY entity_id, system_name, type_code";
    return stmt;
}
