// ============= src/database/schema_manager.cpp =============
#include "database/schema_manager.hpp"

const char* SchemaManager::ddl() {
    return R"(
        CREATE TABLE IF NOT EXISTS entities (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            description TEXT NOT NULL DEFAULT '',
            entity_kind TEXT NOT NULL DEFAULT 'person',
            category TEXT NOT NULL DEFAULT '',
            source TEXT NOT NULL DEFAULT '',
            notes TEXT NOT NULL DEFAULT '',
            external_id TEXT NOT NULL DEFAULT '',
            external_source TEXT NOT NULL DEFAULT '',
            metadata TEXT NOT NULL DEFAULT '{}',
            created_at BIGINT NOT NULL,
            updated_at BIGINT NOT NULL,
            last_modified_by TEXT NOT NULL DEFAULT ''
        );
        CREATE TABLE IF NOT EXISTS users (
            id TEXT PRIMARY KEY,
            username TEXT NOT NULL UNIQUE,
            display_name TEXT NOT NULL DEFAULT '',
            role TEXT NOT NULL DEFAULT 'annotator',
            experience_level TEXT NOT NULL DEFAULT 'novice',
            created_at BIGINT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS typing_systems (
            name TEXT PRIMARY KEY,
            display_name TEXT NOT NULL DEFAULT '',
            description TEXT NOT NULL DEFAULT ''
        );
        CREATE TABLE IF NOT EXISTS type_codes (
            system_name TEXT NOT NULL,
            code TEXT NOT NULL,
            position INTEGER NOT NULL,
            PRIMARY KEY (system_name, code)
        );
        CREATE TABLE IF NOT EXISTS ratings (
            id TEXT PRIMARY KEY,
            entity_id TEXT NOT NULL,
            rater_id TEXT NOT NULL,
            system_name TEXT NOT NULL,
            type_code TEXT NOT NULL,
            confidence DOUBLE NOT NULL,
            rationale TEXT NOT NULL DEFAULT '',
            created_at BIGINT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS comments (
            id TEXT PRIMARY KEY,
            entity_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            content TEXT NOT NULL,
            created_at BIGINT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS edit_history (
            id TEXT PRIMARY KEY,
            entity_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            field_name TEXT NOT NULL,
            old_value TEXT NOT NULL DEFAULT '',
            new_value TEXT NOT NULL DEFAULT '',
            change_type TEXT NOT NULL DEFAULT 'update',
            created_at BIGINT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS entity_embeddings (
            entity_id TEXT PRIMARY KEY,
            dimension INTEGER NOT NULL,
            vector BLOB NOT NULL,
            updated_at BIGINT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_entities_name ON entities(name);
        CREATE INDEX IF NOT EXISTS idx_entities_category ON entities(category);
        CREATE INDEX IF NOT EXISTS idx_ratings_entity ON ratings(entity_id);
        CREATE INDEX IF NOT EXISTS idx_comments_entity ON comments(entity_id);
        CREATE INDEX IF NOT EXISTS idx_edit_history_entity ON edit_history(entity_id);
    )";
}

const std::vector<std::string>& SchemaManager::table_names() {
    static const std::vector<std::string> names = {
        "entities", "users", "ratings", "comments", "edit_history",
        "typing_systems", "type_codes", "entity_embeddings"
    };
    return names;
}

const std::vector<TypingSystem>& SchemaManager::default_catalog() {
    static const std::vector<TypingSystem> catalog = {
        {"socionics", "Socionics", "Sixteen information-metabolism types",
         {"ILE", "SEI", "ESE", "LII", "EIE", "LSI", "SLE", "IEI",
          "SEE", "ILI", "LIE", "ESI", "LSE", "EII", "IEE", "SLI"}},
        {"mbti", "Myers-Briggs Type Indicator", "Sixteen four-letter preference types",
         {"INTJ", "INTP", "ENTJ", "ENTP", "INFJ", "INFP", "ENFJ", "ENFP",
          "ISTJ", "ISFJ", "ESTJ", "ESFJ", "ISTP", "ISFP", "ESTP", "ESFP"}},
        {"enneagram", "Enneagram", "Nine core types",
         {"1", "2", "3", "4", "5", "6", "7", "8", "9"}},
    };
    return catalog;
}
