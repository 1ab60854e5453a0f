// ============= include/core/types.hpp =============
/*
 * Record types shared by every backend
 *
 * Entity ─┬─< Rating        (typing judgment, immutable)
 *         ├─< Comment       (immutable)
 *         ├─< EditHistory   (append-only)
 *         └─○ Embedding     (at most one per entity)
 *
 * TypingSystem ─< type codes (reference catalog, seeded at schema creation)
 *
 * Timestamps are microseconds since the Unix epoch (see core/ids.hpp).
 */

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

enum class EntityKind {
    Person,
    FictionalCharacter,
    PublicFigure
};

const char* to_string(EntityKind kind);

// Throws ValidationError for names outside the closed set
EntityKind parse_entity_kind(const std::string& name);

struct TypingAssignment {
    std::string system;
    std::string type_code;
    int64_t rating_count = 0;
    double mean_confidence = 0.0;

    bool operator==(const TypingAssignment& other) const;
};

struct Entity {
    std::string id;
    std::string name;
    std::string description;
    EntityKind kind = EntityKind::Person;
    std::string category;
    std::string source;
    std::string notes;
    std::string external_id;
    std::string external_source;
    Json::Value metadata{Json::objectValue};
    int64_t created_at = 0;
    int64_t updated_at = 0;
    std::string last_modified_by;

    // Derived on read, never persisted
    int64_t rating_count = 0;
    std::vector<TypingAssignment> typings;

    bool operator==(const Entity& other) const;
    bool operator!=(const Entity& other) const { return !(*this == other); }
};

struct EntityDraft {
    std::string id;                      // empty = assign a fresh one
    std::string name;
    std::string description;
    EntityKind kind = EntityKind::Person;
    std::string category;
    std::string source;
    std::string notes;
    std::string external_id;
    std::string external_source;
    Json::Value metadata{Json::objectValue};
};

struct User {
    std::string id;                      // empty on input = assign
    std::string username;
    std::string display_name;
    std::string role = "annotator";
    std::string experience_level = "novice";
    int64_t created_at = 0;

    bool operator==(const User& other) const;
};

struct Rating {
    std::string id;                      // empty on input = assign
    std::string entity_id;
    std::string rater_id;
    std::string system;
    std::string type_code;
    double confidence = 0.0;
    std::string rationale;
    int64_t created_at = 0;

    bool operator==(const Rating& other) const;
};

struct Comment {
    std::string id;
    std::string entity_id;
    std::string user_id;
    std::string content;
    int64_t created_at = 0;

    std::string user_display_name;       // joined on read

    bool operator==(const Comment& other) const;
};

struct EditHistoryRecord {
    std::string id;
    std::string entity_id;
    std::string user_id;
    std::string field_name;
    std::string old_value;
    std::string new_value;
    std::string change_type = "update";
    int64_t created_at = 0;

    std::string user_display_name;       // joined on read

    bool operator==(const EditHistoryRecord& other) const;
};

struct TypingSystem {
    std::string name;
    std::string display_name;
    std::string description;
    std::vector<std::string> type_codes;

    bool operator==(const TypingSystem& other) const;
};

struct EmbeddingRecord {
    std::string entity_id;
    std::vector<float> vector;
    int64_t updated_at = 0;

    bool operator==(const EmbeddingRecord& other) const;
};

struct StoreStats {
    int64_t entity_count = 0;
    int64_t user_count = 0;
    int64_t type_count = 0;
    int64_t rating_count = 0;
    int64_t comment_count = 0;
};

enum class EntitySort {
    NameAsc,
    NameDesc,
    Category,
    RatingCount,
    Recent
};

// Throws ValidationError on unknown names ("name", "name-desc", "category", "ratings", "recent")
EntitySort parse_entity_sort(const std::string& name);

struct EntityQuery {
    std::string search;                  // substring over name/description/notes
    std::string category;                // exact match, empty = any
    std::optional<EntityKind> kind;
    EntitySort sort = EntitySort::NameAsc;
    int64_t limit = 50;
    int64_t offset = 0;
};

// Field name -> new value, for update_entity()
using FieldMap = std::map<std::string, std::string>;

struct VectorMatch {
    std::string entity_id;
    float similarity = 0.0f;             // 1 - distance
    float distance = 0.0f;               // cosine distance
    std::string entity_name;
    EntityKind entity_kind = EntityKind::Person;
};
