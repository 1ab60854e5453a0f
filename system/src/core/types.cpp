// ============= src/core/types.cpp =============
#include "core/types.hpp"
#include "core/errors.hpp"

const char* to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::Person: return "person";
        case EntityKind::FictionalCharacter: return "fictional_character";
        case EntityKind::PublicFigure: return "public_figure";
    }
    return "person";
}

EntityKind parse_entity_kind(const std::string& name) {
    if (name == "person") return EntityKind::Person;
    if (name == "fictional_character") return EntityKind::FictionalCharacter;
    if (name == "public_figure") return EntityKind::PublicFigure;
    throw ValidationError("unknown entity kind: '" + name + "'");
}

EntitySort parse_entity_sort(const std::string& name) {
    if (name.empty() || name == "name") return EntitySort::NameAsc;
    if (name == "name-desc") return EntitySort::NameDesc;
    if (name == "category") return EntitySort::Category;
    if (name == "ratings") return EntitySort::RatingCount;
    if (name == "recent") return EntitySort::Recent;
    throw ValidationError("unknown sort order: '" + name + "'");
}

bool TypingAssignment::operator==(const TypingAssignment& other) const {
    return system == other.system && type_code == other.type_code &&
           rating_count == other.rating_count && mean_confidence == other.mean_confidence;
}

bool Entity::operator==(const Entity& other) const {
    return id == other.id && name == other.name && description == other.description &&
           kind == other.kind && category == other.category && source == other.source &&
           notes == other.notes && external_id == other.external_id &&
           external_source == other.external_source && metadata == other.metadata &&
           created_at == other.created_at && updated_at == other.updated_at &&
           last_modified_by == other.last_modified_by && rating_count == other.rating_count &&
           typings == other.typings;
}

bool User::operator==(const User& other) const {
    return id == other.id && username == other.username && display_name == other.display_name &&
           role == other.role && experience_level == other.experience_level &&
           created_at == other.created_at;
}

bool Rating::operator==(const Rating& other) const {
    return id == other.id && entity_id == other.entity_id && rater_id == other.rater_id &&
           system == other.system && type_code == other.type_code &&
           confidence == other.confidence && rationale == other.rationale &&
           created_at == other.created_at;
}

bool Comment::operator==(const Comment& other) const {
    return id == other.id && entity_id == other.entity_id && user_id == other.user_id &&
           content == other.content && created_at == other.created_at &&
           user_display_name == other.user_display_name;
}

bool EditHistoryRecord::operator==(const EditHistoryRecord& other) const {
    return id == other.id && entity_id == other.entity_id && user_id == other.user_id &&
           field_name == other.field_name && old_value == other.old_value &&
           new_value == other.new_value && change_type == other.change_type &&
           created_at == other.created_at && user_display_name == other.user_display_name;
}

bool TypingSystem::operator==(const TypingSystem& other) const {
    return name == other.name && display_name == other.display_name &&
           description == other.description && type_codes == other.type_codes;
}

bool EmbeddingRecord::operator==(const EmbeddingRecord& other) const {
    return entity_id == other.entity_id && vector == other.vector && updated_at == other.updated_at;
}
