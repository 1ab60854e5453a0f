// ============= include/database/validation.hpp =============
/*
 * Input checks shared by the SQL and fallback stores
 *
 * All checks run before any write and raise ValidationError.
 */

#pragma once
#include "core/types.hpp"
#include <string>
#include <vector>

void validate_entity_draft(const EntityDraft& draft);
void validate_user(const User& user);
void validate_rating(const Rating& rating);
void validate_comment(const Comment& comment);
void validate_entity_query(const EntityQuery& query);
void validate_typing_system(const TypingSystem& system);

// Fields update_entity() may change: name, description, category, source, notes
bool is_mutable_field(const std::string& field);

std::string entity_field(const Entity& entity, const std::string& field);
void assign_entity_field(Entity& entity, const std::string& field, const std::string& value);

struct FieldChange {
    std::string field;
    std::string old_value;
    std::string new_value;
};

// Mutable fields whose value differs; unknown keys are dropped.
// Throws ValidationError when "name" would become empty.
std::vector<FieldChange> diff_entity_fields(const Entity& current, const FieldMap& fields);

// Case-insensitive (ASCII) substring test used by the fallback search
bool contains_ignore_case(const std::string& haystack, const std::string& needle);
