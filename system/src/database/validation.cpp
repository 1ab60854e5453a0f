// ============= src/database/validation.cpp =============
#include "database/validation.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

const char* const MUTABLE_FIELDS[] = {"name", "description", "category", "source", "notes"};

const char* const USER_ROLES[] = {"annotator", "panel_rater", "adjudicator", "admin"};
const char* const EXPERIENCE_LEVELS[] = {"novice", "intermediate", "expert"};

template<size_t N>
bool one_of(const std::string& value, const char* const (&allowed)[N]) {
    for (const char* candidate : allowed) {
        if (value == candidate) return true;
    }
    return false;
}

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

void validate_entity_draft(const EntityDraft& draft) {
    if (blank(draft.name)) {
        throw ValidationError("entity name must not be empty");
    }
    if (!draft.metadata.isNull() && !draft.metadata.isObject()) {
        throw ValidationError("entity metadata must be a JSON object");
    }
}

void validate_user(const User& user) {
    if (blank(user.username)) {
        throw ValidationError("username must not be empty");
    }
    if (!one_of(user.role, USER_ROLES)) {
        throw ValidationError("unknown user role: '" + user.role + "'");
    }
    if (!one_of(user.experience_level, EXPERIENCE_LEVELS)) {
        throw ValidationError("unknown experience level: '" + user.experience_level + "'");
    }
}

void validate_rating(const Rating& rating) {
    if (rating.entity_id.empty()) {
        throw ValidationError("rating entity id must not be empty");
    }
    if (rating.rater_id.empty()) {
        throw ValidationError("rating rater id must not be empty");
    }
    if (rating.system.empty() || rating.type_code.empty()) {
        throw ValidationError("rating needs a typing system and a type code");
    }
    if (std::isnan(rating.confidence) || rating.confidence < 0.0 || rating.confidence > 1.0) {
        throw ValidationError("rating confidence must be within [0, 1], got " +
                              std::to_string(rating.confidence));
    }
}

void validate_comment(const Comment& comment) {
    if (comment.entity_id.empty()) {
        throw ValidationError("comment entity id must not be empty");
    }
    if (comment.user_id.empty()) {
        throw ValidationError("comment user id must not be empty");
    }
    if (blank(comment.content)) {
        throw ValidationError("comment content must not be empty");
    }
}

void validate_entity_query(const EntityQuery& query) {
    if (query.limit < 0) {
        throw ValidationError("limit must not be negative");
    }
    if (query.offset < 0) {
        throw ValidationError("offset must not be negative");
    }
}

void validate_typing_system(const TypingSystem& system) {
    if (blank(system.name)) {
        throw ValidationError("typing system name must not be empty");
    }
    for (const auto& code : system.type_codes) {
        if (blank(code)) {
            throw ValidationError("typing system '" + system.name + "' has an empty type code");
        }
    }
}

// ==================== ENTITY FIELDS ====================

bool is_mutable_field(const std::string& field) {
    return one_of(field, MUTABLE_FIELDS);
}

std::string entity_field(const Entity& entity, const std::string& field) {
    if (field == "name") return entity.name;
    if (field == "description") return entity.description;
    if (field == "category") return entity.category;
    if (field == "source") return entity.source;
    if (field == "notes") return entity.notes;
    throw ValidationError("field is not updatable: '" + field + "'");
}

void assign_entity_field(Entity& entity, const std::string& field, const std::string& value) {
    if (field == "name") entity.name = value;
    else if (field == "description") entity.description = value;
    else if (field == "category") entity.category = value;
    else if (field == "source") entity.source = value;
    else if (field == "notes") entity.notes = value;
    else throw ValidationError("field is not updatable: '" + field + "'");
}

std::vector<FieldChange> diff_entity_fields(const Entity& current, const FieldMap& fields) {
    auto name_it = fields.find("name");
    if (name_it != fields.end() && blank(name_it->second)) {
        throw ValidationError("entity name must not be empty");
    }

    std::vector<FieldChange> changes;
    for (const auto& [field, value] : fields) {
        if (!is_mutable_field(field)) {
            continue;
        }
        std::string old_value = entity_field(current, field);
        if (old_value != value) {
            changes.push_back({field, old_value, value});
        }
    }
    return changes;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                          });
    return it != haystack.end();
}
