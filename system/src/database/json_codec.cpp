// ============= src/database/json_codec.cpp =============
#include "database/json_codec.hpp"
#include "core/errors.hpp"
#include <memory>
#include <sstream>

namespace {

void require_object(const Json::Value& v, const char* what) {
    if (!v.isObject()) {
        throw ValidationError(std::string(what) + " must be a JSON object");
    }
}

std::string get_string(const Json::Value& v, const char* key, const std::string& def = "") {
    const Json::Value& field = v[key];
    if (field.isNull()) return def;
    if (!field.isString()) {
        throw ValidationError(std::string("field '") + key + "' must be a string");
    }
    return field.asString();
}

int64_t get_int64(const Json::Value& v, const char* key, int64_t def = 0) {
    const Json::Value& field = v[key];
    if (field.isNull()) return def;
    if (!field.isInt64()) {
        throw ValidationError(std::string("field '") + key + "' must be an integer");
    }
    return field.asInt64();
}

double get_double(const Json::Value& v, const char* key, double def = 0.0) {
    const Json::Value& field = v[key];
    if (field.isNull()) return def;
    if (!field.isNumeric()) {
        throw ValidationError(std::string("field '") + key + "' must be a number");
    }
    return field.asDouble();
}

Json::Value get_object(const Json::Value& v, const char* key) {
    const Json::Value& field = v[key];
    if (field.isNull()) return Json::Value(Json::objectValue);
    if (!field.isObject()) {
        throw ValidationError(std::string("field '") + key + "' must be an object");
    }
    return field;
}

}  // namespace

std::string write_json(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool parse_json(const std::string& text, Json::Value& out, std::string* errors) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::string errs;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    if (!ok && errors) {
        *errors = errs;
    }
    return ok;
}

// ==================== ENCODE ====================

Json::Value to_json(const Entity& entity) {
    Json::Value v(Json::objectValue);
    v["id"] = entity.id;
    v["name"] = entity.name;
    v["description"] = entity.description;
    v["kind"] = to_string(entity.kind);
    v["category"] = entity.category;
    v["source"] = entity.source;
    v["notes"] = entity.notes;
    v["externalId"] = entity.external_id;
    v["externalSource"] = entity.external_source;
    v["metadata"] = entity.metadata.isNull() ? Json::Value(Json::objectValue) : entity.metadata;
    v["createdAt"] = Json::Int64(entity.created_at);
    v["updatedAt"] = Json::Int64(entity.updated_at);
    v["lastModifiedBy"] = entity.last_modified_by;
    return v;
}

Json::Value to_json(const User& user) {
    Json::Value v(Json::objectValue);
    v["id"] = user.id;
    v["username"] = user.username;
    v["displayName"] = user.display_name;
    v["role"] = user.role;
    v["experienceLevel"] = user.experience_level;
    v["createdAt"] = Json::Int64(user.created_at);
    return v;
}

Json::Value to_json(const Rating& rating) {
    Json::Value v(Json::objectValue);
    v["id"] = rating.id;
    v["entityId"] = rating.entity_id;
    v["raterId"] = rating.rater_id;
    v["system"] = rating.system;
    v["typeCode"] = rating.type_code;
    v["confidence"] = rating.confidence;
    v["rationale"] = rating.rationale;
    v["createdAt"] = Json::Int64(rating.created_at);
    return v;
}

Json::Value to_json(const Comment& comment) {
    Json::Value v(Json::objectValue);
    v["id"] = comment.id;
    v["entityId"] = comment.entity_id;
    v["userId"] = comment.user_id;
    v["content"] = comment.content;
    v["createdAt"] = Json::Int64(comment.created_at);
    if (!comment.user_display_name.empty()) {
        v["userName"] = comment.user_display_name;
    }
    return v;
}

Json::Value to_json(const EditHistoryRecord& record) {
    Json::Value v(Json::objectValue);
    v["id"] = record.id;
    v["entityId"] = record.entity_id;
    v["userId"] = record.user_id;
    v["fieldName"] = record.field_name;
    v["oldValue"] = record.old_value;
    v["newValue"] = record.new_value;
    v["changeType"] = record.change_type;
    v["createdAt"] = Json::Int64(record.created_at);
    if (!record.user_display_name.empty()) {
        v["userName"] = record.user_display_name;
    }
    return v;
}

Json::Value to_json(const TypingSystem& system) {
    Json::Value v(Json::objectValue);
    v["name"] = system.name;
    v["displayName"] = system.display_name;
    v["description"] = system.description;
    Json::Value codes(Json::arrayValue);
    for (const auto& code : system.type_codes) {
        codes.append(code);
    }
    v["typeCodes"] = codes;
    return v;
}

Json::Value to_json(const EmbeddingRecord& embedding) {
    Json::Value v(Json::objectValue);
    v["entityId"] = embedding.entity_id;
    Json::Value values(Json::arrayValue);
    for (float x : embedding.vector) {
        values.append(static_cast<double>(x));
    }
    v["vector"] = values;
    v["updatedAt"] = Json::Int64(embedding.updated_at);
    return v;
}

Json::Value to_json(const StoreStats& stats) {
    Json::Value v(Json::objectValue);
    v["entities"] = Json::Int64(stats.entity_count);
    v["users"] = Json::Int64(stats.user_count);
    v["types"] = Json::Int64(stats.type_count);
    v["ratings"] = Json::Int64(stats.rating_count);
    v["comments"] = Json::Int64(stats.comment_count);
    return v;
}

Json::Value to_json(const VectorMatch& match) {
    Json::Value v(Json::objectValue);
    v["entityId"] = match.entity_id;
    v["entityName"] = match.entity_name;
    v["entityKind"] = to_string(match.entity_kind);
    v["similarity"] = static_cast<double>(match.similarity);
    v["distance"] = static_cast<double>(match.distance);
    return v;
}

// ==================== DECODE ====================

Entity entity_from_json(const Json::Value& v) {
    require_object(v, "entity");
    Entity e;
    e.id = get_string(v, "id");
    e.name = get_string(v, "name");
    e.description = get_string(v, "description");
    e.kind = parse_entity_kind(get_string(v, "kind", "person"));
    e.category = get_string(v, "category");
    e.source = get_string(v, "source");
    e.notes = get_string(v, "notes");
    e.external_id = get_string(v, "externalId");
    e.external_source = get_string(v, "externalSource");
    e.metadata = get_object(v, "metadata");
    e.created_at = get_int64(v, "createdAt");
    e.updated_at = get_int64(v, "updatedAt");
    e.last_modified_by = get_string(v, "lastModifiedBy");
    return e;
}

EntityDraft entity_draft_from_json(const Json::Value& v) {
    require_object(v, "entity");
    EntityDraft d;
    d.id = get_string(v, "id");
    d.name = get_string(v, "name");
    d.description = get_string(v, "description");
    d.kind = parse_entity_kind(get_string(v, "kind", "person"));
    d.category = get_string(v, "category");
    d.source = get_string(v, "source");
    d.notes = get_string(v, "notes");
    d.external_id = get_string(v, "externalId");
    d.external_source = get_string(v, "externalSource");
    d.metadata = get_object(v, "metadata");
    return d;
}

User user_from_json(const Json::Value& v) {
    require_object(v, "user");
    User u;
    u.id = get_string(v, "id");
    u.username = get_string(v, "username");
    u.display_name = get_string(v, "displayName");
    u.role = get_string(v, "role", u.role);
    u.experience_level = get_string(v, "experienceLevel", u.experience_level);
    u.created_at = get_int64(v, "createdAt");
    return u;
}

Rating rating_from_json(const Json::Value& v) {
    require_object(v, "rating");
    Rating r;
    r.id = get_string(v, "id");
    r.entity_id = get_string(v, "entityId");
    r.rater_id = get_string(v, "raterId");
    r.system = get_string(v, "system");
    r.type_code = get_string(v, "typeCode");
    r.confidence = get_double(v, "confidence");
    r.rationale = get_string(v, "rationale");
    r.created_at = get_int64(v, "createdAt");
    return r;
}

Comment comment_from_json(const Json::Value& v) {
    require_object(v, "comment");
    Comment c;
    c.id = get_string(v, "id");
    c.entity_id = get_string(v, "entityId");
    c.user_id = get_string(v, "userId");
    c.content = get_string(v, "content");
    c.created_at = get_int64(v, "createdAt");
    return c;
}

EditHistoryRecord edit_history_from_json(const Json::Value& v) {
    require_object(v, "edit history record");
    EditHistoryRecord h;
    h.id = get_string(v, "id");
    h.entity_id = get_string(v, "entityId");
    h.user_id = get_string(v, "userId");
    h.field_name = get_string(v, "fieldName");
    h.old_value = get_string(v, "oldValue");
    h.new_value = get_string(v, "newValue");
    h.change_type = get_string(v, "changeType", h.change_type);
    h.created_at = get_int64(v, "createdAt");
    return h;
}

TypingSystem typing_system_from_json(const Json::Value& v) {
    require_object(v, "typing system");
    TypingSystem s;
    s.name = get_string(v, "name");
    s.display_name = get_string(v, "displayName");
    s.description = get_string(v, "description");

    const Json::Value& codes = v["typeCodes"];
    if (!codes.isNull() && !codes.isArray()) {
        throw ValidationError("field 'typeCodes' must be an array");
    }
    for (const auto& code : codes) {
        if (!code.isString()) {
            throw ValidationError("type codes must be strings");
        }
        s.type_codes.push_back(code.asString());
    }
    return s;
}

std::vector<float> vector_from_json(const Json::Value& v) {
    if (!v.isArray()) {
        throw ValidationError("vector must be a JSON array");
    }
    std::vector<float> out;
    out.reserve(v.size());
    for (const auto& x : v) {
        if (!x.isNumeric()) {
            throw ValidationError("vector components must be numbers");
        }
        out.push_back(x.asFloat());
    }
    return out;
}

EmbeddingRecord embedding_from_json(const Json::Value& v) {
    require_object(v, "embedding");
    EmbeddingRecord e;
    e.entity_id = get_string(v, "entityId");
    e.vector = vector_from_json(v["vector"]);
    e.updated_at = get_int64(v, "updatedAt");
    return e;
}
