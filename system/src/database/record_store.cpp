// ============= src/database/record_store.cpp =============
#include "database/record_store.hpp"
#include "database/sqlite_connection.hpp"
#include "database/query_builder.hpp"
#include "database/schema_manager.hpp"
#include "database/validation.hpp"
#include "database/json_codec.hpp"
#include "core/errors.hpp"
#include "core/ids.hpp"
#include <spdlog/spdlog.h>
#include <map>

#if PERSONADB_HAVE_DUCKDB
#include "database/duckdb_connection.hpp"
#endif

namespace {

// Rolls back unless commit() was reached
template<typename Connection>
class Transaction {
public:
    explicit Transaction(Connection& conn) : conn(conn) { conn.begin(); }

    ~Transaction() {
        if (!done) {
            try {
                conn.rollback();
            } catch (const BackendError& e) {
                spdlog::error("rollback failed: {}", e.what());
            }
        }
    }

    void commit() {
        conn.commit();
        done = true;
    }

private:
    Connection& conn;
    bool done = false;
};

Entity row_to_entity(const SqlRow& row) {
    Entity e;
    e.id = text_at(row, 0);
    e.name = text_at(row, 1);
    e.description = text_at(row, 2);
    e.kind = parse_entity_kind(text_at(row, 3));
    e.category = text_at(row, 4);
    e.source = text_at(row, 5);
    e.notes = text_at(row, 6);
    e.external_id = text_at(row, 7);
    e.external_source = text_at(row, 8);

    std::string errors;
    if (!parse_json(text_at(row, 9), e.metadata, &errors) || !e.metadata.isObject()) {
        spdlog::warn("entity {}: unreadable metadata, using {{}}", e.id);
        e.metadata = Json::Value(Json::objectValue);
    }

    e.created_at = int_at(row, 10);
    e.updated_at = int_at(row, 11);
    e.last_modified_by = text_at(row, 12);
    e.rating_count = int_at(row, 13);
    return e;
}

}  // namespace

// ==================== CONSTRUCTOR ====================

template<typename Connection>
SqlRecordStore<Connection>::SqlRecordStore(std::unique_ptr<Connection> connection)
    : connection(std::move(connection)) {}

template<typename Connection>
SqlRecordStore<Connection>::~SqlRecordStore() = default;

template<typename Connection>
const char* SqlRecordStore<Connection>::backend_name() {
    return Connection::backend_name();
}

template<typename Connection>
void SqlRecordStore<Connection>::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex);
    SchemaManager::ensure_schema(*connection);
}

// ==================== HELPERS ====================

template<typename Connection>
bool SqlRecordStore<Connection>::exists(const char* table, const char* column,
                                        const std::string& value) {
    auto rows = connection->query({
        std::string("SELECT 1 FROM ") + table + " WHERE " + column + " = ? LIMIT 1",
        {value}});
    return !rows.empty();
}

template<typename Connection>
void SqlRecordStore<Connection>::require_entity(const std::string& id) {
    if (!exists("entities", "id", id)) {
        throw NotFoundError("entity", id);
    }
}

template<typename Connection>
void SqlRecordStore<Connection>::attach_typings(std::vector<Entity>& entities) {
    if (entities.empty()) return;

    std::vector<std::string> ids;
    std::map<std::string, Entity*> by_id;
    for (auto& e : entities) {
        ids.push_back(e.id);
        by_id[e.id] = &e;
    }

    for (const auto& row : connection->query(build_typing_assignment_query(ids))) {
        auto it = by_id.find(text_at(row, 0));
        if (it == by_id.end()) continue;

        TypingAssignment t;
        t.system = text_at(row, 1);
        t.type_code = text_at(row, 2);
        t.rating_count = int_at(row, 3);
        t.mean_confidence = double_at(row, 4);
        it->second->typings.push_back(t);
    }
}

template<typename Connection>
std::optional<Entity> SqlRecordStore<Connection>::fetch_entity(const std::string& id) {
    auto rows = connection->query(build_entity_get_query(id));
    if (rows.empty()) {
        return std::nullopt;
    }

    std::vector<Entity> found{row_to_entity(rows[0])};
    attach_typings(found);
    return found[0];
}

// ==================== ENTITIES ====================

template<typename Connection>
Entity SqlRecordStore<Connection>::create_entity(const EntityDraft& draft) {
    validate_entity_draft(draft);

    std::lock_guard<std::mutex> lock(mutex);

    std::string id = draft.id.empty() ? generate_id() : draft.id;
    if (!draft.id.empty() && exists("entities", "id", id)) {
        throw ValidationError("entity id already exists: " + id);
    }

    int64_t now = now_us();
    std::string metadata = write_json(draft.metadata.isNull()
                                      ? Json::Value(Json::objectValue) : draft.metadata);

    connection->execute({
        "INSERT INTO entities (id, name, description, entity_kind, category, source, notes, "
        "external_id, external_source, metadata, created_at, updated_at, last_modified_by) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {id, draft.name, draft.description, std::string(to_string(draft.kind)),
         draft.category, draft.source, draft.notes, draft.external_id,
         draft.external_source, metadata, now, now, std::string()}});

    auto created = fetch_entity(id);
    if (!created) {
        throw BackendError("create_entity", "row missing after insert", id);
    }

    spdlog::debug("Created entity {} ({})", created->name, id);
    return *created;
}

template<typename Connection>
std::optional<Entity> SqlRecordStore<Connection>::get_entity(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return fetch_entity(id);
}

template<typename Connection>
std::optional<Entity> SqlRecordStore<Connection>::find_entity_by_external_id(
    const std::string& external_source, const std::string& external_id) {
    std::lock_guard<std::mutex> lock(mutex);

    auto rows = connection->query(build_entity_external_query(external_source, external_id));
    if (rows.empty()) {
        return std::nullopt;
    }

    std::vector<Entity> found{row_to_entity(rows[0])};
    attach_typings(found);
    return found[0];
}

template<typename Connection>
bool SqlRecordStore<Connection>::entity_exists(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return exists("entities", "id", id);
}

template<typename Connection>
std::vector<Entity> SqlRecordStore<Connection>::list_entities(const EntityQuery& query) {
    validate_entity_query(query);
    if (query.limit == 0) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex);

    std::vector<Entity> entities;
    for (const auto& row : connection->query(build_entity_list_query(query, Connection::dialect))) {
        entities.push_back(row_to_entity(row));
    }
    attach_typings(entities);
    return entities;
}

template<typename Connection>
Entity SqlRecordStore<Connection>::update_entity(const std::string& id, const FieldMap& fields,
                                                 const std::string& acting_user) {
    std::lock_guard<std::mutex> lock(mutex);

    auto current = fetch_entity(id);
    if (!current) {
        throw NotFoundError("entity", id);
    }

    auto changes = diff_entity_fields(*current, fields);
    if (changes.empty()) {
        return *current;
    }

    Transaction<Connection> tx(*connection);

    std::string assignments;
    std::vector<SqlValue> params;
    for (const auto& change : changes) {
        assignments += change.field + " = ?, ";
        params.emplace_back(change.new_value);
    }
    assignments += "updated_at = ?, last_modified_by = ?";
    params.emplace_back(now_us());
    params.emplace_back(acting_user);
    params.emplace_back(id);

    connection->execute({"UPDATE entities SET " + assignments + " WHERE id = ?", params});

    for (const auto& change : changes) {
        connection->execute({
            "INSERT INTO edit_history (id, entity_id, user_id, field_name, old_value, "
            "new_value, change_type, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
            {generate_id(), id, acting_user, change.field, change.old_value,
             change.new_value, std::string("update"), now_us()}});
    }

    tx.commit();

    spdlog::debug("Updated entity {} ({} fields)", id, changes.size());

    auto updated = fetch_entity(id);
    if (!updated) {
        throw BackendError("update_entity", "row missing after update", id);
    }
    return *updated;
}

// ==================== USERS ====================

template<typename Connection>
std::string SqlRecordStore<Connection>::add_user(const User& user) {
    validate_user(user);

    std::lock_guard<std::mutex> lock(mutex);

    std::string id = user.id.empty() ? generate_id() : user.id;

    auto owners = connection->query({
        "SELECT id FROM users WHERE username = ? AND id <> ?", {user.username, id}});
    if (!owners.empty()) {
        throw ValidationError("username already taken: " + user.username);
    }

    int64_t created_at = user.created_at > 0 ? user.created_at : now_us();

    connection->execute({
        "INSERT INTO users (id, username, display_name, role, experience_level, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?) "
        "ON CONFLICT (id) DO UPDATE SET username = excluded.username, "
        "display_name = excluded.display_name, role = excluded.role, "
        "experience_level = excluded.experience_level",
        {id, user.username, user.display_name, user.role, user.experience_level,
         created_at}});

    return id;
}

template<typename Connection>
std::optional<User> SqlRecordStore<Connection>::get_user(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);

    auto rows = connection->query({
        "SELECT id, username, display_name, role, experience_level, created_at "
        "FROM users WHERE id = ?", {id}});
    if (rows.empty()) {
        return std::nullopt;
    }

    const auto& row = rows[0];
    User u;
    u.id = text_at(row, 0);
    u.username = text_at(row, 1);
    u.display_name = text_at(row, 2);
    u.role = text_at(row, 3);
    u.experience_level = text_at(row, 4);
    u.created_at = int_at(row, 5);
    return u;
}

// ==================== RATINGS ====================

template<typename Connection>
std::string SqlRecordStore<Connection>::add_rating(const Rating& rating) {
    validate_rating(rating);

    std::lock_guard<std::mutex> lock(mutex);

    require_entity(rating.entity_id);

    auto known = connection->query({
        "SELECT 1 FROM type_codes WHERE system_name = ? AND code = ?",
        {rating.system, rating.type_code}});
    if (known.empty()) {
        throw ValidationError("unknown type code '" + rating.type_code +
                              "' for typing system '" + rating.system + "'");
    }

    std::string id = rating.id.empty() ? generate_id() : rating.id;
    if (!rating.id.empty() && exists("ratings", "id", id)) {
        throw ValidationError("rating id already exists: " + id);
    }

    connection->execute({
        "INSERT INTO ratings (id, entity_id, rater_id, system_name, type_code, confidence, "
        "rationale, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        {id, rating.entity_id, rating.rater_id, rating.system, rating.type_code,
         rating.confidence, rating.rationale, now_us()}});

    return id;
}

template<typename Connection>
std::vector<Rating> SqlRecordStore<Connection>::list_ratings(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    std::vector<Rating> ratings;
    for (const auto& row : connection->query({
             "SELECT id, entity_id, rater_id, system_name, type_code, confidence, rationale, "
             "created_at FROM ratings WHERE entity_id = ? ORDER BY created_at DESC, id DESC",
             {entity_id}})) {
        Rating r;
        r.id = text_at(row, 0);
        r.entity_id = text_at(row, 1);
        r.rater_id = text_at(row, 2);
        r.system = text_at(row, 3);
        r.type_code = text_at(row, 4);
        r.confidence = double_at(row, 5);
        r.rationale = text_at(row, 6);
        r.created_at = int_at(row, 7);
        ratings.push_back(std::move(r));
    }
    return ratings;
}

// ==================== COMMENTS ====================

template<typename Connection>
std::string SqlRecordStore<Connection>::add_comment(const Comment& comment) {
    validate_comment(comment);

    std::lock_guard<std::mutex> lock(mutex);

    require_entity(comment.entity_id);

    std::string id = comment.id.empty() ? generate_id() : comment.id;
    if (!comment.id.empty() && exists("comments", "id", id)) {
        throw ValidationError("comment id already exists: " + id);
    }

    connection->execute({
        "INSERT INTO comments (id, entity_id, user_id, content, created_at) "
        "VALUES (?, ?, ?, ?, ?)",
        {id, comment.entity_id, comment.user_id, comment.content, now_us()}});

    return id;
}

template<typename Connection>
std::vector<Comment> SqlRecordStore<Connection>::list_comments(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    std::vector<Comment> comments;
    for (const auto& row : connection->query({
             "SELECT c.id, c.entity_id, c.user_id, c.content, c.created_at, "
             "COALESCE(u.display_name, '') FROM comments c "
             "LEFT JOIN users u ON u.id = c.user_id "
             "WHERE c.entity_id = ? ORDER BY c.created_at DESC, c.id DESC",
             {entity_id}})) {
        Comment c;
        c.id = text_at(row, 0);
        c.entity_id = text_at(row, 1);
        c.user_id = text_at(row, 2);
        c.content = text_at(row, 3);
        c.created_at = int_at(row, 4);
        c.user_display_name = text_at(row, 5);
        comments.push_back(std::move(c));
    }
    return comments;
}

// ==================== EDIT HISTORY ====================

template<typename Connection>
std::vector<EditHistoryRecord> SqlRecordStore<Connection>::list_edit_history(
    const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    std::vector<EditHistoryRecord> history;
    for (const auto& row : connection->query({
             "SELECT h.id, h.entity_id, h.user_id, h.field_name, h.old_value, h.new_value, "
             "h.change_type, h.created_at, COALESCE(u.display_name, '') FROM edit_history h "
             "LEFT JOIN users u ON u.id = h.user_id "
             "WHERE h.entity_id = ? ORDER BY h.created_at DESC, h.id DESC",
             {entity_id}})) {
        EditHistoryRecord h;
        h.id = text_at(row, 0);
        h.entity_id = text_at(row, 1);
        h.user_id = text_at(row, 2);
        h.field_name = text_at(row, 3);
        h.old_value = text_at(row, 4);
        h.new_value = text_at(row, 5);
        h.change_type = text_at(row, 6);
        h.created_at = int_at(row, 7);
        h.user_display_name = text_at(row, 8);
        history.push_back(std::move(h));
    }
    return history;
}

// ==================== CATALOG ====================

template<typename Connection>
std::vector<TypingSystem> SqlRecordStore<Connection>::list_typing_systems() {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<TypingSystem> systems;
    std::map<std::string, size_t> index_of;

    for (const auto& row : connection->query({
             "SELECT name, display_name, description FROM typing_systems ORDER BY name", {}})) {
        TypingSystem s;
        s.name = text_at(row, 0);
        s.display_name = text_at(row, 1);
        s.description = text_at(row, 2);
        index_of[s.name] = systems.size();
        systems.push_back(std::move(s));
    }

    for (const auto& row : connection->query({
             "SELECT system_name, code FROM type_codes ORDER BY system_name, position", {}})) {
        auto it = index_of.find(text_at(row, 0));
        if (it != index_of.end()) {
            systems[it->second].type_codes.push_back(text_at(row, 1));
        }
    }

    return systems;
}

template<typename Connection>
void SqlRecordStore<Connection>::register_typing_system(const TypingSystem& system) {
    validate_typing_system(system);

    std::lock_guard<std::mutex> lock(mutex);

    Transaction<Connection> tx(*connection);
    SchemaManager::insert_catalog(*connection, {system});
    tx.commit();

    spdlog::info("Registered typing system '{}' ({} codes)", system.name,
                 system.type_codes.size());
}

// ==================== EMBEDDINGS ====================

template<typename Connection>
void SqlRecordStore<Connection>::put_embedding(const std::string& entity_id,
                                               const std::vector<float>& vector) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    connection->execute({
        "INSERT INTO entity_embeddings (entity_id, dimension, vector, updated_at) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT (entity_id) DO UPDATE SET dimension = excluded.dimension, "
        "vector = excluded.vector, updated_at = excluded.updated_at",
        {entity_id, static_cast<int64_t>(vector.size()), serialize_embedding(vector), now_us()}});
}

template<typename Connection>
std::vector<EmbeddingRecord> SqlRecordStore<Connection>::load_embeddings() {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<EmbeddingRecord> records;
    for (const auto& row : connection->query({
             "SELECT entity_id, vector, updated_at FROM entity_embeddings ORDER BY entity_id",
             {}})) {
        EmbeddingRecord r;
        r.entity_id = text_at(row, 0);
        r.vector = deserialize_embedding(blob_at(row, 1));
        r.updated_at = int_at(row, 2);
        records.push_back(std::move(r));
    }
    return records;
}

// ==================== STATS ====================

template<typename Connection>
StoreStats SqlRecordStore<Connection>::stats() {
    std::lock_guard<std::mutex> lock(mutex);

    auto rows = connection->query({
        "SELECT (SELECT COUNT(*) FROM entities), (SELECT COUNT(*) FROM users), "
        "(SELECT COUNT(*) FROM type_codes), (SELECT COUNT(*) FROM ratings), "
        "(SELECT COUNT(*) FROM comments)", {}});

    StoreStats s;
    if (!rows.empty()) {
        s.entity_count = int_at(rows[0], 0);
        s.user_count = int_at(rows[0], 1);
        s.type_count = int_at(rows[0], 2);
        s.rating_count = int_at(rows[0], 3);
        s.comment_count = int_at(rows[0], 4);
    }
    return s;
}

// ==================== INSTANTIATIONS ====================

template class SqlRecordStore<SqliteConnection>;

#if PERSONADB_HAVE_DUCKDB
template class SqlRecordStore<DuckDbConnection>;
#endif
