// ============= include/database/record_store.hpp =============
/*
 * Record store over a native SQL connection
 *
 * SqlRecordStore<Connection> is instantiated for SqliteConnection and,
 * when compiled in, DuckDbConnection. FallbackStore offers the same
 * member set so BackendHandle can dispatch with std::visit.
 *
 * THREAD SAFETY:
 * - One connection per store, every call holds the store mutex
 * - Multi-statement writes run inside one transaction
 */

#pragma once
#include "core/types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class SqliteConnection;
class DuckDbConnection;

template<typename Connection>
class SqlRecordStore {
public:
    explicit SqlRecordStore(std::unique_ptr<Connection> connection);
    ~SqlRecordStore();

    SqlRecordStore(const SqlRecordStore&) = delete;
    SqlRecordStore& operator=(const SqlRecordStore&) = delete;

    static const char* backend_name();

    void ensure_schema();

    // ===== ENTITIES =====

    Entity create_entity(const EntityDraft& draft);
    std::optional<Entity> get_entity(const std::string& id);
    std::optional<Entity> find_entity_by_external_id(const std::string& external_source,
                                                     const std::string& external_id);
    bool entity_exists(const std::string& id);
    std::vector<Entity> list_entities(const EntityQuery& query);
    Entity update_entity(const std::string& id, const FieldMap& fields,
                         const std::string& acting_user);

    // ===== USERS =====

    std::string add_user(const User& user);
    std::optional<User> get_user(const std::string& id);

    // ===== RATINGS / COMMENTS / HISTORY =====

    std::string add_rating(const Rating& rating);
    std::vector<Rating> list_ratings(const std::string& entity_id);

    std::string add_comment(const Comment& comment);
    std::vector<Comment> list_comments(const std::string& entity_id);

    std::vector<EditHistoryRecord> list_edit_history(const std::string& entity_id);

    // ===== CATALOG =====

    std::vector<TypingSystem> list_typing_systems();
    void register_typing_system(const TypingSystem& system);

    // ===== EMBEDDINGS =====

    void put_embedding(const std::string& entity_id, const std::vector<float>& vector);
    std::vector<EmbeddingRecord> load_embeddings();

    StoreStats stats();

private:
    std::unique_ptr<Connection> connection;
    std::mutex mutex;

    std::optional<Entity> fetch_entity(const std::string& id);
    bool exists(const char* table, const char* column, const std::string& value);
    void require_entity(const std::string& id);
    void attach_typings(std::vector<Entity>& entities);
};

using SqliteRecordStore = SqlRecordStore<SqliteConnection>;
using DuckDbRecordStore = SqlRecordStore<DuckDbConnection>;
