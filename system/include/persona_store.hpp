// ============= include/persona_store.hpp =============
/*
 * PersonaStore - single entry point for persistence + similarity search
 *
 * LIFECYCLE:
 *   Uninitialized -> Probing -> SchemaReady -> Operational
 *   initialize() is idempotent; a failure returns to Uninitialized.
 *   Every data operation outside Operational throws NotInitializedError.
 *
 * EMBEDDINGS:
 *   Only this class maps entity ids <-> vector index slots. Replacing an
 *   embedding tombstones the old slot and inserts into a fresh one; when
 *   tombstones hold the last free slots the index is compacted first.
 *   Capacity limits live vectors, so a replacement never exceeds it.
 *
 * LOCKING:
 *   index_mutex is always taken before any backend mutex.
 *
 * ASYNC:
 *   submit(fn) runs fn(store) on the store's worker pool.
 */

#pragma once
#include "config.hpp"
#include "core/types.hpp"
#include "database/backend.hpp"
#include "database/thread_pool.hpp"
#include "database/vector_index.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class StoreState {
    Uninitialized,
    Probing,
    SchemaReady,
    Operational
};

const char* to_string(StoreState state);

struct StoreContext {
    BackendHandle backend;
    std::unique_ptr<VectorIndex> index;
    std::unordered_map<std::string, size_t> slot_of;
    std::vector<std::string> entity_of_slot;
};

class PersonaStore {
public:
    explicit PersonaStore(StoreConfig config = StoreConfig{});
    ~PersonaStore();

    PersonaStore(const PersonaStore&) = delete;
    PersonaStore& operator=(const PersonaStore&) = delete;

    void initialize();
    StoreState state() const { return current_state.load(); }
    const StoreConfig& config() const { return settings; }

    BackendKind backend_kind() const;

    // ===== ENTITIES =====

    Entity create_entity(const EntityDraft& draft);
    Entity get_entity(const std::string& id) const;
    std::optional<Entity> find_entity_by_external_id(const std::string& external_source,
                                                     const std::string& external_id) const;
    std::vector<Entity> list_entities(const EntityQuery& query) const;
    Entity update_entity(const std::string& id, const FieldMap& fields,
                         const std::string& acting_user);

    // ===== USERS =====

    std::string add_user(const User& user);
    User get_user(const std::string& id) const;

    // ===== RATINGS / COMMENTS / HISTORY =====

    std::string add_rating(const Rating& rating);
    std::vector<Rating> list_ratings(const std::string& entity_id) const;

    std::string add_comment(const Comment& comment);
    std::vector<Comment> list_comments(const std::string& entity_id) const;

    std::vector<EditHistoryRecord> list_edit_history(const std::string& entity_id) const;

    // ===== CATALOG =====

    std::vector<TypingSystem> list_typing_systems() const;
    void register_typing_system(const TypingSystem& system);

    StoreStats stats() const;

    // ===== VECTORS =====

    void add_embedding(const std::string& entity_id, const std::vector<float>& vector);

    // Raises what add_embedding() would for an entity without a vector yet,
    // without writing anything
    void check_new_embedding(const std::vector<float>& vector) const;
    // Top-k by similarity, optionally restricted to one entity kind
    std::vector<VectorMatch> vector_search(const std::vector<float>& query, int k,
                                           std::optional<EntityKind> kind = std::nullopt) const;

    // Rebuilds from persisted embeddings, dropping tombstones
    void rebuild_vector_index(size_t new_capacity);

    size_t indexed_vector_count() const;
    size_t vector_capacity() const;

    // ===== ASYNC =====

    template<typename Fn>
    auto submit(Fn&& fn) -> std::future<decltype(fn(std::declval<PersonaStore&>()))>;

private:
    StoreConfig settings;
    std::atomic<StoreState> current_state{StoreState::Uninitialized};
    std::mutex init_mutex;
    std::unique_ptr<StoreContext> context;
    mutable std::mutex index_mutex;

    // Declared last: stopped before the context goes away
    ThreadPool workers;

    StoreContext& operational(const char* operation) const;
    void check_vector(const StoreContext& ctx, const std::vector<float>& vector) const;
    VectorIndex::Config index_config(size_t capacity) const;

    // Caller holds index_mutex
    void load_index(StoreContext& ctx, size_t capacity);
};

// ==================== IMPLEMENTATION ====================

template<typename Fn>
auto PersonaStore::submit(Fn&& fn) -> std::future<decltype(fn(std::declval<PersonaStore&>()))> {
    return workers.submit([this, task = std::forward<Fn>(fn)]() mutable {
        return task(*this);
    });
}
