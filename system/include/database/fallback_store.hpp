// ============= include/database/fallback_store.hpp =============
/*
 * Dependency-free store persisted as one JSON snapshot
 *
 * SNAPSHOT LAYOUT:
 *   { "version": 1, "entities": [...], "users": [...], "ratings": [...],
 *     "comments": [...], "typingSystems": [...], "editHistory": [...],
 *     "embeddings": [...] }
 *
 * WRITES:
 * - mutation is applied to a copy of the dataset
 * - copy is written to <path>.tmp and renamed over <path>
 * - only then the copy becomes live; a failed write raises BackendError
 *   and leaves the previous state untouched
 *
 * A missing snapshot starts empty. An unreadable one is moved to <path>.corrupt
 * and the store starts empty with a warning.
 * Not safe for several processes sharing one snapshot file.
 */

#pragma once
#include "core/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct FallbackDataset {
    std::map<std::string, Entity> entities;             // stored fields only
    std::map<std::string, User> users;
    std::vector<Rating> ratings;
    std::vector<Comment> comments;                      // without display names
    std::vector<EditHistoryRecord> edit_history;
    std::map<std::string, TypingSystem> typing_systems;
    std::map<std::string, EmbeddingRecord> embeddings;

    bool operator==(const FallbackDataset& other) const;
    bool operator!=(const FallbackDataset& other) const { return !(*this == other); }
};

class FallbackStore {
public:
    static constexpr int SNAPSHOT_VERSION = 1;

    explicit FallbackStore(const std::string& snapshot_path);

    FallbackStore(const FallbackStore&) = delete;
    FallbackStore& operator=(const FallbackStore&) = delete;

    static const char* backend_name() { return "fallback"; }

    // Seeds an empty catalog
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

    // ===== SNAPSHOT =====

    FallbackDataset snapshot() const;
    const std::string& path() const { return snapshot_path; }

    // Throws BackendError (I/O, syntax) or ValidationError (bad field types)
    static FallbackDataset read_snapshot(const std::string& path);
    static void write_snapshot(const std::string& path, const FallbackDataset& data);

private:
    std::string snapshot_path;
    FallbackDataset data;
    mutable std::mutex mutex;

    template<typename Fn>
    void mutate(Fn&& fn);

    // Adds rating_count and typings
    Entity decorate(const Entity& stored) const;
    void require_entity(const std::string& id) const;
};
