// ============= src/persona_store.cpp =============
#include "persona_store.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace {

void require_id(const std::string& id, const char* what) {
    if (id.empty()) {
        throw ValidationError(std::string(what) + " id must not be empty");
    }
}

}  // namespace

const char* to_string(StoreState state) {
    switch (state) {
        case StoreState::Uninitialized: return "uninitialized";
        case StoreState::Probing: return "probing";
        case StoreState::SchemaReady: return "schema_ready";
        case StoreState::Operational: return "operational";
    }
    return "uninitialized";
}

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

PersonaStore::PersonaStore(StoreConfig config)
    : settings(std::move(config)),
      workers(static_cast<size_t>(std::max(1, settings.worker_threads)))
{
}

PersonaStore::~PersonaStore() {
    workers.stop();
}

// ==================== INITIALIZATION ====================

void PersonaStore::initialize() {
    std::lock_guard<std::mutex> lock(init_mutex);

    if (current_state == StoreState::Operational) {
        return;
    }

    spdlog::info("Initializing PersonaStore");

    try {
        current_state = StoreState::Probing;
        BackendHandle backend = select_backend(settings);

        backend.visit([](auto& store) { store.ensure_schema(); });
        current_state = StoreState::SchemaReady;

        auto ctx = std::make_unique<StoreContext>(StoreContext{std::move(backend), nullptr, {}, {}});
        {
            std::lock_guard<std::mutex> index_lock(index_mutex);
            load_index(*ctx, static_cast<size_t>(settings.capacity));
        }

        context = std::move(ctx);
        current_state = StoreState::Operational;

        spdlog::info("✓ PersonaStore ready (backend={}, vectors={})",
                     to_string(context->backend.kind()), context->index->live_count());
    } catch (const std::exception& e) {
        spdlog::error("PersonaStore initialization failed: {}", e.what());
        context.reset();
        current_state = StoreState::Uninitialized;
        throw;
    }
}

VectorIndex::Config PersonaStore::index_config(size_t capacity) const {
    VectorIndex::Config cfg;
    cfg.dimension = settings.dimension;
    cfg.capacity = capacity;
    cfg.m = settings.m;
    cfg.ef_construction = settings.ef_construction;
    cfg.ef_search = settings.ef_search;
    cfg.exact_search_threshold = static_cast<size_t>(std::max(0, settings.exact_search_threshold));
    cfg.seed = settings.seed;
    return cfg;
}

void PersonaStore::load_index(StoreContext& ctx, size_t capacity) {
    auto records = ctx.backend.visit([](auto& store) { return store.load_embeddings(); });

    if (records.size() > capacity) {
        spdlog::warn("{} persisted embeddings exceed index capacity {}, raising capacity",
                     records.size(), capacity);
        capacity = records.size();
    }

    auto index = std::make_unique<VectorIndex>(index_config(capacity));
    std::unordered_map<std::string, size_t> slot_of;
    std::vector<std::string> entity_of_slot;

    size_t skipped = 0;
    for (const auto& record : records) {
        try {
            size_t slot = index->add(record.vector);
            slot_of[record.entity_id] = slot;
            entity_of_slot.resize(slot + 1);
            entity_of_slot[slot] = record.entity_id;
        } catch (const ValidationError& e) {
            spdlog::warn("Skipping stored embedding for {}: {}", record.entity_id, e.what());
            skipped++;
        }
    }

    ctx.index = std::move(index);
    ctx.slot_of = std::move(slot_of);
    ctx.entity_of_slot = std::move(entity_of_slot);

    spdlog::info("Vector index built: {} vectors, capacity {}{}", ctx.index->live_count(),
                 ctx.index->capacity(),
                 skipped ? " (" + std::to_string(skipped) + " skipped)" : std::string());
}

StoreContext& PersonaStore::operational(const char* operation) const {
    if (current_state.load() != StoreState::Operational || !context) {
        throw NotInitializedError(operation);
    }
    return *context;
}

BackendKind PersonaStore::backend_kind() const {
    return operational("backend_kind").backend.kind();
}

// ==================== ENTITIES ====================

Entity PersonaStore::create_entity(const EntityDraft& draft) {
    auto& ctx = operational("create_entity");
    return ctx.backend.visit([&](auto& store) { return store.create_entity(draft); });
}

Entity PersonaStore::get_entity(const std::string& id) const {
    auto& ctx = operational("get_entity");
    require_id(id, "entity");

    auto found = ctx.backend.visit([&](auto& store) { return store.get_entity(id); });
    if (!found) {
        throw NotFoundError("entity", id);
    }
    return *found;
}

std::optional<Entity> PersonaStore::find_entity_by_external_id(
    const std::string& external_source, const std::string& external_id) const {
    auto& ctx = operational("find_entity_by_external_id");
    require_id(external_id, "external");

    return ctx.backend.visit([&](auto& store) {
        return store.find_entity_by_external_id(external_source, external_id);
    });
}

std::vector<Entity> PersonaStore::list_entities(const EntityQuery& query) const {
    auto& ctx = operational("list_entities");
    return ctx.backend.visit([&](auto& store) { return store.list_entities(query); });
}

Entity PersonaStore::update_entity(const std::string& id, const FieldMap& fields,
                                   const std::string& acting_user) {
    auto& ctx = operational("update_entity");
    require_id(id, "entity");

    return ctx.backend.visit([&](auto& store) {
        return store.update_entity(id, fields, acting_user);
    });
}

// ==================== USERS ====================

std::string PersonaStore::add_user(const User& user) {
    auto& ctx = operational("add_user");
    return ctx.backend.visit([&](auto& store) { return store.add_user(user); });
}

User PersonaStore::get_user(const std::string& id) const {
    auto& ctx = operational("get_user");
    require_id(id, "user");

    auto found = ctx.backend.visit([&](auto& store) { return store.get_user(id); });
    if (!found) {
        throw NotFoundError("user", id);
    }
    return *found;
}

// ==================== RATINGS / COMMENTS / HISTORY ====================

std::string PersonaStore::add_rating(const Rating& rating) {
    auto& ctx = operational("add_rating");
    return ctx.backend.visit([&](auto& store) { return store.add_rating(rating); });
}

std::vector<Rating> PersonaStore::list_ratings(const std::string& entity_id) const {
    auto& ctx = operational("list_ratings");
    require_id(entity_id, "entity");
    return ctx.backend.visit([&](auto& store) { return store.list_ratings(entity_id); });
}

std::string PersonaStore::add_comment(const Comment& comment) {
    auto& ctx = operational("add_comment");
    return ctx.backend.visit([&](auto& store) { return store.add_comment(comment); });
}

std::vector<Comment> PersonaStore::list_comments(const std::string& entity_id) const {
    auto& ctx = operational("list_comments");
    require_id(entity_id, "entity");
    return ctx.backend.visit([&](auto& store) { return store.list_comments(entity_id); });
}

std::vector<EditHistoryRecord> PersonaStore::list_edit_history(const std::string& entity_id) const {
    auto& ctx = operational("list_edit_history");
    require_id(entity_id, "entity");
    return ctx.backend.visit([&](auto& store) { return store.list_edit_history(entity_id); });
}

// ==================== CATALOG ====================

std::vector<TypingSystem> PersonaStore::list_typing_systems() const {
    auto& ctx = operational("list_typing_systems");
    return ctx.backend.visit([](auto& store) { return store.list_typing_systems(); });
}

void PersonaStore::register_typing_system(const TypingSystem& system) {
    auto& ctx = operational("register_typing_system");
    ctx.backend.visit([&](auto& store) { store.register_typing_system(system); });
}

StoreStats PersonaStore::stats() const {
    auto& ctx = operational("stats");
    return ctx.backend.visit([](auto& store) { return store.stats(); });
}

// ==================== VECTORS ====================

void PersonaStore::add_embedding(const std::string& entity_id, const std::vector<float>& vector) {
    auto& ctx = operational("add_embedding");
    require_id(entity_id, "entity");
    check_vector(ctx, vector);

    bool exists = ctx.backend.visit([&](auto& store) { return store.entity_exists(entity_id); });
    if (!exists) {
        throw NotFoundError("entity", entity_id);
    }

    std::lock_guard<std::mutex> lock(index_mutex);

    auto previous = ctx.slot_of.find(entity_id);
    bool replacing = previous != ctx.slot_of.end();

    if (!replacing && ctx.index->live_count() >= ctx.index->capacity()) {
        throw CapacityExceededError(ctx.index->capacity());
    }

    ctx.backend.visit([&](auto& store) { store.put_embedding(entity_id, vector); });

    if (ctx.index->size() >= ctx.index->capacity()) {
        // Every free slot is held by a tombstone: compact from the persisted vectors,
        // which already include this one
        spdlog::info("Vector index full of tombstones ({} of {} live), compacting",
                     ctx.index->live_count(), ctx.index->capacity());
        load_index(ctx, ctx.index->capacity());
        return;
    }

    if (replacing) {
        ctx.index->mark_deleted(previous->second);
    }

    size_t slot = ctx.index->add(vector);
    ctx.slot_of[entity_id] = slot;
    if (ctx.entity_of_slot.size() <= slot) {
        ctx.entity_of_slot.resize(slot + 1);
    }
    ctx.entity_of_slot[slot] = entity_id;

    spdlog::debug("Embedding for {} stored in slot {}", entity_id, slot);
}

void PersonaStore::check_vector(const StoreContext& ctx, const std::vector<float>& vector) const {
    if (vector.size() != static_cast<size_t>(settings.dimension)) {
        throw DimensionMismatchError(settings.dimension, vector.size());
    }
    ctx.index->validate(vector);
}

void PersonaStore::check_new_embedding(const std::vector<float>& vector) const {
    auto& ctx = operational("check_new_embedding");
    check_vector(ctx, vector);

    std::lock_guard<std::mutex> lock(index_mutex);
    if (ctx.index->live_count() >= ctx.index->capacity()) {
        throw CapacityExceededError(ctx.index->capacity());
    }
}

std::vector<VectorMatch> PersonaStore::vector_search(const std::vector<float>& query, int k,
                                                     std::optional<EntityKind> kind) const {
    auto& ctx = operational("vector_search");

    if (query.size() != static_cast<size_t>(settings.dimension)) {
        throw DimensionMismatchError(settings.dimension, query.size());
    }
    if (k <= 0) {
        return {};
    }

    std::lock_guard<std::mutex> lock(index_mutex);

    // A kind filter can reject any hit, so rank every live vector
    int want = k;
    if (kind) {
        want = static_cast<int>(std::min<size_t>(ctx.index->live_count(),
                                                 std::numeric_limits<int>::max()));
    }

    std::vector<VectorMatch> ranked;
    for (const auto& hit : ctx.index->search(query, want)) {
        if (hit.slot >= ctx.entity_of_slot.size()) {
            continue;
        }
        VectorMatch m;
        m.entity_id = ctx.entity_of_slot[hit.slot];
        m.similarity = 1.0f - hit.distance;
        m.distance = hit.distance;
        ranked.push_back(std::move(m));
    }

    std::sort(ranked.begin(), ranked.end(), [](const VectorMatch& a, const VectorMatch& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.entity_id < b.entity_id;
    });

    std::vector<VectorMatch> matches;
    for (auto& m : ranked) {
        if (matches.size() >= static_cast<size_t>(k)) {
            break;
        }

        auto entity = ctx.backend.visit([&](auto& store) { return store.get_entity(m.entity_id); });
        if (!entity) {
            spdlog::warn("Indexed vector without entity: {}", m.entity_id);
            continue;
        }
        if (kind && entity->kind != *kind) {
            continue;
        }

        m.entity_name = entity->name;
        m.entity_kind = entity->kind;
        matches.push_back(std::move(m));
    }
    return matches;
}

void PersonaStore::rebuild_vector_index(size_t new_capacity) {
    auto& ctx = operational("rebuild_vector_index");

    if (new_capacity == 0) {
        throw ValidationError("vector index capacity must be positive");
    }

    std::lock_guard<std::mutex> lock(index_mutex);
    load_index(ctx, new_capacity);
}

size_t PersonaStore::indexed_vector_count() const {
    auto& ctx = operational("indexed_vector_count");
    std::lock_guard<std::mutex> lock(index_mutex);
    return ctx.index->live_count();
}

size_t PersonaStore::vector_capacity() const {
    auto& ctx = operational("vector_capacity");
    std::lock_guard<std::mutex> lock(index_mutex);
    return ctx.index->capacity();
}
