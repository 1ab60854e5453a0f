// ============= src/database/fallback_store.cpp =============
#include "database/fallback_store.hpp"
#include "database/json_codec.hpp"
#include "database/schema_manager.hpp"
#include "database/validation.hpp"
#include "core/errors.hpp"
#include "core/ids.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {

bool newer_first(int64_t a_time, const std::string& a_id, int64_t b_time, const std::string& b_id) {
    if (a_time != b_time) return a_time > b_time;
    return a_id > b_id;
}

const Json::Value& array_field(const Json::Value& root, const char* key) {
    const Json::Value& v = root[key];
    if (!v.isNull() && !v.isArray()) {
        throw ValidationError(std::string("snapshot field '") + key + "' must be an array");
    }
    return v;
}

}  // namespace

bool FallbackDataset::operator==(const FallbackDataset& other) const {
    return entities == other.entities && users == other.users && ratings == other.ratings &&
           comments == other.comments && edit_history == other.edit_history &&
           typing_systems == other.typing_systems && embeddings == other.embeddings;
}

// ==================== SNAPSHOT I/O ====================

FallbackDataset FallbackStore::read_snapshot(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw BackendError("snapshot read", "cannot open " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Json::Value root;
    std::string errors;
    if (!parse_json(buffer.str(), root, &errors)) {
        throw BackendError("snapshot read", path + ": " + errors);
    }
    if (!root.isObject()) {
        throw ValidationError("snapshot root must be a JSON object");
    }

    FallbackDataset ds;

    for (const auto& v : array_field(root, "entities")) {
        Entity e = entity_from_json(v);
        ds.entities[e.id] = e;
    }
    for (const auto& v : array_field(root, "users")) {
        User u = user_from_json(v);
        ds.users[u.id] = u;
    }
    for (const auto& v : array_field(root, "ratings")) {
        ds.ratings.push_back(rating_from_json(v));
    }
    for (const auto& v : array_field(root, "comments")) {
        ds.comments.push_back(comment_from_json(v));
    }
    for (const auto& v : array_field(root, "editHistory")) {
        ds.edit_history.push_back(edit_history_from_json(v));
    }
    for (const auto& v : array_field(root, "typingSystems")) {
        TypingSystem s = typing_system_from_json(v);
        ds.typing_systems[s.name] = s;
    }
    for (const auto& v : array_field(root, "embeddings")) {
        EmbeddingRecord r = embedding_from_json(v);
        ds.embeddings[r.entity_id] = r;
    }

    return ds;
}

void FallbackStore::write_snapshot(const std::string& path, const FallbackDataset& ds) {
    Json::Value root(Json::objectValue);
    root["version"] = SNAPSHOT_VERSION;

    Json::Value entities(Json::arrayValue);
    for (const auto& [id, e] : ds.entities) entities.append(to_json(e));
    root["entities"] = entities;

    Json::Value users(Json::arrayValue);
    for (const auto& [id, u] : ds.users) users.append(to_json(u));
    root["users"] = users;

    Json::Value ratings(Json::arrayValue);
    for (const auto& r : ds.ratings) ratings.append(to_json(r));
    root["ratings"] = ratings;

    Json::Value comments(Json::arrayValue);
    for (const auto& c : ds.comments) comments.append(to_json(c));
    root["comments"] = comments;

    Json::Value systems(Json::arrayValue);
    for (const auto& [name, s] : ds.typing_systems) systems.append(to_json(s));
    root["typingSystems"] = systems;

    Json::Value history(Json::arrayValue);
    for (const auto& h : ds.edit_history) history.append(to_json(h));
    root["editHistory"] = history;

    Json::Value embeddings(Json::arrayValue);
    for (const auto& [id, r] : ds.embeddings) embeddings.append(to_json(r));
    root["embeddings"] = embeddings;

    std::filesystem::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw BackendError("snapshot write", "cannot create directory " +
                               target.parent_path().string() + ": " + ec.message());
        }
    }

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw BackendError("snapshot write", "cannot open " + tmp_path);
        }
        out << write_json(root, true) << '\n';
        out.flush();
        if (!out) {
            throw BackendError("snapshot write", "write failed for " + tmp_path);
        }
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw BackendError("snapshot write", "rename to " + path + " failed: " + ec.message());
    }
}

// ==================== CONSTRUCTOR ====================

FallbackStore::FallbackStore(const std::string& snapshot_path)
    : snapshot_path(snapshot_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(snapshot_path, ec)) {
        spdlog::info("Fallback store: no snapshot at {}, starting empty", snapshot_path);
        return;
    }

    try {
        data = read_snapshot(snapshot_path);
        spdlog::info("Fallback store loaded {} ({} entities)", snapshot_path, data.entities.size());
    } catch (const PersistenceError& e) {
        std::string quarantine = snapshot_path + ".corrupt";
        spdlog::warn("Fallback snapshot {} unreadable, resetting to empty: {}",
                     snapshot_path, e.what());
        data = FallbackDataset{};

        std::filesystem::rename(snapshot_path, quarantine, ec);
        if (ec) {
            spdlog::error("Cannot move {} to {}: {}", snapshot_path, quarantine, ec.message());
        } else {
            spdlog::warn("Unreadable snapshot kept as {}", quarantine);
        }
    }
}

void FallbackStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex);

    if (!data.typing_systems.empty()) {
        return;
    }

    for (const auto& system : SchemaManager::default_catalog()) {
        data.typing_systems[system.name] = system;
    }

    try {
        write_snapshot(snapshot_path, data);
        spdlog::info("✓ Seeded typing catalog on fallback ({} systems)",
                     data.typing_systems.size());
    } catch (const BackendError& e) {
        spdlog::warn("Fallback catalog seeded in memory only: {}", e.what());
    }
}

template<typename Fn>
void FallbackStore::mutate(Fn&& fn) {
    FallbackDataset next = data;
    fn(next);
    write_snapshot(snapshot_path, next);
    data = std::move(next);
}

FallbackDataset FallbackStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return data;
}

// ==================== HELPERS ====================

void FallbackStore::require_entity(const std::string& id) const {
    if (data.entities.find(id) == data.entities.end()) {
        throw NotFoundError("entity", id);
    }
}

Entity FallbackStore::decorate(const Entity& stored) const {
    Entity e = stored;
    e.rating_count = 0;
    e.typings.clear();

    std::map<std::pair<std::string, std::string>, std::pair<int64_t, double>> groups;
    for (const auto& r : data.ratings) {
        if (r.entity_id != e.id) continue;
        auto& g = groups[{r.system, r.type_code}];
        g.first += 1;
        g.second += r.confidence;
        e.rating_count++;
    }

    for (const auto& [key, g] : groups) {
        TypingAssignment t;
        t.system = key.first;
        t.type_code = key.second;
        t.rating_count = g.first;
        t.mean_confidence = g.second / static_cast<double>(g.first);
        e.typings.push_back(t);
    }
    return e;
}

// ==================== ENTITIES ====================

Entity FallbackStore::create_entity(const EntityDraft& draft) {
    validate_entity_draft(draft);

    std::lock_guard<std::mutex> lock(mutex);

    std::string id = draft.id.empty() ? generate_id() : draft.id;
    if (data.entities.count(id)) {
        throw ValidationError("entity id already exists: " + id);
    }

    Entity e;
    e.id = id;
    e.name = draft.name;
    e.description = draft.description;
    e.kind = draft.kind;
    e.category = draft.category;
    e.source = draft.source;
    e.notes = draft.notes;
    e.external_id = draft.external_id;
    e.external_source = draft.external_source;
    e.metadata = draft.metadata.isNull() ? Json::Value(Json::objectValue) : draft.metadata;
    e.created_at = now_us();
    e.updated_at = e.created_at;

    mutate([&](FallbackDataset& ds) { ds.entities[id] = e; });

    return decorate(e);
}

std::optional<Entity> FallbackStore::get_entity(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = data.entities.find(id);
    if (it == data.entities.end()) {
        return std::nullopt;
    }
    return decorate(it->second);
}

std::optional<Entity> FallbackStore::find_entity_by_external_id(
    const std::string& external_source, const std::string& external_id) {
    std::lock_guard<std::mutex> lock(mutex);

    const Entity* oldest = nullptr;
    for (const auto& [id, stored] : data.entities) {
        if (stored.external_source != external_source || stored.external_id != external_id) {
            continue;
        }
        if (!oldest || stored.created_at < oldest->created_at) {
            oldest = &stored;
        }
    }

    if (!oldest) {
        return std::nullopt;
    }
    return decorate(*oldest);
}

bool FallbackStore::entity_exists(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return data.entities.count(id) > 0;
}

std::vector<Entity> FallbackStore::list_entities(const EntityQuery& query) {
    validate_entity_query(query);
    if (query.limit == 0) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex);

    std::vector<Entity> matches;
    for (const auto& [id, stored] : data.entities) {
        if (!query.search.empty() &&
            !contains_ignore_case(stored.name, query.search) &&
            !contains_ignore_case(stored.description, query.search) &&
            !contains_ignore_case(stored.notes, query.search)) {
            continue;
        }
        if (!query.category.empty() && stored.category != query.category) continue;
        if (query.kind && stored.kind != *query.kind) continue;

        matches.push_back(decorate(stored));
    }

    auto by_name = [](const Entity& a, const Entity& b) {
        if (a.name != b.name) return a.name < b.name;
        return a.id < b.id;
    };

    switch (query.sort) {
        case EntitySort::NameAsc:
            std::sort(matches.begin(), matches.end(), by_name);
            break;
        case EntitySort::NameDesc:
            std::sort(matches.begin(), matches.end(), [](const Entity& a, const Entity& b) {
                if (a.name != b.name) return a.name > b.name;
                return a.id < b.id;
            });
            break;
        case EntitySort::Category:
            std::sort(matches.begin(), matches.end(), [&](const Entity& a, const Entity& b) {
                if (a.category != b.category) return a.category < b.category;
                return by_name(a, b);
            });
            break;
        case EntitySort::RatingCount:
            std::sort(matches.begin(), matches.end(), [&](const Entity& a, const Entity& b) {
                if (a.rating_count != b.rating_count) return a.rating_count > b.rating_count;
                return by_name(a, b);
            });
            break;
        case EntitySort::Recent:
            std::sort(matches.begin(), matches.end(), [&](const Entity& a, const Entity& b) {
                if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
                return by_name(a, b);
            });
            break;
    }

    size_t begin = std::min(matches.size(), static_cast<size_t>(query.offset));
    size_t end = std::min(matches.size(), begin + static_cast<size_t>(query.limit));
    return std::vector<Entity>(matches.begin() + begin, matches.begin() + end);
}

Entity FallbackStore::update_entity(const std::string& id, const FieldMap& fields,
                                    const std::string& acting_user) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = data.entities.find(id);
    if (it == data.entities.end()) {
        throw NotFoundError("entity", id);
    }

    auto changes = diff_entity_fields(it->second, fields);
    if (changes.empty()) {
        return decorate(it->second);
    }

    mutate([&](FallbackDataset& ds) {
        Entity& e = ds.entities[id];
        for (const auto& change : changes) {
            assign_entity_field(e, change.field, change.new_value);
        }
        e.updated_at = now_us();
        e.last_modified_by = acting_user;

        for (const auto& change : changes) {
            EditHistoryRecord h;
            h.id = generate_id();
            h.entity_id = id;
            h.user_id = acting_user;
            h.field_name = change.field;
            h.old_value = change.old_value;
            h.new_value = change.new_value;
            h.created_at = now_us();
            ds.edit_history.push_back(h);
        }
    });

    return decorate(data.entities.at(id));
}

// ==================== USERS ====================

std::string FallbackStore::add_user(const User& user) {
    validate_user(user);

    std::lock_guard<std::mutex> lock(mutex);

    User stored = user;
    if (stored.id.empty()) {
        stored.id = generate_id();
    }

    for (const auto& [id, existing] : data.users) {
        if (existing.username == stored.username && id != stored.id) {
            throw ValidationError("username already taken: " + stored.username);
        }
    }

    auto it = data.users.find(stored.id);
    if (it != data.users.end()) {
        stored.created_at = it->second.created_at;
    } else if (stored.created_at <= 0) {
        stored.created_at = now_us();
    }

    mutate([&](FallbackDataset& ds) { ds.users[stored.id] = stored; });
    return stored.id;
}

std::optional<User> FallbackStore::get_user(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);

    auto it = data.users.find(id);
    if (it == data.users.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ==================== RATINGS ====================

std::string FallbackStore::add_rating(const Rating& rating) {
    validate_rating(rating);

    std::lock_guard<std::mutex> lock(mutex);

    require_entity(rating.entity_id);

    auto system = data.typing_systems.find(rating.system);
    if (system == data.typing_systems.end() ||
        std::find(system->second.type_codes.begin(), system->second.type_codes.end(),
                  rating.type_code) == system->second.type_codes.end()) {
        throw ValidationError("unknown type code '" + rating.type_code +
                              "' for typing system '" + rating.system + "'");
    }

    Rating stored = rating;
    stored.id = rating.id.empty() ? generate_id() : rating.id;
    for (const auto& r : data.ratings) {
        if (r.id == stored.id) {
            throw ValidationError("rating id already exists: " + stored.id);
        }
    }
    stored.created_at = now_us();

    mutate([&](FallbackDataset& ds) { ds.ratings.push_back(stored); });
    return stored.id;
}

std::vector<Rating> FallbackStore::list_ratings(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    std::vector<Rating> ratings;
    for (const auto& r : data.ratings) {
        if (r.entity_id == entity_id) ratings.push_back(r);
    }
    std::sort(ratings.begin(), ratings.end(), [](const Rating& a, const Rating& b) {
        return newer_first(a.created_at, a.id, b.created_at, b.id);
    });
    return ratings;
}

// ==================== COMMENTS ====================

std::string FallbackStore::add_comment(const Comment& comment) {
    validate_comment(comment);

    std::lock_guard<std::mutex> lock(mutex);

    require_entity(comment.entity_id);

    Comment stored = comment;
    stored.id = comment.id.empty() ? generate_id() : comment.id;
    for (const auto& c : data.comments) {
        if (c.id == stored.id) {
            throw ValidationError("comment id already exists: " + stored.id);
        }
    }
    stored.created_at = now_us();
    stored.user_display_name.clear();

    mutate([&](FallbackDataset& ds) { ds.comments.push_back(stored); });
    return stored.id;
}

std::vector<Comment> FallbackStore::list_comments(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    std::vector<Comment> comments;
    for (const auto& c : data.comments) {
        if (c.entity_id != entity_id) continue;
        Comment out = c;
        auto user = data.users.find(c.user_id);
        out.user_display_name = user != data.users.end() ? user->second.display_name : "";
        comments.push_back(std::move(out));
    }
    std::sort(comments.begin(), comments.end(), [](const Comment& a, const Comment& b) {
        return newer_first(a.created_at, a.id, b.created_at, b.id);
    });
    return comments;
}

// ==================== EDIT HISTORY ====================

std::vector<EditHistoryRecord> FallbackStore::list_edit_history(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    std::vector<EditHistoryRecord> history;
    for (const auto& h : data.edit_history) {
        if (h.entity_id != entity_id) continue;
        EditHistoryRecord out = h;
        auto user = data.users.find(h.user_id);
        out.user_display_name = user != data.users.end() ? user->second.display_name : "";
        history.push_back(std::move(out));
    }
    std::sort(history.begin(), history.end(),
              [](const EditHistoryRecord& a, const EditHistoryRecord& b) {
                  return newer_first(a.created_at, a.id, b.created_at, b.id);
              });
    return history;
}

// ==================== CATALOG ====================

std::vector<TypingSystem> FallbackStore::list_typing_systems() {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<TypingSystem> systems;
    for (const auto& [name, s] : data.typing_systems) {
        systems.push_back(s);
    }
    return systems;
}

void FallbackStore::register_typing_system(const TypingSystem& system) {
    validate_typing_system(system);

    std::lock_guard<std::mutex> lock(mutex);

    mutate([&](FallbackDataset& ds) {
        auto it = ds.typing_systems.find(system.name);
        if (it == ds.typing_systems.end()) {
            TypingSystem fresh = system;
            fresh.type_codes.clear();
            it = ds.typing_systems.emplace(system.name, fresh).first;
        }

        auto& codes = it->second.type_codes;
        for (const auto& code : system.type_codes) {
            if (std::find(codes.begin(), codes.end(), code) == codes.end()) {
                codes.push_back(code);
            }
        }
    });

    spdlog::info("Registered typing system '{}' ({} codes)", system.name,
                 system.type_codes.size());
}

// ==================== EMBEDDINGS ====================

void FallbackStore::put_embedding(const std::string& entity_id, const std::vector<float>& vector) {
    std::lock_guard<std::mutex> lock(mutex);

    require_entity(entity_id);

    EmbeddingRecord record{entity_id, vector, now_us()};
    mutate([&](FallbackDataset& ds) { ds.embeddings[entity_id] = record; });
}

std::vector<EmbeddingRecord> FallbackStore::load_embeddings() {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<EmbeddingRecord> records;
    for (const auto& [id, r] : data.embeddings) {
        records.push_back(r);
    }
    return records;
}

// ==================== STATS ====================

StoreStats FallbackStore::stats() {
    std::lock_guard<std::mutex> lock(mutex);

    StoreStats s;
    s.entity_count = static_cast<int64_t>(data.entities.size());
    s.user_count = static_cast<int64_t>(data.users.size());
    for (const auto& [name, system] : data.typing_systems) {
        s.type_count += static_cast<int64_t>(system.type_codes.size());
    }
    s.rating_count = static_cast<int64_t>(data.ratings.size());
    s.comment_count = static_cast<int64_t>(data.comments.size());
    return s;
}
