// ============= src/database/vector_index.cpp =============
#include "database/vector_index.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <queue>
#include <unordered_set>

VectorIndex::VectorIndex(const Config& config)
    : config(config),
      M0(static_cast<size_t>(config.m) * 2),
      level_mult(1.0 / std::log(static_cast<double>(std::max(config.m, 2)))),
      rng(config.seed)
{
    if (config.dimension <= 0) {
        throw ValidationError("vector index dimension must be positive");
    }
    if (config.m < 2) {
        throw ValidationError("vector index M must be at least 2");
    }

    nodes.reserve(std::min<size_t>(config.capacity, 65536));

    spdlog::debug("HNSW index: dim={} capacity={} M={} ef_construction={} ef_search={}",
                  config.dimension, config.capacity, config.m,
                  config.ef_construction, config.ef_search);
}

// ==================== HELPERS ====================

int VectorIndex::get_random_layer() {
    std::uniform_real_distribution<double> dis(0.0, 1.0);
    double r = 1.0 - dis(rng);     // (0, 1]
    int level = static_cast<int>(-std::log(r) * level_mult);
    return std::min(level, MAX_LEVEL);
}

std::vector<float> VectorIndex::normalized(const std::vector<float>& vector) const {
    if (vector.size() != static_cast<size_t>(config.dimension)) {
        throw DimensionMismatchError(config.dimension, vector.size());
    }

    double norm = 0.0;
    for (float x : vector) {
        if (!std::isfinite(x)) {
            throw ValidationError("vector contains a non-finite component");
        }
        norm += static_cast<double>(x) * x;
    }
    norm = std::sqrt(norm);
    if (norm == 0.0 || !std::isfinite(norm)) {
        throw ValidationError("vector has zero norm");
    }

    std::vector<float> out(vector.size());
    for (size_t i = 0; i < vector.size(); ++i) {
        out[i] = static_cast<float>(vector[i] / norm);
    }
    return out;
}

void VectorIndex::validate(const std::vector<float>& vector) const {
    normalized(vector);
}

// ==================== INSERT ====================

size_t VectorIndex::add(const std::vector<float>& vector) {
    std::vector<float> unit = normalized(vector);

    std::unique_lock<std::shared_mutex> lock(mutex);

    if (nodes.size() >= config.capacity) {
        throw CapacityExceededError(config.capacity);
    }

    uint32_t slot = static_cast<uint32_t>(nodes.size());

    Node node;
    node.vector = std::move(unit);
    node.level = get_random_layer();
    node.neighbors.resize(node.level + 1);
    nodes.push_back(std::move(node));

    // First insertion
    if (entry_point < 0) {
        entry_point = slot;
        max_layer = nodes[slot].level;
        return slot;
    }

    const std::vector<float>& query = nodes[slot].vector;
    int level = nodes[slot].level;
    uint32_t current = static_cast<uint32_t>(entry_point);

    // Greedy descent through layers above the new node
    for (int lc = max_layer; lc > level; --lc) {
        auto candidates = search_layer(query, current, lc, 1);
        if (!candidates.empty()) {
            current = candidates[0].second;
        }
    }

    // Connect at layers [0, min(level, max_layer)]
    for (int lc = std::min(level, max_layer); lc >= 0; --lc) {
        auto candidates = search_layer(query, current, lc,
                                       static_cast<size_t>(config.ef_construction));
        if (!candidates.empty()) {
            current = candidates[0].second;
        }

        size_t max_conn = (lc == 0) ? M0 : static_cast<size_t>(config.m);

        std::vector<uint32_t> ids;
        ids.reserve(candidates.size());
        for (const auto& c : candidates) {
            ids.push_back(c.second);
        }
        auto selected = select_neighbors(query, ids, static_cast<size_t>(config.m));
        nodes[slot].neighbors[lc] = selected;

        // Bidirectional connections
        for (uint32_t neighbor : selected) {
            auto& nb_neighbors = nodes[neighbor].neighbors[lc];
            nb_neighbors.push_back(slot);
            if (nb_neighbors.size() > max_conn) {
                nb_neighbors = select_neighbors(nodes[neighbor].vector, nb_neighbors, max_conn);
            }
        }
    }

    if (level > max_layer) {
        max_layer = level;
        entry_point = slot;
    }

    return slot;
}

void VectorIndex::mark_deleted(size_t slot) {
    std::unique_lock<std::shared_mutex> lock(mutex);

    if (slot >= nodes.size()) {
        throw ValidationError("vector slot out of range: " + std::to_string(slot));
    }
    if (!nodes[slot].deleted) {
        nodes[slot].deleted = true;
        deleted_count++;
    }
}

// ==================== SEARCH ====================

std::vector<VectorIndex::Hit> VectorIndex::search(const std::vector<float>& query, int k) const {
    if (query.size() != static_cast<size_t>(config.dimension)) {
        throw DimensionMismatchError(config.dimension, query.size());
    }
    if (k <= 0) {
        return {};
    }

    std::vector<float> unit = normalized(query);

    std::shared_lock<std::shared_mutex> lock(mutex);

    size_t live = nodes.size() - deleted_count;
    if (live == 0) {
        return {};
    }

    size_t want = static_cast<size_t>(k);
    if (live <= config.exact_search_threshold) {
        return exact_search(unit, want);
    }

    auto hits = graph_search(unit, want);
    if (hits.size() < std::min(want, live)) {
        // Tombstones crowded the candidate list
        return exact_search(unit, want);
    }
    return hits;
}

std::vector<VectorIndex::Hit> VectorIndex::exact_search(const std::vector<float>& query,
                                                        size_t k) const {
    std::vector<Candidate> all;
    all.reserve(nodes.size() - deleted_count);
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!nodes[i].deleted) {
            all.push_back({distance(query, nodes[i].vector), static_cast<uint32_t>(i)});
        }
    }
    std::sort(all.begin(), all.end());
    return take_with_ties(std::move(all), k);
}

std::vector<VectorIndex::Hit> VectorIndex::graph_search(const std::vector<float>& query,
                                                        size_t k) const {
    uint32_t current = static_cast<uint32_t>(entry_point);

    for (int lc = max_layer; lc > 0; --lc) {
        auto candidates = search_layer(query, current, lc, 1);
        if (!candidates.empty()) {
            current = candidates[0].second;
        }
    }

    size_t ef = std::max(static_cast<size_t>(config.ef_search), k);
    auto candidates = search_layer(query, current, 0, ef);

    std::vector<Candidate> live;
    live.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (!nodes[c.second].deleted) {
            live.push_back(c);
        }
    }
    return take_with_ties(std::move(live), k);
}

std::vector<VectorIndex::Hit> VectorIndex::take_with_ties(std::vector<Candidate> sorted,
                                                          size_t k) {
    std::vector<Hit> results;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i >= k && sorted[i].first != sorted[k - 1].first) {
            break;
        }
        results.push_back({sorted[i].second, sorted[i].first});
    }
    return results;
}

// ==================== SEARCH LAYER ====================

std::vector<VectorIndex::Candidate> VectorIndex::search_layer(const std::vector<float>& query,
                                                              uint32_t entry, int layer,
                                                              size_t ef) const {
    std::unordered_set<uint32_t> visited;

    auto cmp = [](const Candidate& a, const Candidate& b) { return a.first > b.first; };
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(cmp)> candidates(cmp);
    std::priority_queue<Candidate> w;  // Max heap

    float d = distance(query, nodes[entry].vector);
    candidates.push({d, entry});
    w.push({d, entry});
    visited.insert(entry);

    while (!candidates.empty()) {
        auto [current_dist, current] = candidates.top();
        candidates.pop();

        if (current_dist > w.top().first) {
            break;
        }

        const auto& links = nodes[current].neighbors;
        if (static_cast<size_t>(layer) >= links.size()) {
            continue;
        }

        for (uint32_t neighbor : links[layer]) {
            if (!visited.insert(neighbor).second) {
                continue;
            }

            float d_neighbor = distance(query, nodes[neighbor].vector);

            if (w.size() < ef || d_neighbor < w.top().first) {
                candidates.push({d_neighbor, neighbor});
                w.push({d_neighbor, neighbor});

                if (w.size() > ef) {
                    w.pop();
                }
            }
        }
    }

    std::vector<Candidate> results;
    results.reserve(w.size());
    while (!w.empty()) {
        results.push_back(w.top());
        w.pop();
    }
    std::sort(results.begin(), results.end());
    return results;
}

// ==================== SELECT NEIGHBORS ====================

std::vector<uint32_t> VectorIndex::select_neighbors(const std::vector<float>& base,
                                                    const std::vector<uint32_t>& candidates,
                                                    size_t max_count) const {
    if (candidates.size() <= max_count) {
        return candidates;
    }

    // Simple heuristic: keep the closest
    std::vector<Candidate> scored;
    scored.reserve(candidates.size());
    for (uint32_t id : candidates) {
        scored.push_back({distance(base, nodes[id].vector), id});
    }
    std::sort(scored.begin(), scored.end());

    std::vector<uint32_t> selected;
    selected.reserve(max_count);
    for (size_t i = 0; i < max_count; ++i) {
        selected.push_back(scored[i].second);
    }
    return selected;
}

// ==================== STATS ====================

size_t VectorIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return nodes.size();
}

size_t VectorIndex::live_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return nodes.size() - deleted_count;
}

bool VectorIndex::is_deleted(size_t slot) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return slot < nodes.size() && nodes[slot].deleted;
}
