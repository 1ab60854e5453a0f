// ============= include/database/vector_index.hpp =============
/*
 * HNSW Vector Index - In-Memory Similarity Search
 *
 * ALGORITHM: Hierarchical Navigable Small World over slot numbers
 * - Cosine distance on L2-normalized vectors (1 - dot)
 * - Exact scan while live vectors <= exact_search_threshold
 *
 * SLOTS:
 * - add() hands out the next free slot, never reuses one
 * - mark_deleted() tombstones a slot: hidden from results, still routes
 *   graph traversal and still counts against capacity
 * - capacity only grows by building a new index
 *
 * Thread-safe (RW lock). Level assignment is seeded, so a rebuild from the
 * same vectors in the same order yields the same graph.
 */

#pragma once
#include <cstddef>
#include <algorithm>
#include <cstdint>
#include <random>
#include <shared_mutex>
#include <utility>
#include <vector>

class VectorIndex {
public:
    struct Config {
        int dimension = 384;
        size_t capacity = 10000;
        int m = 16;
        int ef_construction = 200;
        int ef_search = 64;
        size_t exact_search_threshold = 2048;
        uint32_t seed = 100;
    };

    struct Hit {
        size_t slot;
        float distance;          // cosine distance (lower = better)
    };

    explicit VectorIndex(const Config& config);

    // ===== CORE OPERATIONS =====

    // Throws DimensionMismatchError, ValidationError (non-finite / zero norm),
    // CapacityExceededError
    size_t add(const std::vector<float>& vector);

    // Same checks as add() without touching the index
    void validate(const std::vector<float>& vector) const;

    void mark_deleted(size_t slot);

    // Ascending by distance, then slot. Hits tied with the k-th distance
    // are all returned.
    std::vector<Hit> search(const std::vector<float>& query, int k) const;

    // ===== STATS =====

    size_t size() const;            // used slots, tombstones included
    size_t live_count() const;
    size_t capacity() const { return config.capacity; }
    int dimension() const { return config.dimension; }
    bool is_deleted(size_t slot) const;

private:
    struct Node {
        std::vector<float> vector;
        int level = 0;
        std::vector<std::vector<uint32_t>> neighbors;   // per layer
        bool deleted = false;
    };

    using Candidate = std::pair<float, uint32_t>;       // (distance, slot)

    static constexpr int MAX_LEVEL = 16;

    Config config;
    size_t M0;                       // max connections at layer 0
    double level_mult;

    std::vector<Node> nodes;
    int64_t entry_point = -1;
    int max_layer = 0;
    size_t deleted_count = 0;

    std::mt19937 rng;
    mutable std::shared_mutex mutex;

    // ===== HNSW HELPERS =====

    float distance(const std::vector<float>& a, const std::vector<float>& b) const;
    int get_random_layer();

    std::vector<float> normalized(const std::vector<float>& vector) const;

    std::vector<Candidate> search_layer(const std::vector<float>& query,
                                        uint32_t entry, int layer, size_t ef) const;

    std::vector<uint32_t> select_neighbors(const std::vector<float>& base,
                                           const std::vector<uint32_t>& candidates,
                                           size_t max_count) const;

    std::vector<Hit> exact_search(const std::vector<float>& query, size_t k) const;
    std::vector<Hit> graph_search(const std::vector<float>& query, size_t k) const;

    static std::vector<Hit> take_with_ties(std::vector<Candidate> sorted, size_t k);
};

// ==================== INLINE IMPLEMENTATIONS ====================

inline float VectorIndex::distance(const std::vector<float>& a,
                                   const std::vector<float>& b) const {
    float dot = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
    }
    return 1.0f - std::max(-1.0f, std::min(1.0f, dot));
}
