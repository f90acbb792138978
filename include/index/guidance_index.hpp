#pragma once

#include "corpus/pattern.hpp"
#include "index/direct_lookup_cache.hpp"
#include "index/negative_anchor_cache.hpp"
#include "index/vector_index.hpp"
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief Counts and provenance for one built index
 */
struct IndexStats {
    std::map<std::string, size_t> patterns_per_category;
    std::map<std::string, size_t> anchors_per_category;
    size_t total_indexed = 0;
    size_t collisions = 0;          ///< Patterns dropped because a later one shared its key
    size_t anchors_skipped = 0;
    size_t dimension = 0;
    std::string embedding_model_id;
    std::string created_utc;
    double build_time_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
    static IndexStats from_json(const nlohmann::json& j);
};

/**
 * @brief Immutable-after-build index snapshot
 *
 * Holds everything a query needs: the vector collection, the exact-match
 * table, per-category anchor embeddings and the resolved patterns.
 * Published as a whole; never mutated once queries can see it.
 */
struct GuidanceIndex {
    CategoryRegistry categories;
    std::vector<Pattern> patterns;                          ///< Resolved, load order
    std::unordered_map<std::string, size_t> pattern_by_id;  ///< id -> position in patterns
    DirectLookupCache direct;
    NegativeAnchorCache anchors;
    std::shared_ptr<VectorIndex> collection;
    IndexStats stats;

    const Pattern* find_pattern(const std::string& id) const;

    std::string embedding_model_id() const;
    size_t dimension() const;

    /**
     * @brief True when nothing has been indexed
     */
    bool empty() const;

    void save_to_json(const std::string& path) const;

    /**
     * @brief Restore a snapshot, repopulating the given (empty) collection
     */
    static std::shared_ptr<GuidanceIndex> load_from_json(
        const std::string& path,
        std::shared_ptr<VectorIndex> collection
    );
};

} // namespace tg
