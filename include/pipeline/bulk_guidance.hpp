#pragma once

#include "engine/disambiguation_engine.hpp"
#include "engine/guidance_result.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

// ============================================================================
// Bulk Guidance Report
// ============================================================================

/**
 * @brief Results and counters for one bulk guidance call
 *
 * Outcome counters are per input term, duplicates included.
 */
struct BulkGuidanceReport {
    std::vector<GuidanceResult> results;             ///< One per input term, input order
    std::vector<GuidanceResult> high_confidence;     ///< final_score >= min_confidence, unique terms
    std::vector<GuidanceResult> medium_confidence;   ///< Matched but below min_confidence

    size_t total_terms = 0;
    size_t direct_hits = 0;
    size_t vector_hits = 0;
    size_t aggregated_hits = 0;
    size_t neg_penalties_applied = 0;
    size_t not_found = 0;
    size_t rate_limited = 0;
    size_t cache_hits = 0;
    size_t api_calls_made = 0;

    double elapsed_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Session Cache
// ============================================================================

/**
 * @brief Bounded term -> result cache scoped to one orchestrator
 *
 * Oldest entries are evicted first once max_entries is reached.
 */
class SessionCache {
public:
    explicit SessionCache(size_t max_entries = 4096);

    std::optional<GuidanceResult> get(const std::string& key) const;
    void put(const std::string& key, const GuidanceResult& result);

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    size_t max_entries_;
    std::unordered_map<std::string, GuidanceResult> entries_;
    std::deque<std::string> order_;
};

// ============================================================================
// Bulk Guidance Orchestrator
// ============================================================================

/**
 * @brief Resolves many terms against one engine snapshot
 *
 * Duplicate terms are answered once and replayed from the session cache,
 * without spending the call budget. Fresh lookups run on a bounded pool of
 * worker threads sharing one ApiBudget. Use one orchestrator per
 * translation unit; the cache is not meant to be shared between
 * unrelated batches.
 */
class BulkGuidanceOrchestrator {
public:
    BulkGuidanceOrchestrator(
        std::shared_ptr<const DisambiguationEngine> engine,
        size_t concurrency = 4,
        size_t cache_size = 4096
    );

    /**
     * @brief Resolve all terms
     *
     * @param max_api_calls  Ceiling on embedding lookups for this call
     * @param min_confidence Cut for the high_confidence view
     * @throws EmbeddingSpaceMismatch from any worker
     */
    BulkGuidanceReport bulk_guidance(
        const std::vector<std::string>& terms,
        const std::string& genre,
        size_t max_api_calls,
        double min_confidence,
        const std::string& context = ""
    );

    size_t cache_size() const { return cache_.size(); }
    void clear_cache() { cache_.clear(); }

    const DisambiguationEngine& engine() const { return *engine_; }

private:
    std::shared_ptr<const DisambiguationEngine> engine_;
    size_t concurrency_;
    SessionCache cache_;

    // Term, genre and context all shape the result
    static std::string cache_key(
        const std::string& term,
        const std::string& genre,
        const std::string& context
    );

    std::vector<GuidanceResult> run_workers(
        const std::vector<std::string>& terms,
        const QueryOptions& options,
        ApiBudget& budget
    ) const;
};

} // namespace tg
