#pragma once

#include "config/engine_config.hpp"
#include "embedding/embedder.hpp"
#include "engine/confidence.hpp"
#include "engine/genre_routing.hpp"
#include "engine/guidance_result.hpp"
#include "index/guidance_index.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

// ============================================================================
// Query Inputs
// ============================================================================

struct QueryOptions {
    std::string context;            ///< Surrounding text, folded into the query embedding
    std::string genre;              ///< Ranking bias via genre routing
    std::string category_filter;    ///< Hard restriction to one category, empty = all
};

/**
 * @brief Shared ceiling on embedding lookups, safe across worker threads
 */
class ApiBudget {
public:
    explicit ApiBudget(size_t limit) : limit_(limit) {}

    /**
     * @brief Reserve one call; false once the limit is reached
     */
    bool try_acquire();

    size_t used() const { return used_.load(); }
    size_t limit() const { return limit_; }

private:
    const size_t limit_;
    std::atomic<size_t> used_{0};
};

/**
 * @brief One ranked vector hit resolved to its pattern
 */
struct VectorCandidate {
    const Pattern* pattern = nullptr;   ///< Points into the engine's index snapshot
    double similarity = 0.0;            ///< 1 - cosine distance, unbiased
    double rank_score = 0.0;            ///< similarity plus genre bias
};

// ============================================================================
// Uncertain Match Log
// ============================================================================

struct UncertainMatch {
    std::string query_term;
    std::string pattern_id;
    std::string matched_term;
    std::string rendering;
    std::string category;
    double raw_similarity = 0.0;
    double final_score = 0.0;
    std::string timestamp;

    nlohmann::json to_json() const;
};

/**
 * @brief LOG-tier matches kept for human review
 *
 * Bounded: once kMaxEntries is reached only the newest kTrimTo are kept.
 */
class UncertainMatchLog {
public:
    static constexpr size_t kMaxEntries = 1000;
    static constexpr size_t kTrimTo = 500;

    void record(UncertainMatch match);
    std::vector<UncertainMatch> entries() const;
    size_t size() const;
    void clear();

    void save_to_json(const std::string& path) const;

private:
    mutable std::mutex mutex_;
    std::vector<UncertainMatch> entries_;
};

// ============================================================================
// Disambiguation Engine
// ============================================================================

/**
 * @brief Answers one query against one immutable index snapshot
 *
 * Lookup order: exact match, then vector similarity with the negative-anchor
 * penalty, then (for multi-character terms) aggregation of exact sub-terms.
 * All query methods are const and safe to call from many threads.
 *
 * "No match" is never an exception. EmbeddingSpaceMismatch is thrown when
 * the embedder's model or vector size differs from the index's.
 */
class DisambiguationEngine {
public:
    DisambiguationEngine(
        std::shared_ptr<const GuidanceIndex> index,
        std::shared_ptr<Embedder> embedder,
        EngineConfig config,
        std::shared_ptr<UncertainMatchLog> uncertain_log = nullptr
    );

    /**
     * @brief Resolve a single term
     *
     * @param budget Optional shared call ceiling; when exhausted the term is
     *               reported as rate-limited with no match.
     */
    GuidanceResult query_one(
        const std::string& term,
        const QueryOptions& options = {},
        ApiBudget* budget = nullptr
    ) const;

    /**
     * @brief Embed text and return up to k ranked candidates
     *
     * Sorted by similarity, ties by higher corpus_frequency. Empty on
     * embedding failure or an empty index.
     */
    std::vector<VectorCandidate> query(
        const std::string& text,
        size_t k,
        const std::string& category_filter = ""
    ) const;

    /**
     * @brief Rank nearest patterns for an existing query embedding
     */
    std::vector<VectorCandidate> rank_candidates(
        const std::vector<float>& query_embedding,
        size_t k,
        const std::string& category_filter,
        const std::vector<CategoryId>& preferred
    ) const;

    /**
     * @brief Negative-anchor step penalty for a candidate category
     */
    double penalty(const std::vector<float>& query_embedding, CategoryId category) const;

    ConfidenceTier classify(double final_score) const;

    /**
     * @brief Compose a result from exact matches of consecutive sub-terms
     *
     * Greedy longest match over code points; every non-space code point must
     * be covered. The result is always LOG tier.
     */
    std::optional<GuidanceResult> aggregate(
        const std::string& term,
        const std::string& category_filter = ""
    ) const;

    /**
     * @brief Throw EmbeddingSpaceMismatch if the embedder's model differs
     * from the one the index was built with
     */
    void check_embedding_space() const;

    const GuidanceIndex& index() const { return *index_; }
    const EngineConfig& config() const { return config_; }
    const GenreRouting& routing() const { return routing_; }
    Embedder& embedder() const { return *embedder_; }
    const std::shared_ptr<UncertainMatchLog>& uncertain_log() const { return uncertain_log_; }

private:
    std::shared_ptr<const GuidanceIndex> index_;
    std::shared_ptr<Embedder> embedder_;
    EngineConfig config_;
    GenreRouting routing_;
    std::shared_ptr<UncertainMatchLog> uncertain_log_;

    const Pattern* direct_match(
        const std::string& term,
        const std::string& category_filter,
        const std::vector<CategoryId>& preferred
    ) const;

    /**
     * @brief Embed text; returns nullopt on provider failure
     */
    std::optional<std::vector<float>> embed_query(const std::string& text) const;

    void check_dimension(const std::vector<float>& embedding) const;

    void log_uncertain(const GuidanceResult& result) const;
};

} // namespace tg
