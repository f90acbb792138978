#pragma once

#include "config/engine_config.hpp"
#include "corpus/corpus_loader.hpp"
#include "embedding/embedder.hpp"
#include "engine/disambiguation_engine.hpp"
#include "index/index_builder.hpp"
#include "index/vector_index.hpp"
#include "pipeline/bulk_guidance.hpp"
#include "render/prompt_formatter.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/// Creates an empty collection for a new index build
using VectorIndexFactory = std::function<std::shared_ptr<VectorIndex>()>;

/**
 * @brief Administrative view of the live index
 */
struct GuidanceStats {
    size_t collection_count = 0;
    std::vector<std::string> categories;
    ConfidenceThresholds thresholds;
    NegativeAnchorPolicy negative_anchor;
    std::string embedding_model_id;
    IndexStats index;

    nlohmann::json to_json() const;
};

/**
 * @brief One expected outcome for validate_index()
 */
struct ValidationCase {
    std::string term;
    std::string expected_rendering;    ///< Must appear in the primary rendering
    std::string context;
    std::string genre;
};

struct ValidationReport {
    size_t passed = 0;
    size_t failed = 0;
    std::vector<std::string> failures;

    nlohmann::json to_json() const;
};

/**
 * @brief Caller-facing guidance API over an atomically replaceable index
 *
 * Readers take a reference-counted engine snapshot; build_index() and
 * load_index() construct a complete new snapshot off to the side and
 * publish it in one atomic store. In-flight queries keep using the old
 * snapshot until they finish.
 */
class GuidanceStore {
public:
    GuidanceStore(
        EngineConfig config,
        std::shared_ptr<Embedder> embedder,
        VectorIndexFactory collection_factory = nullptr
    );

    // ---- Corpus ----

    /**
     * @brief Load the corpus used by the next build
     * @throws CorpusError
     */
    const LoadReport& load_corpus(const std::string& path);
    void set_corpus(Corpus corpus);
    bool has_corpus() const;

    // ---- Administrative ----

    /**
     * @brief Build and publish a new index from the loaded corpus
     *
     * With force_rebuild false and a non-empty live index this is a no-op
     * returning the live index's stats.
     */
    IndexStats build_index(bool force_rebuild = false);

    GuidanceStats get_stats() const;

    /**
     * @brief Publish an empty index
     */
    void clear();

    void save_index(const std::string& path) const;

    /**
     * @brief Replace the live index with a saved snapshot
     * @throws EmbeddingSpaceMismatch if the snapshot's model differs from the embedder's
     */
    void load_index(const std::string& path);

    void set_progress_callback(ProgressCallback callback);

    // ---- Queries ----

    GuidanceResult query_one(
        const std::string& term,
        const std::string& context = "",
        const std::string& genre = ""
    ) const;

    /**
     * @brief Resolve many terms with a fresh session cache
     */
    BulkGuidanceReport query_bulk(
        const std::vector<std::string>& terms,
        const std::string& genre,
        size_t max_api_calls,
        double min_confidence
    ) const;

    BulkGuidanceReport query_bulk(const std::vector<std::string>& terms, const std::string& genre = "") const;

    /**
     * @brief Orchestrator bound to the current snapshot, for callers that
     * keep one session cache across several batches
     */
    std::unique_ptr<BulkGuidanceOrchestrator> create_session() const;

    std::string format_for_prompt(const std::vector<GuidanceResult>& results, bool include_suggestions) const;

    /**
     * @brief Run expected-rendering checks against the live index
     */
    ValidationReport validate_index(const std::vector<ValidationCase>& cases) const;

    // ---- Accessors ----

    std::shared_ptr<const DisambiguationEngine> engine() const;
    const EngineConfig& config() const { return config_; }
    const std::shared_ptr<UncertainMatchLog>& uncertain_log() const { return uncertain_log_; }

private:
    EngineConfig config_;
    std::shared_ptr<Embedder> embedder_;
    VectorIndexFactory collection_factory_;
    std::shared_ptr<UncertainMatchLog> uncertain_log_;
    PromptInjectionFormatter formatter_;
    ProgressCallback progress_callback_;

    std::optional<Corpus> corpus_;
    mutable std::mutex build_mutex_;                  ///< Serializes writers
    std::shared_ptr<const DisambiguationEngine> engine_;   ///< Accessed with atomic_load/atomic_store

    void publish(std::shared_ptr<const GuidanceIndex> index);
};

} // namespace tg
