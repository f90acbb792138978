#include "engine/guidance_store.hpp"
#include "core/errors.hpp"
#include <atomic>
#include <iostream>

using json = nlohmann::json;

namespace tg {

// ==========================================
// GuidanceStats / ValidationReport
// ==========================================

json GuidanceStats::to_json() const {
    return {
        {"collection_count", collection_count},
        {"categories", categories},
        {"thresholds", {
            {"inject", thresholds.inject},
            {"log", thresholds.log},
            {"neg_anchor_threshold", negative_anchor.threshold},
            {"neg_anchor_penalty", negative_anchor.penalty}
        }},
        {"embedding_model_id", embedding_model_id},
        {"index", index.to_json()}
    };
}

json ValidationReport::to_json() const {
    return {
        {"passed", passed},
        {"failed", failed},
        {"failures", failures}
    };
}

// ==========================================
// GuidanceStore
// ==========================================

GuidanceStore::GuidanceStore(
    EngineConfig config,
    std::shared_ptr<Embedder> embedder,
    VectorIndexFactory collection_factory
)
    : config_(std::move(config)),
      embedder_(std::move(embedder)),
      collection_factory_(std::move(collection_factory)),
      uncertain_log_(std::make_shared<UncertainMatchLog>()) {
    config_.validate_or_throw();

    if (!embedder_) {
        throw std::invalid_argument("GuidanceStore requires an embedder");
    }
    if (!collection_factory_) {
        collection_factory_ = []() { return std::make_shared<InMemoryVectorIndex>(); };
    }

    auto empty = std::make_shared<GuidanceIndex>();
    empty->collection = collection_factory_();
    publish(empty);
}

const LoadReport& GuidanceStore::load_corpus(const std::string& path) {
    CorpusLoader loader(config_.verbose);
    Corpus corpus = loader.load_file(path);

    std::lock_guard<std::mutex> lock(build_mutex_);
    corpus_ = std::move(corpus);
    return corpus_->report;
}

void GuidanceStore::set_corpus(Corpus corpus) {
    std::lock_guard<std::mutex> lock(build_mutex_);
    corpus_ = std::move(corpus);
}

bool GuidanceStore::has_corpus() const {
    std::lock_guard<std::mutex> lock(build_mutex_);
    return corpus_.has_value();
}

IndexStats GuidanceStore::build_index(bool force_rebuild) {
    std::lock_guard<std::mutex> lock(build_mutex_);

    auto current = engine();
    if (!force_rebuild && !current->index().empty()) {
        if (config_.verbose) {
            std::cout << "[store] Index already built (" << current->index().stats.total_indexed
                      << " patterns), skipping\n";
        }
        return current->index().stats;
    }

    if (!corpus_) {
        throw CorpusError("no corpus loaded");
    }

    // Build into a fresh collection; readers keep the old one meanwhile
    IndexBuilder builder(*embedder_, config_.upsert_batch_size, config_.verbose);
    if (progress_callback_) {
        builder.set_progress_callback(progress_callback_);
    }
    std::shared_ptr<GuidanceIndex> index = builder.build(*corpus_, collection_factory_());

    publish(index);
    return index->stats;
}

GuidanceStats GuidanceStore::get_stats() const {
    auto current = engine();
    const GuidanceIndex& index = current->index();

    GuidanceStats stats;
    stats.collection_count = index.collection ? index.collection->count() : 0;
    stats.categories = index.categories.names();
    stats.thresholds = config_.thresholds;
    stats.negative_anchor = config_.negative_anchor;
    stats.embedding_model_id = index.embedding_model_id();
    stats.index = index.stats;
    return stats;
}

void GuidanceStore::clear() {
    std::lock_guard<std::mutex> lock(build_mutex_);

    auto empty = std::make_shared<GuidanceIndex>();
    empty->collection = collection_factory_();
    publish(empty);
    uncertain_log_->clear();
}

void GuidanceStore::save_index(const std::string& path) const {
    engine()->index().save_to_json(path);
}

void GuidanceStore::load_index(const std::string& path) {
    std::lock_guard<std::mutex> lock(build_mutex_);

    std::shared_ptr<GuidanceIndex> index = GuidanceIndex::load_from_json(path, collection_factory_());

    std::string index_model = index->embedding_model_id();
    if (!index_model.empty() && index_model != embedder_->model_id()) {
        throw EmbeddingSpaceMismatch(index_model, embedder_->model_id());
    }

    if (config_.verbose) {
        std::cout << "[store] Loaded index from " << path << " ("
                  << index->collection->count() << " vectors, model " << index_model << ")\n";
    }
    publish(index);
}

void GuidanceStore::set_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(build_mutex_);
    progress_callback_ = std::move(callback);
}

GuidanceResult GuidanceStore::query_one(
    const std::string& term,
    const std::string& context,
    const std::string& genre
) const {
    QueryOptions options;
    options.context = context;
    options.genre = genre;
    return engine()->query_one(term, options);
}

BulkGuidanceReport GuidanceStore::query_bulk(
    const std::vector<std::string>& terms,
    const std::string& genre,
    size_t max_api_calls,
    double min_confidence
) const {
    auto session = create_session();
    return session->bulk_guidance(terms, genre, max_api_calls, min_confidence);
}

BulkGuidanceReport GuidanceStore::query_bulk(
    const std::vector<std::string>& terms,
    const std::string& genre
) const {
    return query_bulk(terms, genre, config_.max_api_calls, config_.min_confidence);
}

std::unique_ptr<BulkGuidanceOrchestrator> GuidanceStore::create_session() const {
    return std::make_unique<BulkGuidanceOrchestrator>(
        engine(), config_.bulk_concurrency, config_.session_cache_size);
}

std::string GuidanceStore::format_for_prompt(
    const std::vector<GuidanceResult>& results,
    bool include_suggestions
) const {
    return formatter_.format(results, include_suggestions);
}

ValidationReport GuidanceStore::validate_index(const std::vector<ValidationCase>& cases) const {
    ValidationReport report;
    auto current = engine();

    for (const auto& test_case : cases) {
        QueryOptions options;
        options.context = test_case.context;
        options.genre = test_case.genre;
        GuidanceResult result = current->query_one(test_case.term, options);

        bool ok = result.matched_pattern &&
                  result.matched_pattern->primary_rendering.find(test_case.expected_rendering) != std::string::npos;
        if (ok) {
            report.passed++;
        } else {
            report.failed++;
            std::string got = result.matched_pattern ? result.matched_pattern->primary_rendering : "<none>";
            report.failures.push_back(test_case.term + ": expected '" + test_case.expected_rendering +
                                      "', got '" + got + "' (" + to_string(result.confidence_tier) + ")");
        }
    }
    return report;
}

std::shared_ptr<const DisambiguationEngine> GuidanceStore::engine() const {
    return std::atomic_load(&engine_);
}

void GuidanceStore::publish(std::shared_ptr<const GuidanceIndex> index) {
    std::shared_ptr<const DisambiguationEngine> next = std::make_shared<DisambiguationEngine>(
        std::move(index), embedder_, config_, uncertain_log_);
    std::atomic_store(&engine_, std::move(next));
}

} // namespace tg
