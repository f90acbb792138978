#include "engine/disambiguation_engine.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>

namespace tg {

// ==========================================
// ApiBudget
// ==========================================

bool ApiBudget::try_acquire() {
    size_t current = used_.load();
    while (current < limit_) {
        if (used_.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

// ==========================================
// UncertainMatchLog
// ==========================================

nlohmann::json UncertainMatch::to_json() const {
    return {
        {"query_term", query_term},
        {"pattern_id", pattern_id},
        {"matched_term", matched_term},
        {"rendering", rendering},
        {"category", category},
        {"raw_similarity", raw_similarity},
        {"final_score", final_score},
        {"timestamp", timestamp}
    };
}

void UncertainMatchLog::record(UncertainMatch match) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(match));
    if (entries_.size() > kMaxEntries) {
        entries_.erase(entries_.begin(), entries_.end() - kTrimTo);
    }
}

std::vector<UncertainMatch> UncertainMatchLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t UncertainMatchLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void UncertainMatchLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void UncertainMatchLog::save_to_json(const std::string& path) const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& entry : entries()) {
        arr.push_back(entry.to_json());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write uncertain match log: " + path);
    }
    file << arr.dump(2);
}

// ==========================================
// DisambiguationEngine
// ==========================================

DisambiguationEngine::DisambiguationEngine(
    std::shared_ptr<const GuidanceIndex> index,
    std::shared_ptr<Embedder> embedder,
    EngineConfig config,
    std::shared_ptr<UncertainMatchLog> uncertain_log
)
    : index_(std::move(index)),
      embedder_(std::move(embedder)),
      config_(std::move(config)),
      routing_(config_.genre_routes),
      uncertain_log_(std::move(uncertain_log)) {
    if (!index_) {
        throw std::invalid_argument("DisambiguationEngine requires an index");
    }
    if (!embedder_) {
        throw std::invalid_argument("DisambiguationEngine requires an embedder");
    }
    if (!uncertain_log_) {
        uncertain_log_ = std::make_shared<UncertainMatchLog>();
    }
}

GuidanceResult DisambiguationEngine::query_one(
    const std::string& term,
    const QueryOptions& options,
    ApiBudget* budget
) const {
    GuidanceResult result;
    result.query_term = term;

    std::string normalized = normalize_term(term);
    if (normalized.empty()) {
        return result;
    }

    std::vector<CategoryId> preferred = routing_.resolve(options.genre, index_->categories);

    // 1. Exact match: never penalized or re-scored
    if (const Pattern* pattern = direct_match(normalized, options.category_filter, preferred)) {
        result.raw_similarity = 1.0;
        result.final_score = 1.0;
        result.confidence_tier = ConfidenceTier::Inject;
        result.matched_pattern = *pattern;
        result.lookup_path = LookupPath::Direct;
        return result;
    }

    // 2. Vector similarity, embedding the query once
    if (index_->collection && index_->collection->count() > 0) {
        check_embedding_space();

        if (budget && !budget->try_acquire()) {
            result.rate_limited = true;
            return result;
        }

        std::string text = options.context.empty()
            ? term
            : term + " " + options.context + " " + term;

        std::vector<VectorCandidate> candidates;
        auto embedding = embed_query(text);
        if (embedding) {
            check_dimension(*embedding);
            try {
                candidates = rank_candidates(*embedding, config_.top_k, options.category_filter, preferred);
            } catch (const EmbeddingSpaceMismatch&) {
                throw;
            } catch (const std::exception& e) {
                std::cerr << "[engine] Vector query failed for '" << term << "': " << e.what() << "\n";
                result.embedding_failed = true;
            }
        } else {
            result.embedding_failed = true;
        }

        if (!candidates.empty()) {
            const VectorCandidate& top = candidates.front();

            // 3. Penalty against the candidate's category, same embedding
            result.raw_similarity = std::clamp(top.similarity, 0.0, 1.0);
            result.negative_penalty = penalty(*embedding, top.pattern->category_id);
            result.final_score = std::max(0.0, result.raw_similarity - result.negative_penalty);

            // 4. Classify
            result.confidence_tier = classify(result.final_score);
            result.lookup_path = LookupPath::Vector;
            if (result.confidence_tier != ConfidenceTier::Ignore) {
                result.matched_pattern = *top.pattern;
                if (result.confidence_tier == ConfidenceTier::Log) {
                    log_uncertain(result);
                }
                return result;
            }
        }
    }

    // 5. Nothing above the IGNORE floor: try composing exact sub-terms
    if (config_.enable_aggregation && utf8_length(normalized) > 1) {
        if (auto aggregated = aggregate(term, options.category_filter)) {
            aggregated->embedding_failed = result.embedding_failed;
            return *aggregated;
        }
    }

    // 6. Nothing usable; a sub-floor vector hit keeps its scores for diagnostics
    return result;
}

std::vector<VectorCandidate> DisambiguationEngine::query(
    const std::string& text,
    size_t k,
    const std::string& category_filter
) const {
    if (!index_->collection || index_->collection->count() == 0) {
        return {};
    }
    check_embedding_space();

    auto embedding = embed_query(text);
    if (!embedding) {
        return {};
    }
    check_dimension(*embedding);

    try {
        return rank_candidates(*embedding, k, category_filter, {});
    } catch (const EmbeddingSpaceMismatch&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[engine] Vector query failed: " << e.what() << "\n";
        return {};
    }
}

std::vector<VectorCandidate> DisambiguationEngine::rank_candidates(
    const std::vector<float>& query_embedding,
    size_t k,
    const std::string& category_filter,
    const std::vector<CategoryId>& preferred
) const {
    std::vector<VectorCandidate> candidates;
    if (!index_->collection) {
        return candidates;
    }

    Metadata filter;
    if (!category_filter.empty()) {
        if (!index_->categories.find(category_filter)) {
            return candidates;
        }
        filter["category"] = category_filter;
    }

    // Over-fetch so genre bias and frequency ties can reorder past the cut
    size_t fetch = k > std::numeric_limits<size_t>::max() / 2 ? k : k * 2;
    auto matches = index_->collection->query(query_embedding, fetch, filter);
    for (const auto& match : matches) {
        const Pattern* pattern = index_->find_pattern(match.id);
        if (!pattern) continue;

        VectorCandidate candidate;
        candidate.pattern = pattern;
        candidate.similarity = 1.0 - match.distance;
        candidate.rank_score = candidate.similarity;
        if (std::find(preferred.begin(), preferred.end(), pattern->category_id) != preferred.end()) {
            candidate.rank_score += config_.genre_bias;
        }
        candidates.push_back(candidate);
    }

    std::sort(candidates.begin(), candidates.end(),
        [](const VectorCandidate& a, const VectorCandidate& b) {
            if (a.rank_score != b.rank_score) return a.rank_score > b.rank_score;
            if (a.pattern->corpus_frequency != b.pattern->corpus_frequency) {
                return a.pattern->corpus_frequency > b.pattern->corpus_frequency;
            }
            return a.pattern->id < b.pattern->id;
        });

    if (candidates.size() > k) {
        candidates.resize(k);
    }
    return candidates;
}

double DisambiguationEngine::penalty(
    const std::vector<float>& query_embedding,
    CategoryId category
) const {
    return index_->anchors.penalty(query_embedding, category, config_.negative_anchor);
}

ConfidenceTier DisambiguationEngine::classify(double final_score) const {
    return tg::classify(final_score, config_.thresholds);
}

std::optional<GuidanceResult> DisambiguationEngine::aggregate(
    const std::string& term,
    const std::string& category_filter
) const {
    std::vector<std::string> units = utf8_units(normalize_term(term));
    if (units.size() < 2) {
        return std::nullopt;
    }

    std::vector<const Pattern*> parts;
    size_t i = 0;
    while (i < units.size()) {
        if (units[i] == " ") {
            ++i;
            continue;
        }

        const Pattern* found = nullptr;
        size_t found_len = 0;
        for (size_t len = units.size() - i; len >= 1; --len) {
            std::vector<std::string> piece(units.begin() + i, units.begin() + i + len);
            if (const Pattern* p = direct_match(join(piece, ""), category_filter, {})) {
                found = p;
                found_len = len;
                break;
            }
        }

        if (!found) {
            return std::nullopt;
        }
        parts.push_back(found);
        i += found_len;
    }

    // A single piece would have been an exact match already
    if (parts.size() < 2) {
        return std::nullopt;
    }

    Pattern merged;
    merged.term = term;
    merged.id = "aggregated/" + normalize_term(term);
    merged.category = parts.front()->category;
    merged.category_id = parts.front()->category_id;

    std::vector<std::string> renderings;
    GuidanceResult result;
    for (const Pattern* part : parts) {
        renderings.push_back(part->primary_rendering);
        result.aggregated_terms.push_back(part->term);
        merged.discouraged_renderings.insert(
            part->discouraged_renderings.begin(), part->discouraged_renderings.end());
        if (part->category_id != merged.category_id) {
            merged.category = "aggregated";
        }
    }
    merged.primary_rendering = join(renderings, " ");

    result.query_term = term;
    result.raw_similarity = config_.thresholds.log;
    result.final_score = config_.thresholds.log;
    result.confidence_tier = ConfidenceTier::Log;
    result.matched_pattern = std::move(merged);
    result.lookup_path = LookupPath::Aggregated;

    log_uncertain(result);
    return result;
}

void DisambiguationEngine::check_embedding_space() const {
    std::string index_model = index_->embedding_model_id();
    std::string query_model = embedder_->model_id();
    if (!index_model.empty() && index_model != query_model) {
        throw EmbeddingSpaceMismatch(index_model, query_model);
    }
}

const Pattern* DisambiguationEngine::direct_match(
    const std::string& term,
    const std::string& category_filter,
    const std::vector<CategoryId>& preferred
) const {
    const auto& candidates = index_->direct.get_all(term);
    if (candidates.empty()) {
        return nullptr;
    }

    if (!category_filter.empty()) {
        for (const auto& candidate : candidates) {
            if (candidate.category == category_filter) {
                return &candidate;
            }
        }
        return nullptr;
    }

    for (CategoryId id : preferred) {
        for (const auto& candidate : candidates) {
            if (candidate.category_id == id) {
                return &candidate;
            }
        }
    }
    return &candidates.front();
}

std::optional<std::vector<float>> DisambiguationEngine::embed_query(const std::string& text) const {
    try {
        return embedder_->embed(text);
    } catch (const std::exception& e) {
        if (config_.verbose) {
            std::cerr << "[engine] Embedding failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}

void DisambiguationEngine::check_dimension(const std::vector<float>& embedding) const {
    size_t dimension = index_->dimension();
    if (dimension != 0 && embedding.size() != dimension) {
        throw EmbeddingSpaceMismatch(
            index_->embedding_model_id() + " (dim " + std::to_string(dimension) + ")",
            embedder_->model_id() + " (dim " + std::to_string(embedding.size()) + ")");
    }
}

void DisambiguationEngine::log_uncertain(const GuidanceResult& result) const {
    if (!result.matched_pattern) return;

    UncertainMatch match;
    match.query_term = result.query_term;
    match.pattern_id = result.matched_pattern->id;
    match.matched_term = result.matched_pattern->term;
    match.rendering = result.matched_pattern->primary_rendering;
    match.category = result.matched_pattern->category;
    match.raw_similarity = result.raw_similarity;
    match.final_score = result.final_score;
    match.timestamp = utc_timestamp();
    uncertain_log_->record(std::move(match));
}

} // namespace tg
