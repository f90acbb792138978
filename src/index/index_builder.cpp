#include "index/index_builder.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <chrono>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace tg {

IndexBuilder::IndexBuilder(Embedder& embedder, size_t batch_size, bool verbose)
    : embedder_(embedder),
      batch_size_(batch_size == 0 ? kDefaultBatchSize : batch_size),
      verbose_(verbose) {}

std::shared_ptr<GuidanceIndex> IndexBuilder::build(
    const Corpus& corpus,
    std::shared_ptr<VectorIndex> collection
) {
    auto start_time = std::chrono::high_resolution_clock::now();

    auto index = std::make_shared<GuidanceIndex>();
    index->categories = corpus.categories;
    index->collection = std::move(collection);
    index->collection->clear();
    index->collection->set_embedding_model_id(embedder_.model_id());

    IndexStats& stats = index->stats;
    stats.embedding_model_id = embedder_.model_id();
    for (const auto& issue : corpus.report.issues) {
        if (issue.reason.find("anchor") != std::string::npos) {
            stats.anchors_skipped++;
        }
    }

    // Stage 1: resolve duplicate keys and fill the exact-match table
    index->patterns = resolve_patterns(corpus.patterns, stats);
    for (size_t i = 0; i < index->patterns.size(); ++i) {
        const Pattern& pattern = index->patterns[i];
        index->pattern_by_id[pattern.id] = i;
        index->direct.insert(pattern);
        stats.patterns_per_category[pattern.category]++;
    }

    if (verbose_) {
        std::cout << "[index] Embedding " << index->patterns.size() << " patterns with "
                  << embedder_.model_id() << " (batch " << batch_size_ << ")\n";
    }

    // Stage 2: embed patterns and populate the collection
    std::vector<std::string> texts;
    texts.reserve(index->patterns.size());
    for (const auto& pattern : index->patterns) {
        texts.push_back(pattern.embedding_text());
    }

    auto vectors = embed_all(texts, "embed_patterns");
    for (size_t i = 0; i < index->patterns.size(); ++i) {
        const Pattern& pattern = index->patterns[i];
        index->collection->upsert(
            pattern.id,
            vectors[i],
            {
                {"category", pattern.category},
                {"term", pattern.term},
                {"primary_rendering", pattern.primary_rendering}
            },
            texts[i]
        );
    }
    stats.total_indexed = index->collection->count();
    stats.dimension = index->collection->dimension();

    // Stage 3: embed negative anchors
    if (!corpus.anchors.empty()) {
        std::vector<std::string> anchor_texts;
        anchor_texts.reserve(corpus.anchors.size());
        for (const auto& anchor : corpus.anchors) {
            anchor_texts.push_back(anchor.source_text);
        }

        auto anchor_vectors = embed_all(anchor_texts, "embed_anchors");
        for (size_t i = 0; i < corpus.anchors.size(); ++i) {
            if (stats.dimension != 0 && anchor_vectors[i].size() != stats.dimension) {
                throw EmbeddingSpaceMismatch(
                    stats.embedding_model_id + " (dim " + std::to_string(stats.dimension) + ")",
                    "anchor vector of dim " + std::to_string(anchor_vectors[i].size()));
            }
            const NegativeAnchor& anchor = corpus.anchors[i];
            index->anchors.add(anchor.category_id, std::move(anchor_vectors[i]));
            stats.anchors_per_category[anchor.category]++;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    stats.build_time_seconds = std::chrono::duration<double>(end_time - start_time).count();
    stats.created_utc = utc_timestamp();

    if (verbose_) {
        std::cout << "[index] Indexed " << stats.total_indexed << " patterns and "
                  << index->anchors.size() << " negative anchors in "
                  << stats.build_time_seconds << "s\n";
    }

    return index;
}

std::vector<Pattern> IndexBuilder::resolve_patterns(
    const std::vector<Pattern>& patterns,
    IndexStats& stats
) const {
    std::vector<Pattern> slots;
    std::vector<bool> alive;
    std::map<std::pair<CategoryId, std::string>, size_t> by_key;
    std::map<std::string, size_t> by_id;

    auto key_of = [](const Pattern& p) {
        return std::make_pair(p.category_id, normalize_term(p.term));
    };

    for (const auto& pattern : patterns) {
        auto key = key_of(pattern);

        std::set<size_t> replaced;
        auto key_it = by_key.find(key);
        if (key_it != by_key.end()) replaced.insert(key_it->second);
        auto id_it = by_id.find(pattern.id);
        if (id_it != by_id.end()) replaced.insert(id_it->second);

        // Later pattern wins
        for (size_t slot : replaced) {
            const Pattern& previous = slots[slot];
            if (verbose_) {
                std::cerr << "[index] Collision in " << pattern.category << ": '" << pattern.term
                          << "' (" << pattern.id << ") replaces '" << previous.term
                          << "' (" << previous.id << ")\n";
            }
            by_key.erase(key_of(previous));
            by_id.erase(previous.id);
            alive[slot] = false;
            stats.collisions++;
        }

        by_key[key] = slots.size();
        by_id[pattern.id] = slots.size();
        slots.push_back(pattern);
        alive.push_back(true);
    }

    std::vector<Pattern> resolved;
    resolved.reserve(by_id.size());
    for (size_t i = 0; i < slots.size(); ++i) {
        if (alive[i]) {
            resolved.push_back(std::move(slots[i]));
        }
    }
    return resolved;
}

std::vector<std::vector<float>> IndexBuilder::embed_all(
    const std::vector<std::string>& texts,
    const std::string& stage
) {
    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());

    for (size_t begin = 0; begin < texts.size(); begin += batch_size_) {
        size_t end = std::min(begin + batch_size_, texts.size());
        std::vector<std::string> batch(texts.begin() + begin, texts.begin() + end);

        auto batch_vectors = embedder_.embed_batch(batch);
        if (batch_vectors.size() != batch.size()) {
            throw EmbeddingError("expected " + std::to_string(batch.size()) +
                                 " vectors, got " + std::to_string(batch_vectors.size()));
        }
        for (auto& vec : batch_vectors) {
            vectors.push_back(std::move(vec));
        }

        report_progress(stage, static_cast<int>(end), static_cast<int>(texts.size()),
                        std::to_string(end) + "/" + std::to_string(texts.size()) + " embedded");
    }

    return vectors;
}

void IndexBuilder::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
}

} // namespace tg
