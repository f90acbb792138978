#pragma once

#include "corpus/corpus_loader.hpp"
#include "embedding/embedder.hpp"
#include "index/guidance_index.hpp"
#include <functional>
#include <memory>
#include <string>

namespace tg {

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

/**
 * @brief Embeds a loaded corpus into a fresh GuidanceIndex
 *
 * Patterns are embedded in fixed-size batches, one batch at a time. An
 * embedding failure aborts the build; the caller's previous snapshot is
 * left untouched.
 */
class IndexBuilder {
public:
    static constexpr size_t kDefaultBatchSize = 50;

    explicit IndexBuilder(Embedder& embedder, size_t batch_size = kDefaultBatchSize, bool verbose = false);

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }
    void set_verbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief Build a snapshot from corpus into collection
     *
     * collection is cleared first and tagged with the embedder's model id.
     * Within a category, the later of two patterns with the same term wins;
     * the same holds for two patterns with the same id.
     */
    std::shared_ptr<GuidanceIndex> build(
        const Corpus& corpus,
        std::shared_ptr<VectorIndex> collection
    );

private:
    Embedder& embedder_;
    size_t batch_size_;
    bool verbose_;
    ProgressCallback progress_callback_;

    std::vector<Pattern> resolve_patterns(const std::vector<Pattern>& patterns, IndexStats& stats) const;

    std::vector<std::vector<float>> embed_all(
        const std::vector<std::string>& texts,
        const std::string& stage
    );

    void report_progress(const std::string& stage, int current, int total, const std::string& message);
};

} // namespace tg
