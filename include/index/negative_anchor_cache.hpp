#pragma once

#include "corpus/pattern.hpp"
#include <unordered_map>
#include <vector>

namespace tg {

/**
 * @brief Step-penalty parameters for negative anchors
 */
struct NegativeAnchorPolicy {
    double threshold = 0.82;    ///< Max anchor similarity that triggers the penalty
    double penalty = 0.25;      ///< Fixed amount subtracted once triggered
};

/**
 * @brief Per-category embeddings of confirmed false positives
 */
class NegativeAnchorCache {
public:
    void add(CategoryId category, std::vector<float> embedding);

    /**
     * @brief Highest cosine similarity between query and any anchor of category
     *
     * Returns 0.0 if the category has no anchors.
     */
    double max_similarity(const std::vector<float>& query_embedding, CategoryId category) const;

    /**
     * @brief Penalty to subtract from a candidate of category
     *
     * policy.penalty when max_similarity >= policy.threshold, otherwise 0.
     */
    double penalty(
        const std::vector<float>& query_embedding,
        CategoryId category,
        const NegativeAnchorPolicy& policy
    ) const;

    size_t anchor_count(CategoryId category) const;
    size_t size() const;
    bool empty() const { return anchors_.empty(); }
    void clear() { anchors_.clear(); }

    const std::unordered_map<CategoryId, std::vector<std::vector<float>>>& entries() const {
        return anchors_;
    }

private:
    std::unordered_map<CategoryId, std::vector<std::vector<float>>> anchors_;
};

} // namespace tg
