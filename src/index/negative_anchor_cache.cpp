#include "index/negative_anchor_cache.hpp"
#include "core/text_utils.hpp"
#include <algorithm>

namespace tg {

void NegativeAnchorCache::add(CategoryId category, std::vector<float> embedding) {
    if (embedding.empty()) return;
    anchors_[category].push_back(std::move(embedding));
}

double NegativeAnchorCache::max_similarity(
    const std::vector<float>& query_embedding,
    CategoryId category
) const {
    auto it = anchors_.find(category);
    if (it == anchors_.end()) {
        return 0.0;
    }

    double best = 0.0;
    for (const auto& anchor : it->second) {
        best = std::max(best, cosine_similarity(query_embedding, anchor));
    }
    return best;
}

double NegativeAnchorCache::penalty(
    const std::vector<float>& query_embedding,
    CategoryId category,
    const NegativeAnchorPolicy& policy
) const {
    if (max_similarity(query_embedding, category) >= policy.threshold) {
        return policy.penalty;
    }
    return 0.0;
}

size_t NegativeAnchorCache::anchor_count(CategoryId category) const {
    auto it = anchors_.find(category);
    return it != anchors_.end() ? it->second.size() : 0;
}

size_t NegativeAnchorCache::size() const {
    size_t total = 0;
    for (const auto& [category, vectors] : anchors_) {
        total += vectors.size();
    }
    return total;
}

} // namespace tg
