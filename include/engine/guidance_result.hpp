#pragma once

#include "corpus/pattern.hpp"
#include "engine/confidence.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief Outcome of one guidance query
 *
 * Owned by the caller; carries a copy of the matched pattern, never a
 * pointer into the index.
 */
struct GuidanceResult {
    std::string query_term;
    double raw_similarity = 0.0;       ///< Cosine similarity, 1.0 for direct hits
    double negative_penalty = 0.0;     ///< Subtracted from raw_similarity
    double final_score = 0.0;          ///< max(0, raw_similarity - negative_penalty)
    ConfidenceTier confidence_tier = ConfidenceTier::Ignore;
    std::optional<Pattern> matched_pattern;   ///< Empty when nothing clears the IGNORE floor
    LookupPath lookup_path = LookupPath::None;

    bool rate_limited = false;         ///< Skipped because the call budget ran out
    bool embedding_failed = false;     ///< Embedding or vector query failed, degraded to a miss
    std::vector<std::string> aggregated_terms;   ///< Sub-terms used by an AGGREGATED result

    bool found() const { return matched_pattern.has_value(); }

    nlohmann::json to_json() const;
};

} // namespace tg
