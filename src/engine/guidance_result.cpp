#include "engine/guidance_result.hpp"

namespace tg {

nlohmann::json GuidanceResult::to_json() const {
    nlohmann::json j;
    j["query_term"] = query_term;
    j["raw_similarity"] = raw_similarity;
    j["negative_penalty"] = negative_penalty;
    j["final_score"] = final_score;
    j["confidence_tier"] = to_string(confidence_tier);
    j["lookup_path"] = to_string(lookup_path);
    j["matched_pattern"] = matched_pattern ? matched_pattern->to_json() : nlohmann::json(nullptr);
    if (rate_limited) j["rate_limited"] = true;
    if (embedding_failed) j["embedding_failed"] = true;
    if (!aggregated_terms.empty()) j["aggregated_terms"] = aggregated_terms;
    return j;
}

} // namespace tg
