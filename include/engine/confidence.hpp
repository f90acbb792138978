#pragma once

#include <string>

namespace tg {

/**
 * @brief Whether a result may be auto-injected, only reviewed, or dropped
 */
enum class ConfidenceTier {
    Inject,
    Log,
    Ignore
};

/**
 * @brief Which lookup produced a result
 */
enum class LookupPath {
    Direct,
    Vector,
    Aggregated,
    None
};

std::string to_string(ConfidenceTier tier);
std::string to_string(LookupPath path);

/**
 * @brief Score gates, each inclusive on its lower bound
 */
struct ConfidenceThresholds {
    double inject = 0.80;
    double log = 0.65;

    /**
     * @brief Both in [0,1] and log <= inject
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Map a final score onto a tier
 */
ConfidenceTier classify(double final_score, const ConfidenceThresholds& thresholds);

} // namespace tg
