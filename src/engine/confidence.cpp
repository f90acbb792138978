#include "engine/confidence.hpp"

namespace tg {

std::string to_string(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::Inject: return "INJECT";
        case ConfidenceTier::Log:    return "LOG";
        case ConfidenceTier::Ignore: return "IGNORE";
    }
    return "IGNORE";
}

std::string to_string(LookupPath path) {
    switch (path) {
        case LookupPath::Direct:     return "DIRECT";
        case LookupPath::Vector:     return "VECTOR";
        case LookupPath::Aggregated: return "AGGREGATED";
        case LookupPath::None:       return "NONE";
    }
    return "NONE";
}

bool ConfidenceThresholds::validate(std::string& error_message) const {
    if (inject < 0.0 || inject > 1.0) {
        error_message = "threshold_inject must be between 0.0 and 1.0";
        return false;
    }
    if (log < 0.0 || log > 1.0) {
        error_message = "threshold_log must be between 0.0 and 1.0";
        return false;
    }
    if (log > inject) {
        error_message = "threshold_log must not exceed threshold_inject";
        return false;
    }
    return true;
}

ConfidenceTier classify(double final_score, const ConfidenceThresholds& thresholds) {
    if (final_score >= thresholds.inject) {
        return ConfidenceTier::Inject;
    }
    if (final_score >= thresholds.log) {
        return ConfidenceTier::Log;
    }
    return ConfidenceTier::Ignore;
}

} // namespace tg
