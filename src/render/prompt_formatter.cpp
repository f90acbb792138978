#include "render/prompt_formatter.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>

namespace tg {

PromptInjectionFormatter::PromptInjectionFormatter(std::string title)
    : title_(std::move(title)) {}

std::string PromptInjectionFormatter::format(
    const std::vector<GuidanceResult>& results,
    bool include_suggestions
) const {
    std::vector<const GuidanceResult*> eligible;
    for (const auto& result : results) {
        if (!result.matched_pattern) continue;
        if (result.confidence_tier == ConfidenceTier::Ignore) continue;
        if (result.confidence_tier == ConfidenceTier::Log && !include_suggestions) continue;
        eligible.push_back(&result);
    }

    std::stable_sort(eligible.begin(), eligible.end(),
        [](const GuidanceResult* a, const GuidanceResult* b) {
            if (a->final_score != b->final_score) return a->final_score > b->final_score;
            return a->query_term < b->query_term;
        });

    // Highest-scoring result per term
    std::vector<const GuidanceResult*> selected;
    std::set<std::string> seen;
    for (const GuidanceResult* result : eligible) {
        if (seen.insert(normalize_term(result->query_term)).second) {
            selected.push_back(result);
        }
    }

    if (selected.empty()) {
        return "";
    }

    std::ostringstream out;
    out << "## " << title_ << "\n";

    bool in_required = false;
    bool in_suggestions = false;
    for (const GuidanceResult* result : selected) {
        if (result->confidence_tier == ConfidenceTier::Inject && !in_required) {
            out << "### Required terminology\n";
            in_required = true;
        } else if (result->confidence_tier == ConfidenceTier::Log && !in_suggestions) {
            out << "### Suggestions (verify in context)\n";
            in_suggestions = true;
        }
        out << format_line(*result) << "\n";
    }

    return out.str();
}

std::string PromptInjectionFormatter::format_line(const GuidanceResult& result) {
    std::ostringstream line;
    if (!result.matched_pattern) {
        return line.str();
    }
    const Pattern& pattern = *result.matched_pattern;

    if (result.confidence_tier == ConfidenceTier::Inject) {
        line << "- **" << result.query_term << "** → `" << pattern.primary_rendering << "`";
    } else {
        line << "- " << result.query_term << " → `" << pattern.primary_rendering << "`";
    }

    if (!pattern.discouraged_renderings.empty()) {
        std::vector<std::string> avoid(pattern.discouraged_renderings.begin(),
                                       pattern.discouraged_renderings.end());
        line << " (NOT: " << join(avoid, ", ") << ")";
    }

    if (result.confidence_tier != ConfidenceTier::Inject) {
        line << " (" << std::fixed << std::setprecision(2) << result.final_score << ")";
    }
    return line.str();
}

} // namespace tg
