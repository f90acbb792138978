#pragma once

#include "engine/guidance_result.hpp"
#include <string>
#include <vector>

namespace tg {

/**
 * @brief Renders guidance results as a compact block for a generation prompt
 *
 * Output (empty string when nothing qualifies):
 *
 *   ## Terminology Guidance
 *   ### Required terminology
 *   - **金丹期** → `Kim Đan` (NOT: kim đan kỳ)
 *   ### Suggestions (verify in context)
 *   - 修真界 → `Tu Chân Giới` (0.72)
 *
 * Lines are ordered by descending final_score, then by term. IGNORE results
 * are never shown; LOG results only when suggestions are requested. A term
 * repeated in the input appears once.
 */
class PromptInjectionFormatter {
public:
    explicit PromptInjectionFormatter(std::string title = "Terminology Guidance");

    std::string format(const std::vector<GuidanceResult>& results, bool include_suggestions) const;

    /**
     * @brief One bullet line for a result
     */
    static std::string format_line(const GuidanceResult& result);

private:
    std::string title_;
};

} // namespace tg
