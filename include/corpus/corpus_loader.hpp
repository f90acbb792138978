#pragma once

#include "corpus/pattern.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/**
 * @brief One skipped corpus entry
 */
struct LoadIssue {
    std::string category;    ///< Category the entry belongs to (may be empty)
    int entry_index = -1;    ///< Position within its list, -1 if not applicable
    std::string reason;      ///< Human-readable reason it was skipped
};

/**
 * @brief Summary of a corpus load
 */
struct LoadReport {
    size_t categories = 0;
    size_t patterns_loaded = 0;
    size_t anchors_loaded = 0;
    std::vector<LoadIssue> issues;

    nlohmann::json to_json() const;
};

/**
 * @brief Strongly-typed corpus contents produced by CorpusLoader
 */
struct Corpus {
    std::string version;
    CategoryRegistry categories;
    std::vector<Pattern> patterns;        ///< Load order preserved
    std::vector<NegativeAnchor> anchors;  ///< Embeddings still empty
    LoadReport report;
};

/**
 * @brief Parses the structured pattern corpus into Pattern / NegativeAnchor records
 *
 * Corpus layout:
 * {
 *   "version": "1.0",
 *   "pattern_categories": {
 *     "cultivation_realms": {
 *       "description": "...",
 *       "patterns": [
 *         {"term": "金丹期", "primary_rendering": "Kim Đan", ...}
 *       ],
 *       "negative_anchors": ["..."]
 *     }
 *   },
 *   "advanced_patterns": { ... same shape ... },
 *   "negative_anchors": [{"category": "...", "text": "..."}]
 * }
 *
 * Structural problems throw CorpusError. Individual entries that are
 * unusable (no term, empty rendering, wrong field types, anchors for an
 * unknown category) are skipped and recorded in the LoadReport.
 */
class CorpusLoader {
public:
    explicit CorpusLoader(bool verbose = false) : verbose_(verbose) {}

    /**
     * @brief Load corpus from a JSON file
     */
    Corpus load_file(const std::string& path) const;

    /**
     * @brief Load corpus from JSON text
     */
    Corpus load_string(const std::string& text) const;

    /**
     * @brief Load corpus from an already parsed document
     */
    Corpus load_json(const nlohmann::json& j) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    bool verbose_;

    void load_category(
        const std::string& name,
        const nlohmann::json& category_json,
        Corpus& corpus
    ) const;

    void record_issue(
        Corpus& corpus,
        const std::string& category,
        int index,
        const std::string& reason
    ) const;
};

} // namespace tg
