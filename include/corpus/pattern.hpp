#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/// Stable integer handle for a category, resolved once at load time
using CategoryId = std::uint32_t;

/**
 * @brief Registry mapping category names to dense integer handles
 *
 * Names are only used at the corpus/API boundary; all hot-path
 * comparisons use CategoryId.
 */
class CategoryRegistry {
public:
    /**
     * @brief Return the handle for name, registering it if new
     */
    CategoryId intern(const std::string& name);

    /**
     * @brief Look up an existing handle
     */
    std::optional<CategoryId> find(const std::string& name) const;

    /**
     * @brief Name for a handle (throws std::out_of_range for unknown ids)
     */
    const std::string& name(CategoryId id) const;

    size_t size() const { return names_.size(); }
    bool empty() const { return names_.empty(); }
    const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, CategoryId> ids_;
};

/**
 * @brief One source-term-to-rendering disambiguation record
 */
struct Pattern {
    std::string id;                                  ///< Stable pattern id (vector index key)
    std::string term;                                ///< Source-language surface form
    std::string category;                            ///< Logical grouping name
    CategoryId category_id = 0;                      ///< Resolved category handle
    std::string primary_rendering;                   ///< Best target-language equivalent
    std::vector<std::string> alternate_renderings;   ///< Other acceptable equivalents, ordered
    std::set<std::string> discouraged_renderings;    ///< Known-wrong renderings to avoid
    std::set<std::string> context_tags;              ///< Genre / register hints
    std::uint64_t corpus_frequency = 0;              ///< Informational ranking only

    /**
     * @brief Deterministic composite text used to embed this pattern
     *
     * Format: "<term> - <primary_rendering> (<category with spaces>)"
     */
    std::string embedding_text() const;

    nlohmann::json to_json() const;
    static Pattern from_json(const nlohmann::json& j);
};

/**
 * @brief A confirmed false-positive example tied to one category
 */
struct NegativeAnchor {
    std::string category;
    CategoryId category_id = 0;
    std::string source_text;
    std::vector<float> embedding;                    ///< Filled at index build time
};

/**
 * @brief Build the stable id for a pattern that declares none
 */
std::string make_pattern_id(const std::string& category, const std::string& term);

} // namespace tg
