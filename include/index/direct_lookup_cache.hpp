#pragma once

#include "corpus/pattern.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace tg {

/**
 * @brief Exact-match table from normalized term to its patterns
 *
 * A term may appear in several categories; candidates are kept in load
 * order. Within one category the later pattern replaces the earlier one.
 */
class DirectLookupCache {
public:
    enum class InsertOutcome {
        Inserted,           ///< First pattern for this term
        AddedCategory,      ///< Term already known under another category
        Replaced            ///< Same term and category, earlier pattern dropped
    };

    InsertOutcome insert(const Pattern& pattern);

    /**
     * @brief First candidate for term (in load order), nullptr on miss
     */
    const Pattern* get(const std::string& term) const;

    /**
     * @brief All candidates for term, empty on miss
     */
    const std::vector<Pattern>& get_all(const std::string& term) const;

    bool contains(const std::string& term) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    /**
     * @brief Sorted list of normalized keys
     */
    std::vector<std::string> keys() const;

private:
    std::unordered_map<std::string, std::vector<Pattern>> entries_;
};

} // namespace tg
