#include "index/direct_lookup_cache.hpp"
#include "core/text_utils.hpp"
#include <algorithm>

namespace tg {

namespace {
const std::vector<Pattern> kNoPatterns;
}

DirectLookupCache::InsertOutcome DirectLookupCache::insert(const Pattern& pattern) {
    auto& candidates = entries_[normalize_term(pattern.term)];

    for (auto& existing : candidates) {
        if (existing.category_id == pattern.category_id) {
            existing = pattern;
            return InsertOutcome::Replaced;
        }
    }

    candidates.push_back(pattern);
    return candidates.size() == 1 ? InsertOutcome::Inserted : InsertOutcome::AddedCategory;
}

const Pattern* DirectLookupCache::get(const std::string& term) const {
    auto it = entries_.find(normalize_term(term));
    if (it == entries_.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second.front();
}

const std::vector<Pattern>& DirectLookupCache::get_all(const std::string& term) const {
    auto it = entries_.find(normalize_term(term));
    return it != entries_.end() ? it->second : kNoPatterns;
}

bool DirectLookupCache::contains(const std::string& term) const {
    return entries_.count(normalize_term(term)) > 0;
}

std::vector<std::string> DirectLookupCache::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, candidates] : entries_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace tg
