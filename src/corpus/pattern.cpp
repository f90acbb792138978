#include "corpus/pattern.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace tg {

// ==========================================
// CategoryRegistry
// ==========================================

CategoryId CategoryRegistry::intern(const std::string& name) {
    auto it = ids_.find(name);
    if (it != ids_.end()) {
        return it->second;
    }
    CategoryId id = static_cast<CategoryId>(names_.size());
    names_.push_back(name);
    ids_.emplace(name, id);
    return id;
}

std::optional<CategoryId> CategoryRegistry::find(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& CategoryRegistry::name(CategoryId id) const {
    if (id >= names_.size()) {
        throw std::out_of_range("Unknown category id: " + std::to_string(id));
    }
    return names_[id];
}

// ==========================================
// Pattern
// ==========================================

std::string Pattern::embedding_text() const {
    std::string readable_category = category;
    std::replace(readable_category.begin(), readable_category.end(), '_', ' ');
    return term + " - " + primary_rendering + " (" + readable_category + ")";
}

nlohmann::json Pattern::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["term"] = term;
    j["category"] = category;
    j["primary_rendering"] = primary_rendering;
    j["alternate_renderings"] = alternate_renderings;
    j["discouraged_renderings"] = discouraged_renderings;
    j["context_tags"] = context_tags;
    j["corpus_frequency"] = corpus_frequency;
    return j;
}

Pattern Pattern::from_json(const nlohmann::json& j) {
    Pattern p;
    p.id = j.at("id").get<std::string>();
    p.term = j.at("term").get<std::string>();
    p.category = j.at("category").get<std::string>();
    p.primary_rendering = j.at("primary_rendering").get<std::string>();
    if (j.contains("alternate_renderings")) {
        p.alternate_renderings = j["alternate_renderings"].get<std::vector<std::string>>();
    }
    if (j.contains("discouraged_renderings")) {
        p.discouraged_renderings = j["discouraged_renderings"].get<std::set<std::string>>();
    }
    if (j.contains("context_tags")) {
        p.context_tags = j["context_tags"].get<std::set<std::string>>();
    }
    p.corpus_frequency = j.value("corpus_frequency", std::uint64_t{0});
    return p;
}

std::string make_pattern_id(const std::string& category, const std::string& term) {
    return category + "/" + normalize_term(term);
}

} // namespace tg
