#include "engine/genre_routing.hpp"
#include "core/text_utils.hpp"

namespace tg {

namespace {
const std::vector<std::string> kNoCategories;
}

GenreRouting::GenreRouting(std::map<std::string, std::vector<std::string>> routes) {
    for (auto& [genre, categories] : routes) {
        set_route(genre, std::move(categories));
    }
}

void GenreRouting::set_route(const std::string& genre, std::vector<std::string> categories) {
    routes_[normalize_term(genre)] = std::move(categories);
}

const std::vector<std::string>& GenreRouting::preferred_categories(const std::string& genre) const {
    auto it = routes_.find(normalize_term(genre));
    return it != routes_.end() ? it->second : kNoCategories;
}

std::vector<CategoryId> GenreRouting::resolve(
    const std::string& genre,
    const CategoryRegistry& registry
) const {
    std::vector<CategoryId> ids;
    for (const auto& name : preferred_categories(genre)) {
        if (auto id = registry.find(name)) {
            ids.push_back(*id);
        }
    }
    return ids;
}

} // namespace tg
