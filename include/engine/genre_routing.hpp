#pragma once

#include "corpus/pattern.hpp"
#include <map>
#include <string>
#include <vector>

namespace tg {

/**
 * @brief Static genre -> preferred-category table
 *
 * Only biases ranking. Unknown genres and categories missing from the
 * registry resolve to nothing.
 */
class GenreRouting {
public:
    GenreRouting() = default;
    explicit GenreRouting(std::map<std::string, std::vector<std::string>> routes);

    void set_route(const std::string& genre, std::vector<std::string> categories);

    /**
     * @brief Preferred category names for genre, most preferred first
     */
    const std::vector<std::string>& preferred_categories(const std::string& genre) const;

    /**
     * @brief Preferred categories resolved to handles
     */
    std::vector<CategoryId> resolve(const std::string& genre, const CategoryRegistry& registry) const;

    const std::map<std::string, std::vector<std::string>>& routes() const { return routes_; }

private:
    std::map<std::string, std::vector<std::string>> routes_;
};

} // namespace tg
