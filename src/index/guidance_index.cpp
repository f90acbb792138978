#include "index/guidance_index.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace tg {

// ==========================================
// IndexStats
// ==========================================

void IndexStats::print_summary() const {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Guidance Index Summary\n";
    std::cout << std::string(60, '=') << "\n\n";

    std::cout << "Embedding model: " << embedding_model_id << " (dim " << dimension << ")\n";
    std::cout << "Created: " << created_utc << "\n";
    std::cout << "Build time: " << build_time_seconds << " seconds\n\n";

    std::cout << "Patterns indexed: " << total_indexed << "\n";
    for (const auto& [category, count] : patterns_per_category) {
        std::cout << "  " << category << ": " << count << "\n";
    }
    std::cout << "Collisions resolved: " << collisions << "\n\n";

    size_t anchors = 0;
    for (const auto& [category, count] : anchors_per_category) {
        anchors += count;
    }
    std::cout << "Negative anchors: " << anchors << "\n";
    for (const auto& [category, count] : anchors_per_category) {
        std::cout << "  " << category << ": " << count << "\n";
    }
    if (anchors_skipped > 0) {
        std::cout << "Anchors skipped: " << anchors_skipped << "\n";
    }
    std::cout << std::string(60, '=') << "\n";
}

json IndexStats::to_json() const {
    return {
        {"patterns_per_category", patterns_per_category},
        {"anchors_per_category", anchors_per_category},
        {"total_indexed", total_indexed},
        {"collisions", collisions},
        {"anchors_skipped", anchors_skipped},
        {"dimension", dimension},
        {"embedding_model_id", embedding_model_id},
        {"created_utc", created_utc},
        {"build_time_seconds", build_time_seconds}
    };
}

IndexStats IndexStats::from_json(const json& j) {
    IndexStats stats;
    stats.patterns_per_category = j.value("patterns_per_category", std::map<std::string, size_t>{});
    stats.anchors_per_category = j.value("anchors_per_category", std::map<std::string, size_t>{});
    stats.total_indexed = j.value("total_indexed", size_t{0});
    stats.collisions = j.value("collisions", size_t{0});
    stats.anchors_skipped = j.value("anchors_skipped", size_t{0});
    stats.dimension = j.value("dimension", size_t{0});
    stats.embedding_model_id = j.value("embedding_model_id", std::string());
    stats.created_utc = j.value("created_utc", std::string());
    stats.build_time_seconds = j.value("build_time_seconds", 0.0);
    return stats;
}

// ==========================================
// GuidanceIndex
// ==========================================

const Pattern* GuidanceIndex::find_pattern(const std::string& id) const {
    auto it = pattern_by_id.find(id);
    if (it == pattern_by_id.end()) {
        return nullptr;
    }
    return &patterns[it->second];
}

std::string GuidanceIndex::embedding_model_id() const {
    return collection ? collection->embedding_model_id() : stats.embedding_model_id;
}

size_t GuidanceIndex::dimension() const {
    return collection ? collection->dimension() : stats.dimension;
}

bool GuidanceIndex::empty() const {
    return patterns.empty() && (!collection || collection->count() == 0);
}

void GuidanceIndex::save_to_json(const std::string& path) const {
    json j;
    j["meta"] = {
        {"format_version", 1},
        {"created_utc", stats.created_utc},
        {"embedding_model_id", embedding_model_id()},
        {"dimension", dimension()}
    };
    j["stats"] = stats.to_json();
    j["categories"] = categories.names();

    json pattern_arr = json::array();
    for (const auto& pattern : patterns) {
        pattern_arr.push_back(pattern.to_json());
    }
    j["patterns"] = pattern_arr;

    json anchor_obj = json::object();
    for (const auto& [category_id, vectors] : anchors.entries()) {
        anchor_obj[categories.name(category_id)] = vectors;
    }
    j["negative_anchors"] = anchor_obj;

    json vector_arr = json::array();
    if (collection) {
        for (const auto& record : collection->export_records()) {
            vector_arr.push_back({
                {"id", record.id},
                {"vector", record.vector},
                {"metadata", record.metadata},
                {"document", record.document}
            });
        }
    }
    j["vectors"] = vector_arr;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write index file: " + path);
    }
    file << j.dump();
}

std::shared_ptr<GuidanceIndex> GuidanceIndex::load_from_json(
    const std::string& path,
    std::shared_ptr<VectorIndex> collection
) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open index file: " + path);
    }

    json j;
    file >> j;

    auto index = std::make_shared<GuidanceIndex>();
    index->collection = std::move(collection);
    index->collection->clear();

    if (j.contains("categories")) {
        for (const auto& name : j["categories"]) {
            index->categories.intern(name.get<std::string>());
        }
    }

    if (j.contains("patterns")) {
        for (const auto& item : j["patterns"]) {
            Pattern pattern = Pattern::from_json(item);
            pattern.category_id = index->categories.intern(pattern.category);
            index->pattern_by_id[pattern.id] = index->patterns.size();
            index->direct.insert(pattern);
            index->patterns.push_back(std::move(pattern));
        }
    }

    if (j.contains("negative_anchors")) {
        for (auto& [category, vectors] : j["negative_anchors"].items()) {
            CategoryId id = index->categories.intern(category);
            for (const auto& vec : vectors) {
                index->anchors.add(id, vec.get<std::vector<float>>());
            }
        }
    }

    if (j.contains("vectors")) {
        for (const auto& item : j["vectors"]) {
            index->collection->upsert(
                item.at("id").get<std::string>(),
                item.at("vector").get<std::vector<float>>(),
                item.value("metadata", Metadata{}),
                item.value("document", std::string())
            );
        }
    }

    if (j.contains("stats")) {
        index->stats = IndexStats::from_json(j["stats"]);
    }
    std::string model_id;
    if (j.contains("meta")) {
        model_id = j["meta"].value("embedding_model_id", std::string());
    }
    index->collection->set_embedding_model_id(model_id);

    return index;
}

} // namespace tg
