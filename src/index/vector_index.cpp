#include "index/vector_index.hpp"
#include "core/errors.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <fstream>
#include <mutex>
#include <stdexcept>

using json = nlohmann::json;

namespace tg {

void InMemoryVectorIndex::upsert(
    const std::string& id,
    const std::vector<float>& vector,
    const Metadata& metadata,
    const std::string& document
) {
    if (vector.empty()) {
        throw std::invalid_argument("Cannot upsert empty vector for id " + id);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (dimension_ != 0 && vector.size() != dimension_) {
        throw EmbeddingSpaceMismatch(
            model_id_ + " (dim " + std::to_string(dimension_) + ")",
            "vector of dim " + std::to_string(vector.size()));
    }
    dimension_ = vector.size();

    VectorRecord& record = records_[id];
    record.id = id;
    record.vector = vector;
    record.metadata = metadata;
    record.document = document;
}

std::vector<VectorMatch> InMemoryVectorIndex::query(
    const std::vector<float>& vector,
    size_t k,
    const Metadata& filter
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<VectorMatch> matches;
    if (records_.empty() || k == 0) {
        return matches;
    }

    if (vector.size() != dimension_) {
        throw EmbeddingSpaceMismatch(
            model_id_ + " (dim " + std::to_string(dimension_) + ")",
            "query of dim " + std::to_string(vector.size()));
    }

    matches.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        bool accepted = true;
        for (const auto& [key, value] : filter) {
            auto it = record.metadata.find(key);
            if (it == record.metadata.end() || it->second != value) {
                accepted = false;
                break;
            }
        }
        if (!accepted) continue;

        VectorMatch match;
        match.id = id;
        match.distance = 1.0 - cosine_similarity(vector, record.vector);
        match.metadata = record.metadata;
        matches.push_back(std::move(match));
    }

    // Closest first, ties by id
    std::sort(matches.begin(), matches.end(),
        [](const VectorMatch& a, const VectorMatch& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return a.id < b.id;
        });

    if (matches.size() > k) {
        matches.resize(k);
    }
    return matches;
}

size_t InMemoryVectorIndex::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

void InMemoryVectorIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.clear();
    dimension_ = 0;
    model_id_.clear();
}

size_t InMemoryVectorIndex::dimension() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return dimension_;
}

std::string InMemoryVectorIndex::embedding_model_id() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return model_id_;
}

void InMemoryVectorIndex::set_embedding_model_id(const std::string& model_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!records_.empty() && !model_id_.empty() && model_id_ != model_id) {
        throw EmbeddingSpaceMismatch(model_id_, model_id);
    }
    model_id_ = model_id;
}

std::vector<VectorRecord> InMemoryVectorIndex::export_records() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<VectorRecord> records;
    records.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        records.push_back(record);
    }
    std::sort(records.begin(), records.end(),
        [](const VectorRecord& a, const VectorRecord& b) { return a.id < b.id; });
    return records;
}

json InMemoryVectorIndex::to_json() const {
    json j;
    j["embedding_model_id"] = embedding_model_id();
    j["dimension"] = dimension();

    json records = json::array();
    for (const auto& record : export_records()) {
        records.push_back({
            {"id", record.id},
            {"vector", record.vector},
            {"metadata", record.metadata},
            {"document", record.document}
        });
    }
    j["records"] = records;
    return j;
}

std::unique_ptr<InMemoryVectorIndex> InMemoryVectorIndex::from_json(const json& j) {
    auto index = std::make_unique<InMemoryVectorIndex>();

    if (j.contains("records")) {
        for (const auto& item : j["records"]) {
            index->upsert(
                item.at("id").get<std::string>(),
                item.at("vector").get<std::vector<float>>(),
                item.value("metadata", Metadata{}),
                item.value("document", std::string())
            );
        }
    }
    index->set_embedding_model_id(j.value("embedding_model_id", std::string()));
    return index;
}

void InMemoryVectorIndex::save_to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write vector index file: " + path);
    }
    file << to_json().dump();
}

std::unique_ptr<InMemoryVectorIndex> InMemoryVectorIndex::load_from_json(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open vector index file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

} // namespace tg
