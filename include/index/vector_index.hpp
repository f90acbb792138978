#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tg {

/// Flat string metadata attached to each stored vector
using Metadata = std::map<std::string, std::string>;

/**
 * @brief One stored vector with its id, metadata and source document
 */
struct VectorRecord {
    std::string id;
    std::vector<float> vector;
    Metadata metadata;
    std::string document;
};

/**
 * @brief One nearest-neighbour hit
 */
struct VectorMatch {
    std::string id;
    double distance = 1.0;        ///< Cosine distance (1 - cosine similarity)
    Metadata metadata;
};

/**
 * @brief Persistent nearest-neighbour store (cosine distance)
 *
 * Implementations must allow concurrent query() calls. The collection is
 * tagged with the embedding model id it was populated with.
 */
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    /**
     * @brief Insert or replace a vector by id
     */
    virtual void upsert(
        const std::string& id,
        const std::vector<float>& vector,
        const Metadata& metadata,
        const std::string& document
    ) = 0;

    /**
     * @brief k nearest neighbours, closest first
     *
     * @param filter Metadata equality constraints (all must match)
     */
    virtual std::vector<VectorMatch> query(
        const std::vector<float>& vector,
        size_t k,
        const Metadata& filter = {}
    ) const = 0;

    virtual size_t count() const = 0;
    virtual void clear() = 0;

    /**
     * @brief Vector length of stored records, 0 when empty
     */
    virtual size_t dimension() const = 0;

    virtual std::string embedding_model_id() const = 0;
    virtual void set_embedding_model_id(const std::string& model_id) = 0;

    /**
     * @brief Copy out every stored record (ordered by id)
     */
    virtual std::vector<VectorRecord> export_records() const = 0;
};

/**
 * @brief Brute-force in-process VectorIndex with JSON persistence
 */
class InMemoryVectorIndex : public VectorIndex {
public:
    InMemoryVectorIndex() = default;

    void upsert(
        const std::string& id,
        const std::vector<float>& vector,
        const Metadata& metadata,
        const std::string& document
    ) override;

    std::vector<VectorMatch> query(
        const std::vector<float>& vector,
        size_t k,
        const Metadata& filter = {}
    ) const override;

    size_t count() const override;
    void clear() override;
    size_t dimension() const override;

    std::string embedding_model_id() const override;
    void set_embedding_model_id(const std::string& model_id) override;

    std::vector<VectorRecord> export_records() const override;

    nlohmann::json to_json() const;
    static std::unique_ptr<InMemoryVectorIndex> from_json(const nlohmann::json& j);

    void save_to_json(const std::string& path) const;
    static std::unique_ptr<InMemoryVectorIndex> load_from_json(const std::string& path);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, VectorRecord> records_;
    size_t dimension_ = 0;
    std::string model_id_;
};

} // namespace tg
