#pragma once

#include <stdexcept>
#include <string>

namespace tg {

/**
 * @brief Corpus is structurally unusable (missing file, bad JSON, wrong shape)
 *
 * Aborts the whole load. Per-entry problems are reported through
 * LoadReport instead.
 */
class CorpusError : public std::runtime_error {
public:
    explicit CorpusError(const std::string& what)
        : std::runtime_error("Corpus error: " + what) {}
};

/**
 * @brief An embedding call failed after all retries
 */
class EmbeddingError : public std::runtime_error {
public:
    explicit EmbeddingError(const std::string& what)
        : std::runtime_error("Embedding error: " + what) {}
};

/**
 * @brief Query vectors come from a different embedding space than the index
 *
 * Raised when the embedder's model id or vector dimension differs from the
 * one recorded on the index. Never degraded to an empty result.
 */
class EmbeddingSpaceMismatch : public std::runtime_error {
public:
    EmbeddingSpaceMismatch(const std::string& index_model, const std::string& query_model)
        : std::runtime_error(
              "Embedding space mismatch: index built with '" + index_model +
              "', queried with '" + query_model + "'"),
          index_model_(index_model),
          query_model_(query_model) {}

    const std::string& index_model() const { return index_model_; }
    const std::string& query_model() const { return query_model_; }

private:
    std::string index_model_;
    std::string query_model_;
};

/**
 * @brief Invalid engine configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("Invalid configuration: " + what) {}
};

} // namespace tg
