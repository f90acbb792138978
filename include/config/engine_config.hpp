#pragma once

#include "embedding/embedder.hpp"
#include "engine/confidence.hpp"
#include "index/negative_anchor_cache.hpp"
#include <map>
#include <string>
#include <vector>

namespace tg {

/**
 * @brief Configuration for the guidance engine
 */
struct EngineConfig {
    // Embedding provider
    std::string embedding_provider = "gemini";      ///< "gemini" or "openai"
    std::string embedding_api_key;                  ///< API key
    std::string embedding_model;                    ///< Empty = provider default
    int embedding_timeout_seconds = 30;             ///< Per-call timeout
    int embedding_max_retries = 3;                  ///< Attempts per call

    // Gates
    ConfidenceThresholds thresholds;                ///< INJECT / LOG lower bounds
    NegativeAnchorPolicy negative_anchor;           ///< Step penalty

    // Retrieval
    size_t top_k = 5;                               ///< Vector candidates per query
    double genre_bias = 0.03;                       ///< Ranking bonus for preferred categories
    bool enable_aggregation = true;                 ///< Multi-unit fallback

    // Build
    size_t upsert_batch_size = 50;                  ///< Patterns per embedding batch

    // Bulk guidance
    size_t max_api_calls = 20;                      ///< Embedding lookups per batch
    double min_confidence = 0.65;                   ///< High-confidence view cut
    size_t bulk_concurrency = 4;                    ///< Worker threads per batch
    size_t session_cache_size = 4096;               ///< Entries kept per orchestrator

    // Paths
    std::string corpus_path;
    std::string index_path = "termguide_index.json";
    std::string uncertain_log_path;                 ///< Empty = not saved
    bool verbose = false;

    // Genre -> preferred category names, most preferred first
    std::map<std::string, std::vector<std::string>> genre_routes = default_genre_routes();

    static std::map<std::string, std::vector<std::string>> default_genre_routes();

    /**
     * @brief Load configuration from JSON file
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file (API key redacted)
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Load from environment variables
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /**
     * @brief Throw ConfigError if validate() fails
     */
    void validate_or_throw() const;

    EmbedderConfig to_embedder_config() const;
};

/**
 * @brief Load config from the given path, then .termguide.json in the
 * current and parent directories, falling back to the environment
 */
EngineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace tg
