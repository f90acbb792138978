#include "config/engine_config.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sys/stat.h>

using json = nlohmann::json;

namespace tg {

namespace {

std::string api_key_from_environment(const std::string& provider) {
    std::string api_key;
    if (provider == "openai") {
        api_key = get_env_value("OPENAI_API_KEY");
        if (api_key.empty()) api_key = get_env_value("TG_OPENAI_API_KEY");
    } else if (provider == "gemini") {
        api_key = get_env_value("GEMINI_API_KEY");
        if (api_key.empty()) api_key = get_env_value("TG_GEMINI_API_KEY");
    }
    return api_key;
}

} // namespace

std::map<std::string, std::vector<std::string>> EngineConfig::default_genre_routes() {
    return {
        {"cultivation_novel", {"cultivation_realms", "cultivation_techniques", "titles_honorifics"}},
        {"xianxia", {"cultivation_realms", "cultivation_techniques", "titles_honorifics"}},
        {"wuxia", {"cultivation_techniques", "titles_honorifics"}},
        {"romance", {"emotional_nuance", "response_particles"}},
        {"action", {"action_emphasis"}}
    };
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    EngineConfig config;

    // Embedding config - support both formats:
    // Full format: embedding_provider, embedding_api_key, embedding_model
    // Short format: provider, api_key, model
    if (j.contains("embedding_provider")) {
        config.embedding_provider = j["embedding_provider"];
    } else if (j.contains("provider")) {
        config.embedding_provider = j["provider"];
    }

    if (j.contains("embedding_api_key")) {
        config.embedding_api_key = j["embedding_api_key"];
    } else if (j.contains("api_key")) {
        config.embedding_api_key = j["api_key"];
    }

    if (j.contains("embedding_model")) {
        config.embedding_model = j["embedding_model"];
    } else if (j.contains("model")) {
        config.embedding_model = j["model"];
    }

    if (j.contains("embedding_timeout_seconds")) config.embedding_timeout_seconds = j["embedding_timeout_seconds"];
    if (j.contains("embedding_max_retries")) config.embedding_max_retries = j["embedding_max_retries"];

    // Gates
    if (j.contains("threshold_inject")) config.thresholds.inject = j["threshold_inject"];
    if (j.contains("threshold_log")) config.thresholds.log = j["threshold_log"];
    if (j.contains("neg_anchor_threshold")) config.negative_anchor.threshold = j["neg_anchor_threshold"];
    if (j.contains("neg_anchor_penalty")) config.negative_anchor.penalty = j["neg_anchor_penalty"];

    // Retrieval
    if (j.contains("top_k")) config.top_k = j["top_k"];
    if (j.contains("genre_bias")) config.genre_bias = j["genre_bias"];
    if (j.contains("enable_aggregation")) config.enable_aggregation = j["enable_aggregation"];

    // Build
    if (j.contains("upsert_batch_size")) config.upsert_batch_size = j["upsert_batch_size"];

    // Bulk
    if (j.contains("max_api_calls")) config.max_api_calls = j["max_api_calls"];
    if (j.contains("min_confidence")) config.min_confidence = j["min_confidence"];
    if (j.contains("bulk_concurrency")) config.bulk_concurrency = j["bulk_concurrency"];
    if (j.contains("session_cache_size")) config.session_cache_size = j["session_cache_size"];

    // Paths
    if (j.contains("corpus_path")) config.corpus_path = j["corpus_path"];
    if (j.contains("index_path")) config.index_path = j["index_path"];
    if (j.contains("uncertain_log_path")) config.uncertain_log_path = j["uncertain_log_path"];
    if (j.contains("verbose")) config.verbose = j["verbose"];

    if (j.contains("genre_routes")) {
        config.genre_routes = j["genre_routes"].get<std::map<std::string, std::vector<std::string>>>();
    }

    return config;
}

void EngineConfig::to_json_file(const std::string& path) const {
    json j;

    j["embedding_provider"] = embedding_provider;
    j["embedding_api_key"] = "***REDACTED***";
    j["embedding_model"] = embedding_model;
    j["embedding_timeout_seconds"] = embedding_timeout_seconds;
    j["embedding_max_retries"] = embedding_max_retries;

    j["threshold_inject"] = thresholds.inject;
    j["threshold_log"] = thresholds.log;
    j["neg_anchor_threshold"] = negative_anchor.threshold;
    j["neg_anchor_penalty"] = negative_anchor.penalty;

    j["top_k"] = top_k;
    j["genre_bias"] = genre_bias;
    j["enable_aggregation"] = enable_aggregation;

    j["upsert_batch_size"] = upsert_batch_size;

    j["max_api_calls"] = max_api_calls;
    j["min_confidence"] = min_confidence;
    j["bulk_concurrency"] = bulk_concurrency;
    j["session_cache_size"] = session_cache_size;

    j["corpus_path"] = corpus_path;
    j["index_path"] = index_path;
    if (!uncertain_log_path.empty()) {
        j["uncertain_log_path"] = uncertain_log_path;
    }
    j["verbose"] = verbose;

    j["genre_routes"] = genre_routes;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << j.dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    std::string provider = get_env_value("TG_EMBED_PROVIDER");
    if (!provider.empty()) config.embedding_provider = provider;

    config.embedding_api_key = api_key_from_environment(config.embedding_provider);

    std::string model = get_env_value("TG_EMBED_MODEL");
    if (!model.empty()) config.embedding_model = model;

    std::string corpus_path = get_env_value("TG_CORPUS_PATH");
    if (!corpus_path.empty()) config.corpus_path = corpus_path;

    std::string index_path = get_env_value("TG_INDEX_PATH");
    if (!index_path.empty()) config.index_path = index_path;

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (embedding_provider != "gemini" && embedding_provider != "openai") {
        error_message = "Embedding provider must be 'gemini' or 'openai'";
        return false;
    }

    if (!thresholds.validate(error_message)) {
        return false;
    }

    if (negative_anchor.threshold < 0.0 || negative_anchor.threshold > 1.0) {
        error_message = "neg_anchor_threshold must be between 0.0 and 1.0";
        return false;
    }

    if (negative_anchor.penalty < 0.0 || negative_anchor.penalty > 1.0) {
        error_message = "neg_anchor_penalty must be between 0.0 and 1.0";
        return false;
    }

    if (top_k == 0) {
        error_message = "top_k must be at least 1";
        return false;
    }

    if (genre_bias < 0.0 || genre_bias > 1.0) {
        error_message = "genre_bias must be between 0.0 and 1.0";
        return false;
    }

    if (upsert_batch_size == 0) {
        error_message = "upsert_batch_size must be at least 1";
        return false;
    }

    if (bulk_concurrency == 0) {
        error_message = "bulk_concurrency must be at least 1";
        return false;
    }

    if (min_confidence < 0.0 || min_confidence > 1.0) {
        error_message = "min_confidence must be between 0.0 and 1.0";
        return false;
    }

    if (embedding_timeout_seconds <= 0 || embedding_max_retries <= 0) {
        error_message = "Embedding timeout and retries must be positive";
        return false;
    }

    return true;
}

void EngineConfig::validate_or_throw() const {
    std::string error;
    if (!validate(error)) {
        throw ConfigError(error);
    }
}

EmbedderConfig EngineConfig::to_embedder_config() const {
    EmbedderConfig config;
    config.api_key = embedding_api_key;
    config.model = embedding_model.empty()
        ? default_embedding_model(embedding_provider)
        : embedding_model;
    config.timeout_seconds = embedding_timeout_seconds;
    config.max_retries = embedding_max_retries;
    config.verbose = verbose;
    return config;
}

EngineConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    paths_to_try.push_back(".termguide.json");
    paths_to_try.push_back("../.termguide.json");
    paths_to_try.push_back("../../.termguide.json");

    for (const auto& path : paths_to_try) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            continue;
        }
        try {
            auto config = EngineConfig::from_json_file(path);
            if (config.embedding_api_key.empty()) {
                config.embedding_api_key = api_key_from_environment(config.embedding_provider);
            }
            return config;
        } catch (const std::exception& e) {
            std::cerr << "[config] Ignoring " << path << ": " << e.what() << "\n";
        }
    }

    return EngineConfig::from_environment();
}

} // namespace tg
