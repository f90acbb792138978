#include "embedding/embedder.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace tg {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Make HTTP POST request with CURL
std::string http_post(
    const std::string& url,
    const std::string& json_payload,
    const std::vector<std::string>& headers,
    int timeout_seconds
) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;

    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    // Worker threads must not be interrupted by SIGALRM-based DNS timeouts
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw std::runtime_error("CURL request failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw std::runtime_error(
            "HTTP request failed with code " + std::to_string(http_code) +
            ": " + response
        );
    }

    return response;
}

std::vector<float> parse_values(const json& values) {
    if (!values.is_array() || values.empty()) {
        throw std::runtime_error("embedding response has no values");
    }
    return values.get<std::vector<float>>();
}

// Throws if the provider reported an error object
void check_error(const json& j) {
    if (j.contains("error")) {
        std::string message = "unknown provider error";
        if (j["error"].is_object() && j["error"].contains("message")) {
            message = j["error"]["message"].get<std::string>();
        }
        throw std::runtime_error(message);
    }
}

} // anonymous namespace

// ============================================================================
// Embedder Base Class
// ============================================================================

std::vector<std::vector<float>> Embedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> results;
    results.reserve(texts.size());

    for (const auto& text : texts) {
        results.push_back(embed(text));
    }

    return results;
}

std::string HttpEmbedder::model_id() const {
    return get_provider_name() + "/" + config_.model;
}

void HttpEmbedder::remember_dimension(const std::vector<float>& vector) {
    size_t expected = 0;
    dimension_.compare_exchange_strong(expected, vector.size());
}

template<typename Func>
auto HttpEmbedder::retry_call(Func&& func, const std::string& operation_name) -> decltype(func()) {
    int attempts = 0;
    int max_attempts = std::max(1, config_.max_retries);

    while (true) {
        try {
            return func();
        } catch (const std::exception& e) {
            attempts++;
            if (attempts >= max_attempts) {
                throw EmbeddingError(
                    operation_name + " failed after " + std::to_string(attempts) +
                    " attempts: " + e.what());
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempts << " failed for " << operation_name
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::seconds(static_cast<int>(std::pow(2, attempts - 1)))
            );
        }
    }
}

// ============================================================================
// Gemini Provider
// ============================================================================

GeminiEmbedder::GeminiEmbedder(const EmbedderConfig& config) : HttpEmbedder(config) {
    if (config_.model.empty()) {
        config_.model = default_embedding_model("gemini");
    }
    if (config_.api_base_url.empty()) {
        config_.api_base_url = "https://generativelanguage.googleapis.com/v1beta";
    }
}

std::string GeminiEmbedder::make_request(
    const std::string& endpoint,
    const std::string& json_payload
) {
    std::string url = config_.api_base_url + endpoint + "?key=" + config_.api_key;

    std::vector<std::string> headers = {
        "Content-Type: application/json"
    };

    return http_post(url, json_payload, headers, config_.timeout_seconds);
}

std::vector<float> GeminiEmbedder::embed(const std::string& text) {
    auto call_api = [&]() -> std::vector<float> {
        json j;
        j["model"] = "models/" + config_.model;
        j["content"] = {{"parts", json::array({{{"text", text}}})}};

        std::string endpoint = "/models/" + config_.model + ":embedContent";
        json response = json::parse(make_request(endpoint, j.dump()));
        check_error(response);

        auto values = parse_values(response.at("embedding").at("values"));
        remember_dimension(values);
        return values;
    };

    return retry_call(call_api, "Gemini embedContent");
}

std::vector<std::vector<float>> GeminiEmbedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> results;
    results.reserve(texts.size());

    for (size_t start = 0; start < texts.size(); start += kMaxBatch) {
        size_t end = std::min(texts.size(), start + kMaxBatch);

        auto call_api = [&]() -> std::vector<std::vector<float>> {
            json requests = json::array();
            for (size_t i = start; i < end; ++i) {
                requests.push_back({
                    {"model", "models/" + config_.model},
                    {"content", {{"parts", json::array({{{"text", texts[i]}}})}}}
                });
            }
            json j;
            j["requests"] = requests;

            std::string endpoint = "/models/" + config_.model + ":batchEmbedContents";
            json response = json::parse(make_request(endpoint, j.dump()));
            check_error(response);

            const auto& embeddings = response.at("embeddings");
            if (!embeddings.is_array() || embeddings.size() != end - start) {
                throw std::runtime_error("batch response size does not match request");
            }

            std::vector<std::vector<float>> chunk;
            for (const auto& embedding : embeddings) {
                chunk.push_back(parse_values(embedding.at("values")));
                remember_dimension(chunk.back());
            }
            return chunk;
        };

        auto chunk = retry_call(call_api, "Gemini batchEmbedContents");
        for (auto& vector : chunk) {
            results.push_back(std::move(vector));
        }
    }

    return results;
}

// ============================================================================
// OpenAI Provider
// ============================================================================

OpenAIEmbedder::OpenAIEmbedder(const EmbedderConfig& config) : HttpEmbedder(config) {
    if (config_.model.empty()) {
        config_.model = default_embedding_model("openai");
    }
    if (config_.api_base_url.empty()) {
        config_.api_base_url = "https://api.openai.com/v1";
    }
}

std::string OpenAIEmbedder::make_request(
    const std::string& endpoint,
    const std::string& json_payload
) {
    std::string url = config_.api_base_url + endpoint;

    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Authorization: Bearer " + config_.api_key
    };

    return http_post(url, json_payload, headers, config_.timeout_seconds);
}

std::vector<float> OpenAIEmbedder::embed(const std::string& text) {
    auto batch = embed_batch({text});
    return batch.front();
}

std::vector<std::vector<float>> OpenAIEmbedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> results;
    results.reserve(texts.size());

    for (size_t start = 0; start < texts.size(); start += kMaxBatch) {
        size_t end = std::min(texts.size(), start + kMaxBatch);

        auto call_api = [&]() -> std::vector<std::vector<float>> {
            json j;
            j["model"] = config_.model;
            j["input"] = std::vector<std::string>(texts.begin() + start, texts.begin() + end);

            json response = json::parse(make_request("/embeddings", j.dump()));
            check_error(response);

            const auto& data = response.at("data");
            if (!data.is_array() || data.size() != end - start) {
                throw std::runtime_error("embedding response size does not match request");
            }

            // Entries carry an "index"; do not rely on response order
            std::vector<std::vector<float>> chunk(end - start);
            for (const auto& item : data) {
                size_t index = item.value("index", size_t{0});
                if (index >= chunk.size()) {
                    throw std::runtime_error("embedding response index out of range");
                }
                chunk[index] = parse_values(item.at("embedding"));
                remember_dimension(chunk[index]);
            }
            return chunk;
        };

        auto chunk = retry_call(call_api, "OpenAI embeddings");
        for (auto& vector : chunk) {
            results.push_back(std::move(vector));
        }
    }

    return results;
}

// ============================================================================
// Embedder Factory
// ============================================================================

std::unique_ptr<Embedder> EmbedderFactory::create(
    ProviderType type,
    const EmbedderConfig& config
) {
    switch (type) {
        case ProviderType::Gemini:
            return std::make_unique<GeminiEmbedder>(config);

        case ProviderType::OpenAI:
            return std::make_unique<OpenAIEmbedder>(config);

        default:
            throw std::invalid_argument("Unknown provider type");
    }
}

std::unique_ptr<Embedder> EmbedderFactory::create(
    const std::string& provider_name,
    const EmbedderConfig& config
) {
    std::string name_lower = provider_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    if (name_lower == "gemini") {
        return create(ProviderType::Gemini, config);
    } else if (name_lower == "openai") {
        return create(ProviderType::OpenAI, config);
    } else {
        throw std::invalid_argument("Unknown embedding provider: " + provider_name);
    }
}

std::unique_ptr<Embedder> EmbedderFactory::create_from_env() {
    std::string provider = get_env_value("TG_EMBED_PROVIDER");
    if (provider.empty()) {
        provider = "gemini";  // Default
    }

    EmbedderConfig config;

    if (provider == "gemini") {
        config.api_key = get_env_value("TG_GEMINI_API_KEY");
        if (config.api_key.empty()) {
            config.api_key = get_env_value("GEMINI_API_KEY");
        }
    } else if (provider == "openai") {
        config.api_key = get_env_value("TG_OPENAI_API_KEY");
        if (config.api_key.empty()) {
            config.api_key = get_env_value("OPENAI_API_KEY");
        }
    }

    config.model = get_env_value("TG_EMBED_MODEL");

    if (config.api_key.empty()) {
        return nullptr;
    }

    return create(provider, config);
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string default_embedding_model(const std::string& provider_name) {
    if (provider_name == "openai") {
        return "text-embedding-3-small";
    }
    return "gemini-embedding-001";
}

std::string get_env_value(const std::string& env_var_name) {
    const char* value = std::getenv(env_var_name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace tg
