#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace tg {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for an embedding provider
 */
struct EmbedderConfig {
    std::string api_key;                    ///< API key for authentication
    std::string model;                      ///< Embedding model name
    std::string api_base_url;               ///< Base URL for API (optional)
    int timeout_seconds = 30;               ///< Per-call timeout
    int max_retries = 3;                    ///< Max attempts per call
    bool verbose = false;                   ///< Enable verbose logging
};

// ============================================================================
// Embedder Interface
// ============================================================================

/**
 * @brief Maps text to a fixed-length float vector
 *
 * Implementations must be deterministic for a fixed model version and safe
 * to call from several threads at once. Failures throw EmbeddingError.
 */
class Embedder {
public:
    virtual ~Embedder() = default;

    /**
     * @brief Embed a single text
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /**
     * @brief Embed several texts, one vector per input in the same order
     *
     * The default implementation calls embed() for each text.
     */
    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts);

    /**
     * @brief Identifier of the embedding space ("<provider>/<model>")
     */
    virtual std::string model_id() const = 0;

    /**
     * @brief Vector length, 0 until known
     */
    virtual size_t dimension() const = 0;

    /**
     * @brief Get provider name
     */
    virtual std::string get_provider_name() const = 0;
};

// ============================================================================
// HTTP-backed providers
// ============================================================================

/**
 * @brief Shared plumbing for providers reached over HTTPS
 */
class HttpEmbedder : public Embedder {
public:
    std::string model_id() const override;
    size_t dimension() const override { return dimension_.load(); }

    bool is_configured() const { return !config_.api_key.empty(); }
    const EmbedderConfig& get_config() const { return config_; }

protected:
    explicit HttpEmbedder(const EmbedderConfig& config) : config_(config) {}

    EmbedderConfig config_;
    std::atomic<size_t> dimension_{0};

    /**
     * @brief Run func with exponential-backoff retries
     *
     * Throws EmbeddingError once config_.max_retries attempts have failed.
     */
    template<typename Func>
    auto retry_call(Func&& func, const std::string& operation_name) -> decltype(func());

    /**
     * @brief Record the vector length seen from the provider
     */
    void remember_dimension(const std::vector<float>& vector);
};

/**
 * @brief Google Gemini embedding API provider
 */
class GeminiEmbedder : public HttpEmbedder {
public:
    /**
     * @brief Constructor
     *
     * @param config Provider configuration (model default: gemini-embedding-001)
     */
    explicit GeminiEmbedder(const EmbedderConfig& config);

    std::vector<float> embed(const std::string& text) override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
    std::string get_provider_name() const override { return "gemini"; }

    /// Maximum texts per batchEmbedContents request
    static constexpr size_t kMaxBatch = 100;

private:
    std::string make_request(const std::string& endpoint, const std::string& json_payload);
};

/**
 * @brief OpenAI embeddings API provider
 */
class OpenAIEmbedder : public HttpEmbedder {
public:
    /**
     * @brief Constructor
     *
     * @param config Provider configuration (model default: text-embedding-3-small)
     */
    explicit OpenAIEmbedder(const EmbedderConfig& config);

    std::vector<float> embed(const std::string& text) override;
    std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
    std::string get_provider_name() const override { return "openai"; }

    static constexpr size_t kMaxBatch = 256;

private:
    std::string make_request(const std::string& endpoint, const std::string& json_payload);
};

// ============================================================================
// Embedder Factory
// ============================================================================

/**
 * @brief Factory for creating embedding providers
 */
class EmbedderFactory {
public:
    enum class ProviderType {
        Gemini,
        OpenAI
    };

    static std::unique_ptr<Embedder> create(ProviderType type, const EmbedderConfig& config);

    /**
     * @brief Create provider from string name ("gemini" or "openai")
     */
    static std::unique_ptr<Embedder> create(const std::string& provider_name,
                                            const EmbedderConfig& config);

    /**
     * @brief Create provider from environment variables
     *
     * Looks for:
     * - TG_EMBED_PROVIDER (gemini/openai, default gemini)
     * - TG_GEMINI_API_KEY or GEMINI_API_KEY
     * - TG_OPENAI_API_KEY or OPENAI_API_KEY
     * - TG_EMBED_MODEL (optional)
     *
     * @return Provider, or nullptr if no API key is available
     */
    static std::unique_ptr<Embedder> create_from_env();
};

/**
 * @brief Default model for a provider name
 */
std::string default_embedding_model(const std::string& provider_name);

/**
 * @brief Read an environment variable, empty if unset
 */
std::string get_env_value(const std::string& env_var_name);

} // namespace tg
