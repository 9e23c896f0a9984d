#pragma once

#include <docseek/core/types.h>
#include <docseek/net/http_client.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace docseek::ml {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * Ingestion embeds chunk texts in batches; the search refiner embeds one
 * query. Every call checks the stop token before going to the backend.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single query text
     * @return Embedding, or EmbeddingFailure / OperationCancelled
     */
    virtual Result<Embedding> generateEmbedding(const std::string& text,
                                                std::stop_token stop = {}) = 0;

    /**
     * Generate embeddings for a batch of texts, one per input in input order
     */
    virtual Result<std::vector<Embedding>>
    generateBatchEmbeddings(const std::vector<std::string>& texts, std::stop_token stop = {}) = 0;

    /**
     * Get the name of this provider (e.g. "OpenAI", "Mock")
     */
    virtual std::string getProviderName() const = 0;

    /**
     * Get embedding dimension
     */
    virtual size_t getEmbeddingDimension() const = 0;
};

// ============================================================================
// Configuration
// ============================================================================

struct EmbeddingConfig {
    std::string provider = "openai"; // "openai" or "mock"
    std::string model = "text-embedding-3-small";
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    size_t dimension = 0; // 0 = model default
    size_t batch_size = 100;
    std::chrono::milliseconds timeout{60000};
};

/**
 * Default output dimension for known OpenAI models, 0 when unknown
 */
size_t defaultDimensionForModel(const std::string& model);

// ============================================================================
// Implementations
// ============================================================================

/**
 * OpenAI /embeddings adapter. Inputs larger than the batch size are sent as
 * several requests and the results concatenated in order.
 */
class OpenAIEmbeddingProvider : public IEmbeddingProvider {
public:
    OpenAIEmbeddingProvider(EmbeddingConfig config, std::shared_ptr<net::IHttpClient> http);

    Result<Embedding> generateEmbedding(const std::string& text, std::stop_token stop = {}) override;
    Result<std::vector<Embedding>> generateBatchEmbeddings(const std::vector<std::string>& texts,
                                                           std::stop_token stop = {}) override;

    std::string getProviderName() const override { return "OpenAI"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    Result<std::vector<Embedding>> requestBatch(const std::vector<std::string>& texts,
                                                std::stop_token stop);

    EmbeddingConfig config_;
    std::shared_ptr<net::IHttpClient> http_;
    std::atomic<size_t> dimension_{0}; // learned from the first response when the model is unknown
};

/**
 * Mock embedding provider for tests and offline runs.
 * Generates deterministic unit vectors seeded by the text hash.
 */
class MockEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimension = 384);

    Result<Embedding> generateEmbedding(const std::string& text, std::stop_token stop = {}) override;
    Result<std::vector<Embedding>> generateBatchEmbeddings(const std::vector<std::string>& texts,
                                                           std::stop_token stop = {}) override;

    std::string getProviderName() const override { return "Mock"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

private:
    size_t dimension_;
};

// ============================================================================
// Embedding Provider Factory
// ============================================================================

/**
 * Create the configured embedding provider
 * @param http Transport for remote providers; the curl client when null
 * @return Provider, InvalidArgument for an unknown provider name or a
 *         missing API key
 */
Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const EmbeddingConfig& config,
                        std::shared_ptr<net::IHttpClient> http = nullptr);

} // namespace docseek::ml
