#pragma once

#include <docseek/core/types.h>
#include <docseek/net/http_client.h>
#include <docseek/search/search_types.h>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace docseek::search {

/**
 * @brief Interface for cross-encoder reranking
 *
 * One call scores every candidate; the returned vector is aligned with
 * @p documents. Failures are RerankFailure, or OperationCancelled when the
 * stop token fired before or during the call.
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    virtual Result<std::vector<float>> scoreDocuments(const std::string& query,
                                                      const std::vector<std::string>& documents,
                                                      std::stop_token stop = {}) = 0;

    /**
     * @brief Check if the reranker is ready to accept requests
     */
    virtual bool isReady() const = 0;

    virtual std::string name() const = 0;
};

struct RerankConfig {
    // Cohere
    std::string cohere_api_key;
    std::string cohere_model = "rerank-v3.5";
    std::string cohere_url = "https://api.cohere.com/v2/rerank";

    // Local cross-encoder servers (text-embeddings-inference /rerank protocol)
    std::string local_small_model = "ms-marco-MiniLM-L-12-v2";
    std::string local_small_url = "http://127.0.0.1:8081";
    std::string local_large_model = "BAAI/bge-reranker-v2-m3";
    std::string local_large_url = "http://127.0.0.1:8082";

    std::chrono::milliseconds timeout{60000};
};

/**
 * @brief Cohere rerank API
 */
class CohereReranker : public IReranker {
public:
    CohereReranker(std::string apiKey, std::string model, std::string url,
                   std::chrono::milliseconds timeout, std::shared_ptr<net::IHttpClient> http);

    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents,
                                              std::stop_token stop = {}) override;
    bool isReady() const override { return !apiKey_.empty() && http_ != nullptr; }
    std::string name() const override { return "cohere:" + model_; }

private:
    std::string apiKey_;
    std::string model_;
    std::string url_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<net::IHttpClient> http_;
};

/**
 * @brief Cross-encoder served locally behind a POST /rerank endpoint
 *
 * Request `{"query", "texts"}`, response `[{"index", "score"}]`.
 */
class CrossEncoderHttpReranker : public IReranker {
public:
    CrossEncoderHttpReranker(std::string model, std::string baseUrl,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<net::IHttpClient> http);

    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents,
                                              std::stop_token stop = {}) override;
    bool isReady() const override { return http_ != nullptr; }
    std::string name() const override { return "local:" + model_; }

private:
    std::string model_;
    std::string baseUrl_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<net::IHttpClient> http_;
};

/**
 * @brief Build the reranker for a backend
 * @return Reranker, or InvalidArgument when the cloud backend has no API key
 */
Result<std::unique_ptr<IReranker>> createReranker(RerankBackend backend,
                                                  const RerankConfig& config,
                                                  std::shared_ptr<net::IHttpClient> http = nullptr);

} // namespace docseek::search
