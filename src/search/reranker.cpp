#include <docseek/search/reranker.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace docseek::search {

using json = nlohmann::json;

namespace {

Error transportError(const Error& err, const std::string& backend) {
    if (err.code == ErrorCode::OperationCancelled)
        return err;
    return Error{ErrorCode::RerankFailure, backend + " request failed: " + err.message};
}

Error statusError(const net::HttpResponse& response, const std::string& backend) {
    std::string detail = response.body.substr(0, 200);
    try {
        auto body = json::parse(response.body);
        if (body.is_object() && body.contains("message") && body["message"].is_string())
            detail = body["message"].get<std::string>();
        else if (body.is_object() && body.contains("error") && body["error"].is_string())
            detail = body["error"].get<std::string>();
    } catch (const json::exception&) {
    }
    return Error{ErrorCode::RerankFailure,
                 backend + " returned HTTP " + std::to_string(response.status) + ": " + detail};
}

// Scatter (index, score) pairs back into input order; every index must appear
Result<std::vector<float>> scatterScores(const json& items, const char* scoreKey, size_t expected,
                                         const std::string& backend) {
    std::vector<float> scores(expected, 0.0f);
    std::vector<bool> seen(expected, false);
    for (const auto& item : items) {
        auto index = item.at("index").get<size_t>();
        if (index >= expected) {
            return Error{ErrorCode::RerankFailure, backend + " returned out-of-range index"};
        }
        scores[index] = item.at(scoreKey).get<float>();
        seen[index] = true;
    }
    for (size_t i = 0; i < expected; ++i) {
        if (!seen[i]) {
            return Error{ErrorCode::RerankFailure,
                         backend + " returned no score for document " + std::to_string(i)};
        }
    }
    return scores;
}

} // namespace

const char* rerankBackendToString(RerankBackend backend) {
    switch (backend) {
        case RerankBackend::Cloud:
            return "cloud";
        case RerankBackend::LocalSmall:
            return "local";
        case RerankBackend::LocalLarge:
            return "bge";
    }
    return "unknown";
}

CohereReranker::CohereReranker(std::string apiKey, std::string model, std::string url,
                               std::chrono::milliseconds timeout,
                               std::shared_ptr<net::IHttpClient> http)
    : apiKey_(std::move(apiKey)), model_(std::move(model)), url_(std::move(url)),
      timeout_(timeout), http_(std::move(http)) {}

Result<std::vector<float>> CohereReranker::scoreDocuments(const std::string& query,
                                                          const std::vector<std::string>& documents,
                                                          std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Rerank cancelled"};
    }
    if (documents.empty()) {
        return std::vector<float>{};
    }

    json payload = {{"model", model_},
                    {"query", query},
                    {"documents", documents},
                    {"top_n", documents.size()}};

    net::HttpRequest request;
    request.url = url_;
    request.headers.push_back("Authorization: Bearer " + apiKey_);
    request.body = payload.dump();
    request.timeout = timeout_;

    auto response = http_->post(request, stop);
    if (!response)
        return transportError(response.error(), "Cohere");
    if (response.value().status != 200)
        return statusError(response.value(), "Cohere");

    try {
        auto body = json::parse(response.value().body);
        return scatterScores(body.at("results"), "relevance_score", documents.size(), "Cohere");
    } catch (const json::exception& e) {
        return Error{ErrorCode::RerankFailure,
                     std::string("Malformed Cohere response: ") + e.what()};
    }
}

CrossEncoderHttpReranker::CrossEncoderHttpReranker(std::string model, std::string baseUrl,
                                                   std::chrono::milliseconds timeout,
                                                   std::shared_ptr<net::IHttpClient> http)
    : model_(std::move(model)), baseUrl_(std::move(baseUrl)), timeout_(timeout),
      http_(std::move(http)) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/')
        baseUrl_.pop_back();
}

Result<std::vector<float>>
CrossEncoderHttpReranker::scoreDocuments(const std::string& query,
                                         const std::vector<std::string>& documents,
                                         std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Rerank cancelled"};
    }
    if (documents.empty()) {
        return std::vector<float>{};
    }

    json payload = {{"query", query}, {"texts", documents}, {"truncate", true}};

    net::HttpRequest request;
    request.url = baseUrl_ + "/rerank";
    request.body = payload.dump();
    request.timeout = timeout_;

    const std::string backend = "Cross-encoder " + model_;
    auto response = http_->post(request, stop);
    if (!response)
        return transportError(response.error(), backend);
    if (response.value().status != 200)
        return statusError(response.value(), backend);

    try {
        auto body = json::parse(response.value().body);
        return scatterScores(body, "score", documents.size(), backend);
    } catch (const json::exception& e) {
        return Error{ErrorCode::RerankFailure,
                     "Malformed response from " + backend + ": " + e.what()};
    }
}

Result<std::unique_ptr<IReranker>> createReranker(RerankBackend backend,
                                                  const RerankConfig& config,
                                                  std::shared_ptr<net::IHttpClient> http) {
    if (!http)
        http = net::makeDefaultHttpClient();

    switch (backend) {
        case RerankBackend::Cloud:
            if (config.cohere_api_key.empty()) {
                return Error{ErrorCode::InvalidArgument, "COHERE_API_KEY not set in environment"};
            }
            return std::unique_ptr<IReranker>(std::make_unique<CohereReranker>(
                config.cohere_api_key, config.cohere_model, config.cohere_url, config.timeout,
                std::move(http)));
        case RerankBackend::LocalSmall:
            return std::unique_ptr<IReranker>(std::make_unique<CrossEncoderHttpReranker>(
                config.local_small_model, config.local_small_url, config.timeout,
                std::move(http)));
        case RerankBackend::LocalLarge:
            return std::unique_ptr<IReranker>(std::make_unique<CrossEncoderHttpReranker>(
                config.local_large_model, config.local_large_url, config.timeout,
                std::move(http)));
    }
    return Error{ErrorCode::InvalidArgument, "Unknown rerank backend"};
}

} // namespace docseek::search
