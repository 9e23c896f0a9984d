#include <docseek/ml/provider.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace docseek::ml {

using json = nlohmann::json;

namespace {

// Pull "error.message" out of an OpenAI error body when there is one
std::string describeFailure(const net::HttpResponse& response) {
    try {
        auto body = json::parse(response.body);
        if (body.contains("error") && body["error"].contains("message")) {
            return body["error"]["message"].get<std::string>();
        }
    } catch (const json::exception&) {
    }
    return response.body.substr(0, 200);
}

} // namespace

size_t defaultDimensionForModel(const std::string& model) {
    if (model == "text-embedding-3-small" || model == "text-embedding-ada-002")
        return 1536;
    if (model == "text-embedding-3-large")
        return 3072;
    return 0;
}

OpenAIEmbeddingProvider::OpenAIEmbeddingProvider(EmbeddingConfig config,
                                                 std::shared_ptr<net::IHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    dimension_ = config_.dimension ? config_.dimension : defaultDimensionForModel(config_.model);
    if (config_.batch_size == 0)
        config_.batch_size = 100;
    spdlog::debug("OpenAIEmbeddingProvider model={} dim={} batch={}", config_.model,
                  dimension_.load(), config_.batch_size);
}

Result<Embedding> OpenAIEmbeddingProvider::generateEmbedding(const std::string& text,
                                                             std::stop_token stop) {
    auto result = requestBatch({text}, stop);
    if (!result)
        return result.error();
    return std::move(result.value().front());
}

Result<std::vector<Embedding>>
OpenAIEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts,
                                                 std::stop_token stop) {
    std::vector<Embedding> all;
    all.reserve(texts.size());

    for (size_t start = 0; start < texts.size(); start += config_.batch_size) {
        size_t end = std::min(texts.size(), start + config_.batch_size);
        std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
        auto result = requestBatch(batch, stop);
        if (!result)
            return result.error();
        for (auto& e : result.value())
            all.push_back(std::move(e));
    }
    return all;
}

Result<std::vector<Embedding>>
OpenAIEmbeddingProvider::requestBatch(const std::vector<std::string>& texts, std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Embedding cancelled"};
    }
    if (texts.empty()) {
        return std::vector<Embedding>{};
    }

    json payload = {{"model", config_.model}, {"input", texts}};
    if (config_.dimension) {
        payload["dimensions"] = config_.dimension;
    }

    net::HttpRequest request;
    request.url = config_.base_url + "/embeddings";
    request.headers.push_back("Authorization: Bearer " + config_.api_key);
    request.body = payload.dump();
    request.timeout = config_.timeout;

    auto response = http_->post(request, stop);
    if (!response) {
        if (response.error().code == ErrorCode::OperationCancelled)
            return response.error();
        return Error{ErrorCode::EmbeddingFailure,
                     "OpenAI request failed: " + response.error().message};
    }
    if (response.value().status != 200) {
        return Error{ErrorCode::EmbeddingFailure,
                     "OpenAI returned HTTP " + std::to_string(response.value().status) + ": " +
                         describeFailure(response.value())};
    }

    try {
        auto body = json::parse(response.value().body);
        const auto& data = body.at("data");
        if (data.size() != texts.size()) {
            return Error{ErrorCode::EmbeddingFailure,
                         "OpenAI returned " + std::to_string(data.size()) + " embeddings for " +
                             std::to_string(texts.size()) + " inputs"};
        }

        std::vector<Embedding> out(texts.size());
        for (const auto& item : data) {
            auto index = item.value("index", size_t{0});
            if (index >= out.size()) {
                return Error{ErrorCode::EmbeddingFailure, "OpenAI returned an out-of-range index"};
            }
            out[index] = item.at("embedding").get<Embedding>();
            size_t expected = 0;
            if (dimension_.compare_exchange_strong(expected, out[index].size())) {
                continue;
            }
            if (out[index].size() != expected) {
                return Error{ErrorCode::EmbeddingFailure,
                             "OpenAI returned dimension " + std::to_string(out[index].size()) +
                                 ", expected " + std::to_string(expected)};
            }
        }
        return out;
    } catch (const json::exception& e) {
        return Error{ErrorCode::EmbeddingFailure,
                     std::string("Malformed OpenAI response: ") + e.what()};
    }
}

Result<std::unique_ptr<IEmbeddingProvider>>
createEmbeddingProvider(const EmbeddingConfig& config, std::shared_ptr<net::IHttpClient> http) {
    std::string name = config.provider;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "openai") {
        if (config.api_key.empty()) {
            return Error{ErrorCode::InvalidArgument, "OPENAI_API_KEY not set in environment"};
        }
        if (!http)
            http = net::makeDefaultHttpClient();
        return std::unique_ptr<IEmbeddingProvider>(
            std::make_unique<OpenAIEmbeddingProvider>(config, std::move(http)));
    }
    if (name == "mock") {
        return std::unique_ptr<IEmbeddingProvider>(
            std::make_unique<MockEmbeddingProvider>(config.dimension ? config.dimension : 384));
    }
    return Error{ErrorCode::InvalidArgument, "Unsupported embedding provider: " + config.provider};
}

} // namespace docseek::ml
