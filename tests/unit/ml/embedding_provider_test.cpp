#include <gtest/gtest.h>
#include <docseek/ml/provider.h>
#include <nlohmann/json.hpp>

#include "../../common/fakes.h"

#include <cmath>
#include <memory>
#include <stop_token>

using namespace docseek;
using namespace docseek::ml;
using docseek::tests::FakeHttpClient;
using json = nlohmann::json;

namespace {

std::string embeddingsReply(const std::vector<std::vector<float>>& vectors) {
    json data = json::array();
    // Reverse order so the adapter has to honour "index"
    for (size_t i = vectors.size(); i-- > 0;) {
        data.push_back({{"object", "embedding"}, {"index", i}, {"embedding", vectors[i]}});
    }
    return json{{"object", "list"}, {"data", data}}.dump();
}

EmbeddingConfig testConfig() {
    EmbeddingConfig config;
    config.api_key = "sk-test";
    config.model = "text-embedding-3-small";
    config.dimension = 3;
    config.base_url = "https://example.invalid/v1";
    return config;
}

} // namespace

TEST(OpenAIEmbeddingProviderTest, SendsBatchRequestAndOrdersByIndex) {
    auto http = std::make_shared<FakeHttpClient>();
    http->reply(200, embeddingsReply({{1, 0, 0}, {0, 1, 0}}));

    OpenAIEmbeddingProvider provider(testConfig(), http);
    auto result = provider.generateBatchEmbeddings({"alpha", "beta"});
    ASSERT_TRUE(result) << result.error().message;
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_FLOAT_EQ(result.value()[0][0], 1.0f);
    EXPECT_FLOAT_EQ(result.value()[1][1], 1.0f);

    ASSERT_EQ(http->requests.size(), 1u);
    const auto& request = http->requests[0];
    EXPECT_EQ(request.url, "https://example.invalid/v1/embeddings");
    ASSERT_FALSE(request.headers.empty());
    EXPECT_EQ(request.headers[0], "Authorization: Bearer sk-test");

    auto payload = json::parse(request.body);
    EXPECT_EQ(payload["model"].get<std::string>(), "text-embedding-3-small");
    EXPECT_EQ(payload["input"].size(), 2u);
    EXPECT_EQ(payload["dimensions"].get<int>(), 3);
}

TEST(OpenAIEmbeddingProviderTest, SplitsInputsIntoBatches) {
    auto http = std::make_shared<FakeHttpClient>();
    http->reply(200, embeddingsReply({{1, 0, 0}, {0, 1, 0}}));
    http->reply(200, embeddingsReply({{0, 0, 1}}));

    auto config = testConfig();
    config.batch_size = 2;
    OpenAIEmbeddingProvider provider(config, http);
    auto result = provider.generateBatchEmbeddings({"a", "b", "c"});
    ASSERT_TRUE(result) << result.error().message;
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_FLOAT_EQ(result.value()[2][2], 1.0f);
    EXPECT_EQ(http->requests.size(), 2u);
}

TEST(OpenAIEmbeddingProviderTest, LearnsDimensionForUnknownModel) {
    auto http = std::make_shared<FakeHttpClient>();
    http->reply(200, embeddingsReply({{0.5f, 0.5f, 0.5f, 0.5f}}));

    EmbeddingConfig config;
    config.api_key = "sk-test";
    config.model = "my-finetuned-embedder";
    OpenAIEmbeddingProvider provider(config, http);
    EXPECT_EQ(provider.getEmbeddingDimension(), 0u);

    auto result = provider.generateEmbedding("query");
    ASSERT_TRUE(result);
    EXPECT_EQ(provider.getEmbeddingDimension(), 4u);
    EXPECT_FALSE(json::parse(http->requests[0].body).contains("dimensions"));
}

TEST(OpenAIEmbeddingProviderTest, MapsFailures) {
    auto http = std::make_shared<FakeHttpClient>();
    http->reply(401, R"({"error":{"message":"Incorrect API key provided"}})");
    http->fail(ErrorCode::Timeout, "Operation timed out after 60000 milliseconds");
    http->reply(200, R"({"data": "nope"})");
    http->reply(200, embeddingsReply({{1, 0}}));

    OpenAIEmbeddingProvider provider(testConfig(), http);

    auto status = provider.generateEmbedding("q");
    ASSERT_FALSE(status);
    EXPECT_EQ(status.error().code, ErrorCode::EmbeddingFailure);
    EXPECT_NE(status.error().message.find("Incorrect API key"), std::string::npos);

    auto timeout = provider.generateEmbedding("q");
    ASSERT_FALSE(timeout);
    EXPECT_EQ(timeout.error().code, ErrorCode::EmbeddingFailure);

    auto malformed = provider.generateEmbedding("q");
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().code, ErrorCode::EmbeddingFailure);

    auto wrongDim = provider.generateEmbedding("q");
    ASSERT_FALSE(wrongDim);
    EXPECT_EQ(wrongDim.error().code, ErrorCode::EmbeddingFailure);
}

TEST(OpenAIEmbeddingProviderTest, CancellationIsNotAnEmbeddingFailure) {
    auto http = std::make_shared<FakeHttpClient>();
    OpenAIEmbeddingProvider provider(testConfig(), http);

    std::stop_source source;
    source.request_stop();
    auto result = provider.generateBatchEmbeddings({"a"}, source.get_token());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_TRUE(http->requests.empty());
}

TEST(MockEmbeddingProviderTest, DeterministicUnitVectors) {
    MockEmbeddingProvider provider(64);
    auto a = provider.generateEmbedding("AFIO_MAPR2");
    auto b = provider.generateEmbedding("AFIO_MAPR2");
    auto c = provider.generateEmbedding("GPIOx_CRL");
    ASSERT_TRUE(a && b && c);
    ASSERT_EQ(a.value().size(), 64u);
    EXPECT_EQ(a.value(), b.value());
    EXPECT_NE(a.value(), c.value());

    float norm = 0.0f;
    for (float v : a.value()) {
        norm += v * v;
    }
    EXPECT_NEAR(std::sqrt(norm), 1.0f, 1e-4f);
}

TEST(EmbeddingProviderFactoryTest, SelectsProvider) {
    EmbeddingConfig config;
    config.provider = "openai";
    auto missingKey = createEmbeddingProvider(config, std::make_shared<FakeHttpClient>());
    ASSERT_FALSE(missingKey);
    EXPECT_EQ(missingKey.error().code, ErrorCode::InvalidArgument);

    config.api_key = "sk-test";
    auto openai = createEmbeddingProvider(config, std::make_shared<FakeHttpClient>());
    ASSERT_TRUE(openai);
    EXPECT_EQ(openai.value()->getProviderName(), "OpenAI");
    EXPECT_EQ(openai.value()->getEmbeddingDimension(), 1536u);

    config.provider = "Mock";
    config.dimension = 32;
    auto mock = createEmbeddingProvider(config);
    ASSERT_TRUE(mock);
    EXPECT_EQ(mock.value()->getEmbeddingDimension(), 32u);

    config.provider = "sentence-transformers";
    auto unknown = createEmbeddingProvider(config);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidArgument);
}
