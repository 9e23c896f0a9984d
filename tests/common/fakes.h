// In-memory collaborators for exercising the pipelines without a network
#pragma once

#include <docseek/ml/provider.h>
#include <docseek/net/http_client.h>
#include <docseek/search/reranker.h>
#include <docseek/vector/vector_store.h>

#include <algorithm>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docseek::tests {

/**
 * @brief Embedder returning a fixed vector, optionally failing
 */
class FakeEmbeddingProvider : public ml::IEmbeddingProvider {
public:
    explicit FakeEmbeddingProvider(size_t dimension = 4) : dimension_(dimension) {}

    Result<Embedding> generateEmbedding(const std::string& text,
                                        std::stop_token stop = {}) override {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "cancelled"};
        }
        ++queryCalls;
        lastQuery = text;
        if (failure) {
            return *failure;
        }
        return vectorFor(text);
    }

    Result<std::vector<Embedding>> generateBatchEmbeddings(const std::vector<std::string>& texts,
                                                           std::stop_token stop = {}) override {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "cancelled"};
        }
        ++batchCalls;
        if (failure) {
            return *failure;
        }
        std::vector<Embedding> out;
        for (const auto& t : texts) {
            out.push_back(vectorFor(t));
        }
        return out;
    }

    std::string getProviderName() const override { return "Fake"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

    std::optional<Error> failure;
    size_t queryCalls = 0;
    size_t batchCalls = 0;
    std::string lastQuery;

private:
    Embedding vectorFor(const std::string& text) const {
        Embedding v(dimension_, 0.0f);
        v[text.size() % dimension_] = 1.0f;
        return v;
    }

    size_t dimension_;
};

/**
 * @brief Store serving a fixed, already ranked candidate list
 */
class FakeVectorStore : public vector::IVectorStore {
public:
    Result<void> replaceDocument(const std::string& document_id,
                                 const std::vector<vector::VectorRecord>& records,
                                 std::stop_token = {}) override {
        std::erase_if(results, [&](const auto& r) { return r.document_id == document_id; });
        results.insert(results.end(), records.begin(), records.end());
        return Result<void>();
    }

    Result<std::vector<vector::VectorRecord>> searchSimilar(const Embedding& query, size_t k,
                                                            const MetadataMap& filters = {},
                                                            std::stop_token = {}) override {
        ++searchCalls;
        lastK = k;
        lastFilters = filters;
        lastQuery = query;
        if (failure) {
            return *failure;
        }
        std::vector<vector::VectorRecord> out;
        for (const auto& r : results) {
            if (out.size() >= k)
                break;
            out.push_back(r);
        }
        return out;
    }

    Result<size_t> deleteDocument(const std::string& document_id) override {
        return static_cast<size_t>(std::erase_if(
            results, [&](const auto& r) { return r.document_id == document_id; }));
    }

    Result<std::vector<std::string>> listDocuments() override {
        std::vector<std::string> docs;
        for (const auto& r : results) {
            if (std::find(docs.begin(), docs.end(), r.source) == docs.end())
                docs.push_back(r.source);
        }
        std::sort(docs.begin(), docs.end());
        return docs;
    }

    Result<size_t> count() override { return results.size(); }

    Result<size_t> dimension() override { return storedDimension; }

    // Appends a ranked result with the given cosine score
    void add(const std::string& chunkId, const std::string& content, float score,
             MetadataMap metadata = {}) {
        vector::VectorRecord r;
        r.chunk_id = chunkId;
        r.document_id = chunkId.substr(0, chunkId.find('#'));
        r.content = content;
        r.source = r.document_id;
        r.relevance_score = score;
        r.metadata = std::move(metadata);
        results.push_back(std::move(r));
    }

    std::vector<vector::VectorRecord> results;
    std::optional<Error> failure;
    size_t storedDimension = 4;
    size_t searchCalls = 0;
    size_t lastK = 0;
    MetadataMap lastFilters;
    Embedding lastQuery;
};

/**
 * @brief Reranker scoring documents with a caller-supplied function
 */
class FakeReranker : public search::IReranker {
public:
    using ScoreFn = std::function<Result<std::vector<float>>(const std::vector<std::string>&)>;

    explicit FakeReranker(ScoreFn fn) : fn_(std::move(fn)) {}

    Result<std::vector<float>> scoreDocuments(const std::string&,
                                              const std::vector<std::string>& documents,
                                              std::stop_token stop = {}) override {
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Rerank cancelled"};
        }
        ++calls;
        lastDocuments = documents;
        return fn_(documents);
    }

    bool isReady() const override { return true; }
    std::string name() const override { return "fake"; }

    size_t calls = 0;
    std::vector<std::string> lastDocuments;

private:
    ScoreFn fn_;
};

/**
 * @brief HTTP client replaying queued responses and recording requests
 */
class FakeHttpClient : public net::IHttpClient {
public:
    Result<net::HttpResponse> post(const net::HttpRequest& request,
                                   std::stop_token stop = {}) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (stop.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Request cancelled"};
        }
        if (replies.empty()) {
            return Error{ErrorCode::NetworkError, "no reply queued"};
        }
        auto reply = std::move(replies.front());
        replies.pop_front();
        return reply;
    }

    void reply(long status, std::string body) {
        replies.push_back(Result<net::HttpResponse>(net::HttpResponse{status, std::move(body)}));
    }

    void fail(ErrorCode code, std::string message) {
        replies.push_back(Result<net::HttpResponse>(Error{code, std::move(message)}));
    }

    std::deque<Result<net::HttpResponse>> replies;
    std::vector<net::HttpRequest> requests;

private:
    std::mutex mutex_;
};

} // namespace docseek::tests
