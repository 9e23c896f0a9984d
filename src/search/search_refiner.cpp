#include <docseek/search/search_refiner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace docseek::search {

HybridSearchRefiner::HybridSearchRefiner(ml::IEmbeddingProvider& embedder,
                                         vector::IVectorStore& store, RefinerConfig config,
                                         IReranker* reranker)
    : embedder_(embedder), store_(store), config_(config), reranker_(reranker),
      booster_(config) {}

size_t HybridSearchRefiner::candidatePoolSize(const SearchQuery& query) const {
    if (query.rerank || query.keyword_boost) {
        return query.top_k * std::max<size_t>(config_.expansion_factor, 1);
    }
    return query.top_k;
}

Result<SearchResponse> HybridSearchRefiner::search(const SearchQuery& query,
                                                   std::stop_token stop) const {
    auto start = std::chrono::steady_clock::now();

    if (query.text.empty()) {
        return Error{ErrorCode::InvalidArgument, "Query text is empty"};
    }
    if (query.top_k == 0) {
        return Error{ErrorCode::InvalidArgument, "top_k must be at least 1"};
    }
    if (query.rerank && !reranker_) {
        return Error{ErrorCode::InvalidState, "Rerank requested but no reranker configured"};
    }

    SearchResponse response;

    // Expand
    const size_t pool = candidatePoolSize(query);

    // Embed
    auto queryEmbedding = embedder_.generateEmbedding(query.text, stop);
    if (!queryEmbedding) {
        return queryEmbedding.error();
    }

    auto storeDim = store_.dimension();
    if (!storeDim) {
        return storeDim.error();
    }
    if (storeDim.value() != 0 && storeDim.value() != queryEmbedding.value().size()) {
        return Error{ErrorCode::DimensionMismatch,
                     "Incompatible embedding provider: " + embedder_.getProviderName() +
                         " produces dimension " +
                         std::to_string(queryEmbedding.value().size()) +
                         " but the store holds dimension " + std::to_string(storeDim.value())};
    }

    // Retrieve
    auto records = store_.searchSimilar(queryEmbedding.value(), pool, query.filter, stop);
    if (!records) {
        return records.error();
    }
    auto candidates = toCandidates(std::move(records.value()));
    response.candidates_considered = candidates.size();
    spdlog::debug("Retrieved {} of {} requested candidates", candidates.size(), pool);

    // Rerank
    if (query.rerank && !candidates.empty()) {
        std::vector<std::string> texts;
        texts.reserve(candidates.size());
        for (const auto& c : candidates) {
            texts.push_back(c.text);
        }

        auto scores = reranker_->scoreDocuments(query.text, texts, stop);
        if (scores && scores.value().size() != candidates.size()) {
            scores = Error{ErrorCode::RerankFailure,
                           "Reranker returned " + std::to_string(scores.value().size()) +
                               " scores for " + std::to_string(candidates.size()) +
                               " candidates"};
        }

        if (scores) {
            for (size_t i = 0; i < candidates.size(); ++i) {
                candidates[i].score = scores.value()[i];
                candidates[i].base_score = scores.value()[i];
            }
        } else if (query.allow_degraded &&
                   scores.error().code != ErrorCode::OperationCancelled) {
            spdlog::warn("Rerank with {} failed, continuing without it: {}", reranker_->name(),
                         scores.error().message);
            response.degraded_stages.push_back("rerank");
        } else {
            return scores.error();
        }
    }

    // Keyword boost
    if (query.keyword_boost) {
        booster_.apply(query.text, candidates);
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.original_rank < b.original_rank;
    });

    // Truncate
    if (candidates.size() > query.top_k) {
        candidates.resize(query.top_k);
    }

    response.results.reserve(candidates.size());
    for (auto& c : candidates) {
        response.results.push_back(toResult(std::move(c)));
    }

    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return response;
}

std::vector<Candidate>
HybridSearchRefiner::toCandidates(std::vector<vector::VectorRecord>&& records) {
    std::vector<Candidate> candidates;
    candidates.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        auto& record = records[i];
        Candidate c;
        c.chunk_id = std::move(record.chunk_id);
        c.text = std::move(record.content);
        c.metadata = std::move(record.metadata);
        if (!c.metadata.count("source")) {
            c.metadata["source"] = record.source;
        }
        c.score = record.relevance_score;
        c.base_score = record.relevance_score;
        c.original_rank = i;
        candidates.push_back(std::move(c));
    }
    return candidates;
}

SearchResult HybridSearchRefiner::toResult(Candidate&& candidate) {
    SearchResult result;
    result.score = candidate.score;
    result.chunk_id = std::move(candidate.chunk_id);
    result.text = std::move(candidate.text);
    result.base_score = candidate.base_score;
    result.keyword_boost = candidate.keyword_boost;
    result.original_rank = candidate.original_rank;

    if (auto it = candidate.metadata.find("source"); it != candidate.metadata.end()) {
        result.source = it->second;
    }
    if (auto it = candidate.metadata.find("page"); it != candidate.metadata.end()) {
        result.page = it->second;
    }
    if (auto it = candidate.metadata.find("section"); it != candidate.metadata.end()) {
        result.section = it->second;
    }
    result.metadata = std::move(candidate.metadata);
    return result;
}

} // namespace docseek::search
