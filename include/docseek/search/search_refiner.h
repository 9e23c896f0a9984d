#pragma once

#include <docseek/core/types.h>
#include <docseek/ml/provider.h>
#include <docseek/search/keyword_booster.h>
#include <docseek/search/reranker.h>
#include <docseek/search/search_types.h>
#include <docseek/vector/vector_store.h>

#include <stop_token>

namespace docseek::search {

/**
 * @brief Query pipeline combining dense retrieval with lexical precision
 *
 * Stages, in order, each skipped when its flag is unset:
 *  1. Expand: ask the store for top_k * expansion_factor candidates when
 *     rerank or keyword boost is requested, else top_k
 *  2. Embed the query and check its dimension against the store
 *  3. Retrieve with the metadata filter passed through
 *  4. Rerank: one batched call, scores replaced, retrieval rank kept
 *  5. Keyword boost, strictly after rerank
 *  6. Sort by score descending, ties by retrieval rank, and truncate to top_k
 *
 * Collaborators are borrowed and must outlive the refiner. Independent
 * queries share no mutable state.
 */
class HybridSearchRefiner {
public:
    HybridSearchRefiner(ml::IEmbeddingProvider& embedder, vector::IVectorStore& store,
                        RefinerConfig config = {}, IReranker* reranker = nullptr);

    /**
     * @brief Run one query
     *
     * @return Ranked results, or EmbeddingFailure / StoreFailure /
     *         RerankFailure / DimensionMismatch / OperationCancelled. A rerank
     *         failure is only skipped when the query sets allow_degraded.
     */
    Result<SearchResponse> search(const SearchQuery& query, std::stop_token stop = {}) const;

    /**
     * @brief Candidate pool size requested from the store
     */
    size_t candidatePoolSize(const SearchQuery& query) const;

    const RefinerConfig& config() const { return config_; }

private:
    static std::vector<Candidate> toCandidates(std::vector<vector::VectorRecord>&& records);
    static SearchResult toResult(Candidate&& candidate);

    ml::IEmbeddingProvider& embedder_;
    vector::IVectorStore& store_;
    RefinerConfig config_;
    IReranker* reranker_;
    KeywordBooster booster_;
};

} // namespace docseek::search
