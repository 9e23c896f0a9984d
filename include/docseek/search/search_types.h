#pragma once

#include <docseek/core/types.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docseek::search {

/**
 * @brief Which reranker backend a query asks for
 */
enum class RerankBackend {
    Cloud,      // Cohere rerank API
    LocalSmall, // ms-marco MiniLM cross-encoder
    LocalLarge  // BGE reranker v2 m3
};

const char* rerankBackendToString(RerankBackend backend);

/**
 * @brief One search request
 */
struct SearchQuery {
    std::string text;
    size_t top_k = 5;
    bool rerank = false;
    RerankBackend rerank_backend = RerankBackend::Cloud;
    bool keyword_boost = false;
    MetadataMap filter; // exact key/value matches, ANDed

    // Skip a failed rerank instead of failing the query. The skipped stage
    // is reported in SearchResponse::degraded_stages.
    bool allow_degraded = false;
};

/**
 * @brief Query-scoped wrapper around one retrieved chunk
 */
struct Candidate {
    std::string chunk_id;
    std::string text;
    MetadataMap metadata;
    float score = 0.0f;      // current ranking score
    float base_score = 0.0f; // vector or rerank score before boosting
    float keyword_boost = 0.0f;
    size_t original_rank = 0; // position in the retrieval order
};

/**
 * @brief One ranked answer
 */
struct SearchResult {
    float score = 0.0f;
    std::string source;
    std::optional<std::string> page;
    std::optional<std::string> section;
    std::string chunk_id;
    std::string text;
    MetadataMap metadata;

    float base_score = 0.0f;
    float keyword_boost = 0.0f;
    size_t original_rank = 0;
};

struct SearchResponse {
    std::vector<SearchResult> results;
    std::vector<std::string> degraded_stages;
    size_t candidates_considered = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Tunable constants of the hybrid refiner
 */
struct RefinerConfig {
    size_t expansion_factor = 5;
    float title_boost = 0.20f;
    float key_boost = 0.10f;
    float body_boost = 0.05f;
};

} // namespace docseek::search
