#pragma once

#include <docseek/core/types.h>

#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

namespace docseek::vector {

/**
 * @brief One persisted chunk: stored text, its embedding and flat metadata
 */
struct VectorRecord {
    std::string chunk_id; // "<document_id>#<chunk_index>"
    std::string document_id;
    size_t chunk_index = 0;
    std::string content;
    Embedding embedding;
    std::string source;
    std::string location; // page number or section heading
    MetadataMap metadata;

    // Cosine similarity to the query, filled by searchSimilar()
    float relevance_score = 0.0f;
};

/**
 * @brief Abstract interface for the vector store collaborator
 *
 * The store remembers the embedding dimension of its first write and
 * rejects writes and queries of any other dimension with DimensionMismatch.
 * All other failures are StoreFailure.
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    /**
     * @brief Replace every record of a document with the given records
     *
     * Deleting and inserting happen in one transaction, so a reader sees
     * either the old or the new chunks of the document.
     */
    virtual Result<void> replaceDocument(const std::string& document_id,
                                         const std::vector<VectorRecord>& records,
                                         std::stop_token stop = {}) = 0;

    /**
     * @brief Nearest records by cosine similarity, best first
     *
     * @param filters exact key/value matches on record metadata, ANDed
     */
    virtual Result<std::vector<VectorRecord>> searchSimilar(const Embedding& query, size_t k,
                                                            const MetadataMap& filters = {},
                                                            std::stop_token stop = {}) = 0;

    /**
     * @brief Delete all records of a document
     * @return Number of records removed
     */
    virtual Result<size_t> deleteDocument(const std::string& document_id) = 0;

    /**
     * @brief Distinct document sources, sorted
     */
    virtual Result<std::vector<std::string>> listDocuments() = 0;

    virtual Result<size_t> count() = 0;

    /**
     * @brief Recorded embedding dimension, 0 while the store is empty
     */
    virtual Result<size_t> dimension() = 0;
};

} // namespace docseek::vector
