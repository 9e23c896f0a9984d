#pragma once

#include <docseek/chunking/document_chunker.h>
#include <docseek/core/types.h>
#include <docseek/extraction/document_reader.h>
#include <docseek/ml/provider.h>
#include <docseek/vector/vector_store.h>

#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace docseek::ingest {

/**
 * @brief Outcome of ingesting one document
 *
 * A document that yields no chunks (empty, or nothing but TOC noise) is
 * reported with no_content set; that is not an error.
 */
struct IngestReport {
    std::string document_id;
    std::filesystem::path path;
    size_t chunks_written = 0;
    bool no_content = false;
    chunking::ChunkingStats stats;
};

/**
 * @brief Progress callback: (batches_done, batches_total)
 */
using ProgressCallback = std::function<void(size_t, size_t)>;

/**
 * @brief Reads, chunks, embeds and stores documents
 *
 * Re-ingesting a document replaces all of its earlier chunks. Chunk ids are
 * derived from the document id and chunk position, so ingesting an
 * unchanged document again writes identical records.
 */
class IngestionService {
public:
    IngestionService(const extraction::DocumentReaderRegistry& readers,
                     const chunking::DocumentChunker& chunker,
                     ml::IEmbeddingProvider& embedder, vector::IVectorStore& store,
                     size_t embed_batch_size = 100);

    Result<IngestReport> ingestFile(const std::filesystem::path& path,
                                    const MetadataMap& user_metadata = {},
                                    std::stop_token stop = {},
                                    const ProgressCallback& progress = {}) const;

    /**
     * @brief Ingest an already-read document
     */
    Result<IngestReport> ingestDocument(const extraction::RawDocument& document,
                                        const MetadataMap& user_metadata = {},
                                        std::stop_token stop = {},
                                        const ProgressCallback& progress = {}) const;

    /**
     * @brief Ingest independent documents in parallel
     * @return One result per path, in input order
     */
    std::vector<Result<IngestReport>> ingestFiles(const std::vector<std::filesystem::path>& paths,
                                                  const MetadataMap& user_metadata = {},
                                                  std::stop_token stop = {}) const;

private:
    const extraction::DocumentReaderRegistry& readers_;
    const chunking::DocumentChunker& chunker_;
    ml::IEmbeddingProvider& embedder_;
    vector::IVectorStore& store_;
    size_t batchSize_;
};

} // namespace docseek::ingest
