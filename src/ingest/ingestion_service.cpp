#include <docseek/ingest/ingestion_service.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace docseek::ingest {

namespace {

std::string locationOf(const chunking::Chunk& chunk) {
    if (chunk.page) {
        return std::to_string(*chunk.page);
    }
    return chunk.section;
}

} // namespace

IngestionService::IngestionService(const extraction::DocumentReaderRegistry& readers,
                                   const chunking::DocumentChunker& chunker,
                                   ml::IEmbeddingProvider& embedder, vector::IVectorStore& store,
                                   size_t embed_batch_size)
    : readers_(readers), chunker_(chunker), embedder_(embedder), store_(store),
      batchSize_(std::max<size_t>(embed_batch_size, 1)) {}

Result<IngestReport> IngestionService::ingestFile(const std::filesystem::path& path,
                                                  const MetadataMap& user_metadata,
                                                  std::stop_token stop,
                                                  const ProgressCallback& progress) const {
    auto reader = readers_.forPath(path);
    if (!reader) {
        return reader.error();
    }

    auto document = reader.value()->read(path);
    if (!document) {
        return document.error();
    }

    auto report = ingestDocument(document.value(), user_metadata, stop, progress);
    if (report) {
        report.value().path = path;
    }
    return report;
}

Result<IngestReport> IngestionService::ingestDocument(const extraction::RawDocument& document,
                                                      const MetadataMap& user_metadata,
                                                      std::stop_token stop,
                                                      const ProgressCallback& progress) const {
    IngestReport report;
    report.document_id = document.document_id;

    auto chunks = chunker_.chunkDocument(document, user_metadata, &report.stats);

    if (chunks.empty()) {
        report.no_content = true;
        spdlog::info("No content extracted from {}", document.document_id);
        // Drop what an earlier version of the document left behind
        auto removed = store_.deleteDocument(document.document_id);
        if (!removed) {
            return removed.error();
        }
        return report;
    }

    std::vector<std::string> texts;
    texts.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        texts.push_back(chunk.text());
    }

    std::vector<Embedding> embeddings;
    embeddings.reserve(texts.size());
    const size_t totalBatches = (texts.size() + batchSize_ - 1) / batchSize_;
    for (size_t batch = 0; batch < totalBatches; ++batch) {
        if (progress) {
            progress(batch + 1, totalBatches);
        }
        size_t begin = batch * batchSize_;
        size_t end = std::min(texts.size(), begin + batchSize_);
        std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));

        auto result = embedder_.generateBatchEmbeddings(slice, stop);
        if (!result) {
            return result.error();
        }
        if (result.value().size() != slice.size()) {
            return Error{ErrorCode::EmbeddingFailure,
                         "Embedding provider returned " + std::to_string(result.value().size()) +
                             " vectors for " + std::to_string(slice.size()) + " texts"};
        }
        for (auto& e : result.value()) {
            embeddings.push_back(std::move(e));
        }
    }

    std::vector<vector::VectorRecord> records;
    records.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        vector::VectorRecord record;
        record.chunk_id = chunk.chunkId();
        record.document_id = chunk.document_id;
        record.chunk_index = chunk.document_ordinal;
        record.content = std::move(texts[i]);
        record.embedding = std::move(embeddings[i]);
        record.source = chunk.source;
        record.location = locationOf(chunk);
        record.metadata = chunk.metadata();
        records.push_back(std::move(record));
    }

    auto stored = store_.replaceDocument(document.document_id, records, stop);
    if (!stored) {
        return stored.error();
    }

    report.chunks_written = records.size();
    spdlog::info("Ingested {}: {} chunks ({} register definitions, {} overviews)",
                 document.document_id, report.chunks_written, report.stats.register_definitions,
                 report.stats.overviews);
    return report;
}

std::vector<Result<IngestReport>>
IngestionService::ingestFiles(const std::vector<std::filesystem::path>& paths,
                              const MetadataMap& user_metadata, std::stop_token stop) const {
    std::vector<std::future<Result<IngestReport>>> futures;
    futures.reserve(paths.size());
    for (const auto& path : paths) {
        futures.push_back(std::async(std::launch::async, [this, path, &user_metadata, stop] {
            return ingestFile(path, user_metadata, stop);
        }));
    }

    std::vector<Result<IngestReport>> results;
    results.reserve(paths.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            results.push_back(Error{ErrorCode::InternalError,
                                    "Ingestion of " + paths[i].string() + " failed: " + e.what()});
        }
    }
    return results;
}

} // namespace docseek::ingest
