#pragma once

#include <docseek/vector/vector_store.h>

#include <mutex>
#include <string>

struct sqlite3;

namespace docseek::vector {

/**
 * @brief SQLite-backed vector store
 *
 * Embeddings are float32 BLOBs and metadata is a JSON object per row.
 * Search is an exhaustive cosine scan over the rows that pass the metadata
 * filter (`json_extract`); there is no approximate index. Pass ":memory:"
 * as the path for a private in-memory database.
 */
class SqliteVectorStore : public IVectorStore {
public:
    SqliteVectorStore() = default;
    ~SqliteVectorStore() override;

    SqliteVectorStore(const SqliteVectorStore&) = delete;
    SqliteVectorStore& operator=(const SqliteVectorStore&) = delete;

    /**
     * @brief Open (creating if needed) the database file and its schema
     */
    Result<void> open(const std::string& db_path);
    void close();
    bool isOpen() const;

    Result<void> replaceDocument(const std::string& document_id,
                                 const std::vector<VectorRecord>& records,
                                 std::stop_token stop = {}) override;
    Result<std::vector<VectorRecord>> searchSimilar(const Embedding& query, size_t k,
                                                    const MetadataMap& filters = {},
                                                    std::stop_token stop = {}) override;
    Result<size_t> deleteDocument(const std::string& document_id) override;
    Result<std::vector<std::string>> listDocuments() override;
    Result<size_t> count() override;
    Result<size_t> dimension() override;

private:
    Result<void> executeSQL(const std::string& sql);
    Result<void> createTables();
    Result<size_t> loadDimension();
    Result<void> storeDimension(size_t dim);
    Result<size_t> deleteDocumentLocked(const std::string& document_id);
    Error storeError(const std::string& what) const;

    sqlite3* db_ = nullptr;
    std::string db_path_;
    size_t dimension_ = 0;
    mutable std::mutex mutex_;
};

} // namespace docseek::vector
