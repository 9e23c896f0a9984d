#include <docseek/vector/sqlite_vector_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <set>

namespace docseek::vector {

using json = nlohmann::json;

namespace {

inline int stepWithRetry(sqlite3_stmt* stmt, int max_attempts = 20) {
    int attempt = 0;
    while (true) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            int exp = std::min(attempt, 7);
            int sleep_ms = 10 * (1 << exp);
            ++attempt;
            if (attempt <= max_attempts) {
                spdlog::warn("sqlite3_step busy/locked (rc={}): retry {}/{} after {} ms", rc,
                             attempt, max_attempts, sleep_ms);
                sqlite3_sleep(sleep_ms);
                continue;
            }
        }
        return rc;
    }
}

// Finalizes the statement on every exit path
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    sqlite3_stmt* get() const { return stmt_; }

    void bindText(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

// RAII transaction guard to ensure transactions are properly rolled back on error
class TransactionGuard {
public:
    explicit TransactionGuard(sqlite3* db) : db_(db) {}
    ~TransactionGuard() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    void commit() { committed_ = true; }

private:
    sqlite3* db_;
    bool committed_ = false;
};

std::string columnText(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

Embedding blobToEmbedding(const void* blob, int bytes) {
    Embedding out(static_cast<size_t>(bytes) / sizeof(float));
    if (!out.empty()) {
        std::memcpy(out.data(), blob, out.size() * sizeof(float));
    }
    return out;
}

float cosineSimilarity(const Embedding& a, const Embedding& b) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0)
        return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

// JSON path for a metadata key, quoted so keys with dots stay one member
std::string jsonPathFor(const std::string& key) {
    std::string path = "$.\"";
    for (char c : key) {
        if (c == '"' || c == '\\')
            path += '\\';
        path += c;
    }
    path += '"';
    return path;
}

// Invalid UTF-8 in metadata values is stored as U+FFFD rather than failing the write
Result<std::string> serializeMetadata(const VectorRecord& record) {
    try {
        json metadata = record.metadata;
        return metadata.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     "Cannot serialize metadata for " + record.chunk_id + ": " + e.what()};
    }
}

} // namespace

SqliteVectorStore::~SqliteVectorStore() {
    close();
}

Result<void> SqliteVectorStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return Error{ErrorCode::InvalidState, "Vector store already open: " + db_path_};
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        return Error{ErrorCode::StoreFailure, "Failed to open vector store " + db_path + ": " + error};
    }
    db_path_ = db_path;

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 10000);
    if (db_path != ":memory:") {
        if (auto r = executeSQL("PRAGMA journal_mode=WAL"); !r) {
            spdlog::debug("WAL not enabled for {}: {}", db_path, r.error().message);
        }
    }

    if (auto r = createTables(); !r) {
        sqlite3_close(db_);
        db_ = nullptr;
        return r;
    }

    auto dim = loadDimension();
    if (!dim) {
        sqlite3_close(db_);
        db_ = nullptr;
        return dim.error();
    }
    dimension_ = dim.value();

    spdlog::debug("Opened vector store {} (dimension {})", db_path, dimension_);
    return Result<void>();
}

void SqliteVectorStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteVectorStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Result<void> SqliteVectorStore::createTables() {
    static const char* kSchema = R"SQL(
        CREATE TABLE IF NOT EXISTS store_meta (
            key   TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS chunks (
            chunk_id    TEXT PRIMARY KEY,
            document_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            content     TEXT NOT NULL,
            source      TEXT NOT NULL,
            location    TEXT,
            metadata    TEXT NOT NULL,
            embedding   BLOB NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_chunks_document ON chunks(document_id);
        CREATE INDEX IF NOT EXISTS idx_chunks_source ON chunks(source);
    )SQL";
    return executeSQL(kSchema);
}

Result<size_t> SqliteVectorStore::loadDimension() {
    Statement stmt(db_, "SELECT value FROM store_meta WHERE key = 'dimension'");
    if (!stmt.ok()) {
        return storeError("Failed to read store dimension");
    }
    if (stepWithRetry(stmt.get()) == SQLITE_ROW) {
        try {
            return static_cast<size_t>(std::stoull(columnText(stmt.get(), 0)));
        } catch (const std::exception&) {
            return Error{ErrorCode::StoreFailure, "Corrupt dimension entry in " + db_path_};
        }
    }
    return size_t{0};
}

Result<void> SqliteVectorStore::storeDimension(size_t dim) {
    Statement stmt(db_, "INSERT OR REPLACE INTO store_meta (key, value) VALUES ('dimension', ?)");
    if (!stmt.ok()) {
        return storeError("Failed to prepare dimension update");
    }
    stmt.bindText(1, std::to_string(dim));
    if (stepWithRetry(stmt.get()) != SQLITE_DONE) {
        return storeError("Failed to record store dimension");
    }
    return Result<void>();
}

Result<void> SqliteVectorStore::replaceDocument(const std::string& document_id,
                                                const std::vector<VectorRecord>& records,
                                                std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Store write cancelled"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::StoreFailure, "Vector store not open"};
    }

    size_t batchDim = records.empty() ? 0 : records.front().embedding.size();
    for (const auto& record : records) {
        if (record.embedding.size() != batchDim || batchDim == 0) {
            return Error{ErrorCode::DimensionMismatch,
                         "Record " + record.chunk_id + " has dimension " +
                             std::to_string(record.embedding.size()) + ", batch uses " +
                             std::to_string(batchDim)};
        }
        if (record.document_id != document_id) {
            return Error{ErrorCode::InvalidArgument,
                         "Record " + record.chunk_id + " belongs to " + record.document_id};
        }
    }
    if (dimension_ != 0 && batchDim != 0 && batchDim != dimension_) {
        return Error{ErrorCode::DimensionMismatch,
                     "Embeddings have dimension " + std::to_string(batchDim) +
                         " but the store holds dimension " + std::to_string(dimension_)};
    }

    std::vector<std::string> metadataJson;
    metadataJson.reserve(records.size());
    for (const auto& record : records) {
        auto serialized = serializeMetadata(record);
        if (!serialized) {
            return serialized.error();
        }
        metadataJson.push_back(std::move(serialized).value());
    }

    if (auto r = executeSQL("BEGIN IMMEDIATE TRANSACTION"); !r) {
        return r;
    }
    TransactionGuard guard(db_);

    auto removed = deleteDocumentLocked(document_id);
    if (!removed) {
        return removed.error();
    }

    if (dimension_ == 0 && batchDim != 0) {
        if (auto r = storeDimension(batchDim); !r) {
            return r;
        }
    }

    Statement insert(db_, "INSERT OR REPLACE INTO chunks "
                          "(chunk_id, document_id, chunk_index, content, source, location, "
                          "metadata, embedding) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    if (!insert.ok()) {
        return storeError("Failed to prepare chunk insert");
    }

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        sqlite3_reset(insert.get());
        sqlite3_clear_bindings(insert.get());
        insert.bindText(1, record.chunk_id);
        insert.bindText(2, record.document_id);
        sqlite3_bind_int64(insert.get(), 3, static_cast<sqlite3_int64>(record.chunk_index));
        insert.bindText(4, record.content);
        insert.bindText(5, record.source);
        insert.bindText(6, record.location);
        insert.bindText(7, metadataJson[i]);
        sqlite3_bind_blob(insert.get(), 8, record.embedding.data(),
                          static_cast<int>(record.embedding.size() * sizeof(float)),
                          SQLITE_TRANSIENT);

        if (stepWithRetry(insert.get()) != SQLITE_DONE) {
            return storeError("Failed to insert chunk " + record.chunk_id);
        }
    }

    if (auto r = executeSQL("COMMIT"); !r) {
        return r;
    }
    guard.commit();

    if (dimension_ == 0) {
        dimension_ = batchDim;
    }
    spdlog::debug("Stored {} chunks for {} (replaced {})", records.size(), document_id,
                  removed.value());
    return Result<void>();
}

Result<std::vector<VectorRecord>> SqliteVectorStore::searchSimilar(const Embedding& query,
                                                                   size_t k,
                                                                   const MetadataMap& filters,
                                                                   std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Store search cancelled"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::StoreFailure, "Vector store not open"};
    }
    if (dimension_ == 0 || k == 0) {
        return std::vector<VectorRecord>{};
    }
    if (query.size() != dimension_) {
        return Error{ErrorCode::DimensionMismatch,
                     "Query embedding has dimension " + std::to_string(query.size()) +
                         " but the store holds dimension " + std::to_string(dimension_)};
    }

    std::string sql = "SELECT chunk_id, document_id, chunk_index, content, source, location, "
                      "metadata, embedding FROM chunks";
    for (size_t i = 0; i < filters.size(); ++i) {
        sql += i == 0 ? " WHERE " : " AND ";
        sql += "json_extract(metadata, ?) = ?";
    }
    sql += " ORDER BY rowid";

    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) {
        return storeError("Failed to prepare similarity search");
    }
    int idx = 1;
    for (const auto& [key, value] : filters) {
        stmt.bindText(idx++, jsonPathFor(key));
        stmt.bindText(idx++, value);
    }

    std::vector<VectorRecord> scored;
    int rc;
    while ((rc = stepWithRetry(stmt.get())) == SQLITE_ROW) {
        auto* st = stmt.get();
        Embedding embedding =
            blobToEmbedding(sqlite3_column_blob(st, 7), sqlite3_column_bytes(st, 7));
        if (embedding.size() != query.size()) {
            continue;
        }

        VectorRecord record;
        record.chunk_id = columnText(st, 0);
        record.document_id = columnText(st, 1);
        record.chunk_index = static_cast<size_t>(sqlite3_column_int64(st, 2));
        record.content = columnText(st, 3);
        record.source = columnText(st, 4);
        record.location = columnText(st, 5);
        try {
            auto metadata = json::parse(columnText(st, 6));
            for (auto it = metadata.begin(); it != metadata.end(); ++it) {
                record.metadata[it.key()] =
                    it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            }
        } catch (const json::exception& e) {
            spdlog::warn("Skipping unreadable metadata for {}: {}", record.chunk_id, e.what());
        }
        record.relevance_score = cosineSimilarity(query, embedding);
        scored.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return storeError("Similarity search failed");
    }

    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.relevance_score > b.relevance_score;
    });
    if (scored.size() > k) {
        scored.resize(k);
    }
    return scored;
}

Result<size_t> SqliteVectorStore::deleteDocument(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::StoreFailure, "Vector store not open"};
    }
    return deleteDocumentLocked(document_id);
}

Result<size_t> SqliteVectorStore::deleteDocumentLocked(const std::string& document_id) {
    Statement stmt(db_, "DELETE FROM chunks WHERE document_id = ?");
    if (!stmt.ok()) {
        return storeError("Failed to prepare document delete");
    }
    stmt.bindText(1, document_id);
    if (stepWithRetry(stmt.get()) != SQLITE_DONE) {
        return storeError("Failed to delete document " + document_id);
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

Result<std::vector<std::string>> SqliteVectorStore::listDocuments() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::StoreFailure, "Vector store not open"};
    }

    Statement stmt(db_, "SELECT DISTINCT source FROM chunks ORDER BY source");
    if (!stmt.ok()) {
        return storeError("Failed to prepare document listing");
    }
    std::vector<std::string> sources;
    int rc;
    while ((rc = stepWithRetry(stmt.get())) == SQLITE_ROW) {
        sources.push_back(columnText(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        return storeError("Failed to list documents");
    }
    return sources;
}

Result<size_t> SqliteVectorStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::StoreFailure, "Vector store not open"};
    }

    Statement stmt(db_, "SELECT COUNT(*) FROM chunks");
    if (!stmt.ok() || stepWithRetry(stmt.get()) != SQLITE_ROW) {
        return storeError("Failed to count chunks");
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

Result<size_t> SqliteVectorStore::dimension() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Error{ErrorCode::StoreFailure, "Vector store not open"};
    }
    return dimension_;
}

Result<void> SqliteVectorStore::executeSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return Error{ErrorCode::StoreFailure, "SQL execution failed: " + error};
    }
    return Result<void>();
}

Error SqliteVectorStore::storeError(const std::string& what) const {
    return Error{ErrorCode::StoreFailure, what + ": " + sqlite3_errmsg(db_)};
}

} // namespace docseek::vector
