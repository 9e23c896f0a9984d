#pragma once

#include <docseek/core/types.h>
#include <docseek/vector/sqlite_vector_store.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace docseek::app {

/**
 * @brief Named vector databases under <data_dir>/databases/<name>/vectors.db
 */
class DatabaseManager {
public:
    explicit DatabaseManager(std::filesystem::path dataDir);

    /**
     * @brief Create an empty database
     * @return AlreadyExists when the name is taken, InvalidArgument for a bad name
     */
    Result<void> create(const std::string& name) const;

    bool exists(const std::string& name) const;

    /**
     * @brief Database names, sorted
     */
    Result<std::vector<std::string>> list() const;

    /**
     * @brief Delete a database and all of its files
     * @return NotFound when there is no such database
     */
    Result<void> remove(const std::string& name) const;

    /**
     * @brief Open an existing database's vector store
     */
    Result<std::unique_ptr<vector::SqliteVectorStore>> open(const std::string& name) const;

    std::filesystem::path databasePath(const std::string& name) const;
    const std::filesystem::path& dataDir() const { return dataDir_; }

    static constexpr const char* kStoreFileName = "vectors.db";

    /**
     * @brief Names are non-empty and limited to letters, digits, '-', '_' and '.'
     */
    static Result<void> validateName(const std::string& name);

private:
    std::filesystem::path databasesDir() const { return dataDir_ / "databases"; }

    std::filesystem::path dataDir_;
};

} // namespace docseek::app
