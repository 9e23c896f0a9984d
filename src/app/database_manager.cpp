#include <docseek/app/database_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace docseek::app {

namespace fs = std::filesystem;

DatabaseManager::DatabaseManager(fs::path dataDir) : dataDir_(std::move(dataDir)) {}

Result<void> DatabaseManager::validateName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return Error{ErrorCode::InvalidArgument, "Invalid database name: '" + name + "'"};
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid database name '" + name +
                             "': use letters, digits, '-', '_' or '.'"};
        }
    }
    return Result<void>();
}

fs::path DatabaseManager::databasePath(const std::string& name) const {
    return databasesDir() / name;
}

Result<void> DatabaseManager::create(const std::string& name) const {
    if (auto r = validateName(name); !r) {
        return r;
    }
    if (exists(name)) {
        return Error{ErrorCode::AlreadyExists, "Database '" + name + "' already exists"};
    }

    std::error_code ec;
    fs::create_directories(databasePath(name), ec);
    if (ec) {
        return Error{ErrorCode::StoreFailure,
                     "Failed to create " + databasePath(name).string() + ": " + ec.message()};
    }

    // Opening creates the schema
    vector::SqliteVectorStore store;
    if (auto r = store.open((databasePath(name) / kStoreFileName).string()); !r) {
        fs::remove_all(databasePath(name), ec);
        return r;
    }
    spdlog::info("Created database '{}' at {}", name, databasePath(name).string());
    return Result<void>();
}

bool DatabaseManager::exists(const std::string& name) const {
    if (!validateName(name)) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(databasePath(name), ec);
}

Result<std::vector<std::string>> DatabaseManager::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::exists(databasesDir(), ec)) {
        return names;
    }

    for (const auto& entry : fs::directory_iterator(databasesDir(), ec)) {
        if (entry.is_directory(ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        return Error{ErrorCode::StoreFailure,
                     "Failed to list " + databasesDir().string() + ": " + ec.message()};
    }
    std::sort(names.begin(), names.end());
    return names;
}

Result<void> DatabaseManager::remove(const std::string& name) const {
    if (!exists(name)) {
        return Error{ErrorCode::NotFound, "Database '" + name + "' not found"};
    }
    std::error_code ec;
    fs::remove_all(databasePath(name), ec);
    if (ec) {
        return Error{ErrorCode::StoreFailure, "Failed to delete database '" + name +
                                                  "': " + ec.message()};
    }
    spdlog::info("Deleted database '{}'", name);
    return Result<void>();
}

Result<std::unique_ptr<vector::SqliteVectorStore>>
DatabaseManager::open(const std::string& name) const {
    if (!exists(name)) {
        return Error{ErrorCode::NotFound, "Database '" + name +
                                              "' not found. Create it with: docseek create-db " +
                                              name};
    }
    auto store = std::make_unique<vector::SqliteVectorStore>();
    if (auto r = store->open((databasePath(name) / kStoreFileName).string()); !r) {
        return r.error();
    }
    return store;
}

} // namespace docseek::app
