#pragma once

#include <docseek/chunking/chunking_config.h>
#include <docseek/config/config_helpers.h>
#include <docseek/core/types.h>
#include <docseek/ml/provider.h>
#include <docseek/search/reranker.h>
#include <docseek/search/search_types.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace docseek::config {

struct StorageSettings {
    std::filesystem::path data_dir;
};

/**
 * @brief Everything configurable, resolved once at startup
 *
 * Built by loadSettings() and passed by const reference afterwards.
 */
struct Settings {
    chunking::ChunkingConfig chunking;
    search::RefinerConfig refiner;
    ml::EmbeddingConfig embedding;
    search::RerankConfig rerank;
    StorageSettings storage;
    size_t top_k = 5;

    // File the values were read from, empty when none existed
    std::filesystem::path config_file;
};

/**
 * @brief Environment lookup, replaceable in tests
 */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> processEnvironment(const std::string& name);

/**
 * @brief Resolve settings: defaults, then the config file, then environment
 *
 * Environment variables: EMBEDDING_PROVIDER, EMBEDDING_MODEL,
 * OPENAI_API_KEY, COHERE_API_KEY, CHUNK_SIZE, CHUNK_OVERLAP, TOP_K_RESULTS,
 * DOCSEEK_DATA_DIR.
 *
 * @param configPath explicit config file, or empty for the XDG default
 * @return Settings, InvalidArgument for values that do not parse or are out
 *         of range, InvalidData for a malformed config file
 */
Result<Settings> loadSettings(const std::filesystem::path& configPath = {},
                              const EnvLookup& env = processEnvironment);

/**
 * @brief Apply "section.key" values on top of @p settings
 */
Result<void> applyConfigValues(Settings& settings, const ConfigValues& values);

} // namespace docseek::config
