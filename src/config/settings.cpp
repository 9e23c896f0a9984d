#include <docseek/config/settings.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>

namespace docseek::config {

namespace {

Result<size_t> parseSize(const std::string& key, const std::string& raw) {
    std::string value = raw;
    trim(value);
    size_t out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for " + key + ": '" + raw + "' (expected a whole number)"};
    }
    return out;
}

Result<float> parseFloat(const std::string& key, const std::string& raw) {
    std::string value = raw;
    trim(value);
    try {
        size_t used = 0;
        float out = std::stof(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return out;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for " + key + ": '" + raw + "' (expected a number)"};
    }
}

// Setters keyed by "section.key"
using Setter = std::function<Result<void>(Settings&, const std::string& key, const std::string&)>;

template <typename T> Setter sizeField(T Settings::*group, size_t T::*field) {
    return [group, field](Settings& s, const std::string& key, const std::string& v) -> Result<void> {
        auto parsed = parseSize(key, v);
        if (!parsed)
            return parsed.error();
        (s.*group).*field = parsed.value();
        return Result<void>();
    };
}

template <typename T> Setter floatField(T Settings::*group, float T::*field) {
    return [group, field](Settings& s, const std::string& key, const std::string& v) -> Result<void> {
        auto parsed = parseFloat(key, v);
        if (!parsed)
            return parsed.error();
        (s.*group).*field = parsed.value();
        return Result<void>();
    };
}

template <typename T> Setter stringField(T Settings::*group, std::string T::*field) {
    return [group, field](Settings& s, const std::string&, const std::string& v) -> Result<void> {
        (s.*group).*field = v;
        return Result<void>();
    };
}

template <typename T>
Setter msField(T Settings::*group, std::chrono::milliseconds T::*field) {
    return [group, field](Settings& s, const std::string& key, const std::string& v) -> Result<void> {
        auto parsed = parseSize(key, v);
        if (!parsed)
            return parsed.error();
        (s.*group).*field = std::chrono::milliseconds(parsed.value());
        return Result<void>();
    };
}

const std::map<std::string, Setter>& setters() {
    using chunking::ChunkingConfig;
    using ml::EmbeddingConfig;
    using search::RefinerConfig;
    using search::RerankConfig;

    static const std::map<std::string, Setter> table = {
        {"chunking.size", sizeField(&Settings::chunking, &ChunkingConfig::chunk_size)},
        {"chunking.overlap", sizeField(&Settings::chunking, &ChunkingConfig::chunk_overlap)},
        {"chunking.toc_min_chars", sizeField(&Settings::chunking, &ChunkingConfig::toc_min_chars)},
        {"chunking.overview_min_identifiers",
         sizeField(&Settings::chunking, &ChunkingConfig::overview_min_identifiers)},
        {"chunking.max_field_names",
         sizeField(&Settings::chunking, &ChunkingConfig::max_field_names)},
        {"chunking.header_max_line_length",
         sizeField(&Settings::chunking, &ChunkingConfig::header_max_line_length)},
        {"chunking.header_min_repeats",
         sizeField(&Settings::chunking, &ChunkingConfig::header_min_repeats)},
        {"chunking.header_pattern",
         [](Settings& s, const std::string&, const std::string& v) -> Result<void> {
             s.chunking.extra_header_patterns.push_back(v);
             return Result<void>();
         }},

        {"search.top_k",
         [](Settings& s, const std::string& key, const std::string& v) -> Result<void> {
             auto parsed = parseSize(key, v);
             if (!parsed)
                 return parsed.error();
             s.top_k = parsed.value();
             return Result<void>();
         }},
        {"search.expansion_factor",
         sizeField(&Settings::refiner, &RefinerConfig::expansion_factor)},
        {"search.title_boost", floatField(&Settings::refiner, &RefinerConfig::title_boost)},
        {"search.key_boost", floatField(&Settings::refiner, &RefinerConfig::key_boost)},
        {"search.body_boost", floatField(&Settings::refiner, &RefinerConfig::body_boost)},

        {"embedding.provider", stringField(&Settings::embedding, &EmbeddingConfig::provider)},
        {"embedding.model", stringField(&Settings::embedding, &EmbeddingConfig::model)},
        {"embedding.api_key", stringField(&Settings::embedding, &EmbeddingConfig::api_key)},
        {"embedding.base_url", stringField(&Settings::embedding, &EmbeddingConfig::base_url)},
        {"embedding.dimension", sizeField(&Settings::embedding, &EmbeddingConfig::dimension)},
        {"embedding.batch_size", sizeField(&Settings::embedding, &EmbeddingConfig::batch_size)},
        {"embedding.timeout_ms", msField(&Settings::embedding, &EmbeddingConfig::timeout)},

        {"rerank.cohere_api_key", stringField(&Settings::rerank, &RerankConfig::cohere_api_key)},
        {"rerank.cohere_model", stringField(&Settings::rerank, &RerankConfig::cohere_model)},
        {"rerank.cohere_url", stringField(&Settings::rerank, &RerankConfig::cohere_url)},
        {"rerank.local_small_model",
         stringField(&Settings::rerank, &RerankConfig::local_small_model)},
        {"rerank.local_small_url", stringField(&Settings::rerank, &RerankConfig::local_small_url)},
        {"rerank.local_large_model",
         stringField(&Settings::rerank, &RerankConfig::local_large_model)},
        {"rerank.local_large_url", stringField(&Settings::rerank, &RerankConfig::local_large_url)},
        {"rerank.timeout_ms", msField(&Settings::rerank, &RerankConfig::timeout)},

        {"storage.data_dir",
         [](Settings& s, const std::string&, const std::string& v) -> Result<void> {
             s.storage.data_dir = expand_tilde(v);
             return Result<void>();
         }},
    };
    return table;
}

// Environment variable -> config key
const std::vector<std::pair<std::string, std::string>>& environmentKeys() {
    static const std::vector<std::pair<std::string, std::string>> keys = {
        {"EMBEDDING_PROVIDER", "embedding.provider"},
        {"EMBEDDING_MODEL", "embedding.model"},
        {"OPENAI_API_KEY", "embedding.api_key"},
        {"COHERE_API_KEY", "rerank.cohere_api_key"},
        {"CHUNK_SIZE", "chunking.size"},
        {"CHUNK_OVERLAP", "chunking.overlap"},
        {"TOP_K_RESULTS", "search.top_k"},
        {"DOCSEEK_DATA_DIR", "storage.data_dir"},
    };
    return keys;
}

Result<void> validate(const Settings& s) {
    if (s.chunking.chunk_size == 0) {
        return Error{ErrorCode::InvalidArgument, "Chunk size must be at least 1"};
    }
    if (s.chunking.chunk_overlap >= s.chunking.chunk_size) {
        return Error{ErrorCode::InvalidArgument,
                     "Chunk overlap (" + std::to_string(s.chunking.chunk_overlap) +
                         ") must be smaller than the chunk size (" +
                         std::to_string(s.chunking.chunk_size) + ")"};
    }
    if (s.top_k == 0) {
        return Error{ErrorCode::InvalidArgument, "top_k must be at least 1"};
    }
    if (s.refiner.expansion_factor == 0) {
        return Error{ErrorCode::InvalidArgument, "Expansion factor must be at least 1"};
    }
    if (s.embedding.batch_size == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding batch size must be at least 1"};
    }
    return Result<void>();
}

} // namespace

std::optional<std::string> processEnvironment(const std::string& name) {
    if (const char* value = std::getenv(name.c_str()); value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

Result<void> applyConfigValues(Settings& settings, const ConfigValues& values) {
    const auto& table = setters();
    for (const auto& [key, value] : values) {
        auto it = table.find(key);
        if (it == table.end()) {
            spdlog::warn("Ignoring unknown config key '{}'", key);
            continue;
        }
        if (auto r = it->second(settings, key, value); !r) {
            return r;
        }
    }
    return Result<void>();
}

Result<Settings> loadSettings(const std::filesystem::path& configPath, const EnvLookup& env) {
    Settings settings;
    settings.storage.data_dir = get_data_dir();

    auto path = get_config_path(configPath.string());
    auto fileValues = parse_config_file(path);
    if (!fileValues) {
        return fileValues.error();
    }
    if (!fileValues.value().empty()) {
        settings.config_file = path;
        spdlog::debug("Loaded {} config values from {}", fileValues.value().size(), path.string());
    } else if (!configPath.empty()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
        }
    }
    if (auto r = applyConfigValues(settings, fileValues.value()); !r) {
        return r.error();
    }

    ConfigValues envValues;
    for (const auto& [name, key] : environmentKeys()) {
        if (auto value = env(name)) {
            envValues[key] = *value;
        }
    }
    if (auto r = applyConfigValues(settings, envValues); !r) {
        return r.error();
    }

    if (auto r = validate(settings); !r) {
        return r.error();
    }
    return settings;
}

} // namespace docseek::config
