#include <docseek/ml/provider.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <functional>
#include <random>

namespace docseek::ml {

MockEmbeddingProvider::MockEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    spdlog::debug("MockEmbeddingProvider created with dimension {}", dimension);
}

Result<Embedding> MockEmbeddingProvider::generateEmbedding(const std::string& text,
                                                           std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Embedding cancelled"};
    }

    // Generate deterministic embedding based on text hash
    std::hash<std::string> hasher;
    std::mt19937 gen(static_cast<std::mt19937::result_type>(hasher(text)));
    std::normal_distribution<float> dist(0.0f, 1.0f);

    Embedding embedding(dimension_);
    for (size_t i = 0; i < dimension_; ++i) {
        embedding[i] = dist(gen);
    }

    // Normalize to unit length
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }

    return embedding;
}

Result<std::vector<Embedding>>
MockEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts,
                                               std::stop_token stop) {
    std::vector<Embedding> embeddings;
    embeddings.reserve(texts.size());

    for (const auto& text : texts) {
        auto result = generateEmbedding(text, stop);
        if (!result) {
            return result.error();
        }
        embeddings.push_back(std::move(result.value()));
    }

    return embeddings;
}

} // namespace docseek::ml
