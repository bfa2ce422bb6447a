#pragma once

#include <coderag/core/retry.h>
#include <coderag/core/types.h>
#include <coderag/embedding/embedding_provider.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace coderag {
class WorkerPool;
}

namespace coderag::embedding {

/**
 * Configuration for the embedding gateway
 */
struct EmbeddingConfig {
    std::size_t batch_size = 50;
    std::size_t max_text_length = 8000;
    std::size_t max_concurrent_batches = 5;
    std::chrono::milliseconds timeout{60000}; // per provider call
    RetryPolicy retry;
    std::size_t dimension = 1024;
};

/**
 * @brief Batching, retrying front for an IEmbeddingProvider.
 *
 * Partial failures never raise: texts whose batch failed come back as empty vectors.
 */
class EmbeddingGateway {
public:
    EmbeddingGateway(std::shared_ptr<IEmbeddingProvider> provider, EmbeddingConfig config,
                     std::shared_ptr<WorkerPool> pool = nullptr);

    // Empty vector on failure
    Embedding embedText(const std::string& text);

    // Same order and size as texts
    std::vector<Embedding> embedBatch(const std::vector<std::string>& texts);

    std::size_t dimension() const;

    const EmbeddingConfig& config() const { return config_; }

    // Newlines become spaces, surrounding whitespace is trimmed, length is capped
    static std::string preprocess(std::string_view text, std::size_t max_length);

private:
    Result<std::vector<Embedding>> embedOne(const std::vector<std::string>& batch) const;

    std::shared_ptr<IEmbeddingProvider> provider_;
    EmbeddingConfig config_;
    std::shared_ptr<WorkerPool> pool_;
};

} // namespace coderag::embedding
