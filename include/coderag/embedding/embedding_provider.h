#pragma once

#include <coderag/core/types.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace coderag::embedding {

/**
 * @brief Source of dense text embeddings (remote API, local model, ...)
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * @brief Embed texts, one vector per input in the same order
     *
     * Transient failures are reported with NetworkError, Timeout, RateLimited or ServerError
     * so the caller can retry them.
     */
    virtual Result<std::vector<Embedding>> embedBatch(const std::vector<std::string>& texts) = 0;

    virtual std::size_t dimension() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Deterministic offline embedder based on feature hashing.
 *
 * Words and their character trigrams are hashed into a fixed number of signed buckets and the
 * result is L2-normalised, so texts sharing vocabulary end up close under cosine similarity.
 */
class HashingEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(std::size_t dimension = 384);

    Result<std::vector<Embedding>> embedBatch(const std::vector<std::string>& texts) override;
    std::size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

    Embedding embed(const std::string& text) const;

private:
    std::size_t dimension_;
};

std::shared_ptr<IEmbeddingProvider> createHashingProvider(std::size_t dimension);

} // namespace coderag::embedding
