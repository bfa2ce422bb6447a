#include <coderag/core/worker_pool.h>
#include <coderag/embedding/embedding_gateway.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <future>

namespace coderag::embedding {

namespace {

Result<std::vector<Embedding>> callProvider(const std::shared_ptr<IEmbeddingProvider>& provider,
                                            const RetryPolicy& policy,
                                            const std::vector<std::string>& batch) {
    return retryWithBackoff(
        policy,
        [&]() -> Result<std::vector<Embedding>> {
            auto result = provider->embedBatch(batch);
            if (result && result.value().size() != batch.size()) {
                return Error{ErrorCode::EmbeddingError,
                             "provider returned " + std::to_string(result.value().size()) +
                                 " vectors for " + std::to_string(batch.size()) + " texts"};
            }
            return result;
        },
        "embedding batch");
}

std::chrono::milliseconds batchDeadline(const EmbeddingConfig& config) {
    auto total = std::chrono::milliseconds(0);
    int attempts = std::max(config.retry.max_attempts, 1);
    for (int i = 0; i < attempts; ++i) {
        total += config.timeout;
        if (i + 1 < attempts) {
            total += config.retry.delayFor(i);
        }
    }
    return total;
}

} // namespace

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<IEmbeddingProvider> provider,
                                   EmbeddingConfig config, std::shared_ptr<WorkerPool> pool)
    : provider_(std::move(provider)), config_(std::move(config)), pool_(std::move(pool)) {
    if (config_.batch_size == 0) {
        config_.batch_size = 1;
    }
    if (config_.max_concurrent_batches == 0) {
        config_.max_concurrent_batches = 1;
    }
}

std::size_t EmbeddingGateway::dimension() const {
    return provider_ ? provider_->dimension() : config_.dimension;
}

std::string EmbeddingGateway::preprocess(std::string_view text, std::size_t max_length) {
    std::string out(text);
    std::replace(out.begin(), out.end(), '\n', ' ');

    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), notSpace));
    out.erase(std::find_if(out.rbegin(), out.rend(), notSpace).base(), out.end());

    if (out.size() > max_length) {
        // Back up to a UTF-8 character boundary
        std::size_t cut = max_length;
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        out.resize(cut);
    }
    return out;
}

Result<std::vector<Embedding>>
EmbeddingGateway::embedOne(const std::vector<std::string>& batch) const {
    return callProvider(provider_, config_.retry, batch);
}

Embedding EmbeddingGateway::embedText(const std::string& text) {
    if (!provider_) {
        return {};
    }
    std::string prepared = preprocess(text, config_.max_text_length);
    if (prepared.empty()) {
        return {};
    }
    auto result = embedOne({prepared});
    if (!result) {
        spdlog::warn("Query embedding failed: {}", result.error().message);
        return {};
    }
    return std::move(result).value().front();
}

std::vector<Embedding> EmbeddingGateway::embedBatch(const std::vector<std::string>& texts) {
    std::vector<Embedding> out(texts.size());
    if (texts.empty() || !provider_) {
        return out;
    }

    // Empty inputs are never sent; they stay empty vectors
    std::vector<std::vector<std::string>> batches;
    std::vector<std::vector<std::size_t>> positions;
    for (std::size_t i = 0; i < texts.size(); ++i) {
        std::string prepared = preprocess(texts[i], config_.max_text_length);
        if (prepared.empty()) {
            continue;
        }
        if (batches.empty() || batches.back().size() >= config_.batch_size) {
            batches.emplace_back();
            positions.emplace_back();
        }
        batches.back().push_back(std::move(prepared));
        positions.back().push_back(i);
    }

    std::size_t failed = 0;
    auto place = [&](std::size_t b, Result<std::vector<Embedding>> result) {
        if (!result) {
            spdlog::warn("Embedding batch {}/{} failed: {}", b + 1, batches.size(),
                         result.error().message);
            failed += batches[b].size();
            return;
        }
        auto& vectors = result.value();
        for (std::size_t k = 0; k < vectors.size(); ++k) {
            out[positions[b][k]] = std::move(vectors[k]);
        }
    };

    if (!pool_) {
        for (std::size_t b = 0; b < batches.size(); ++b) {
            place(b, embedOne(batches[b]));
        }
    } else {
        const auto deadline = batchDeadline(config_);
        for (std::size_t wave = 0; wave < batches.size(); wave += config_.max_concurrent_batches) {
            std::size_t wave_end = std::min(batches.size(), wave + config_.max_concurrent_batches);
            std::vector<std::future<Result<std::vector<Embedding>>>> futures;
            futures.reserve(wave_end - wave);
            for (std::size_t b = wave; b < wave_end; ++b) {
                futures.push_back(pool_->submit(
                    [provider = provider_, policy = config_.retry, batch = batches[b]]() {
                        return callProvider(provider, policy, batch);
                    }));
            }
            for (std::size_t b = wave; b < wave_end; ++b) {
                auto& future = futures[b - wave];
                if (future.wait_for(deadline) != std::future_status::ready) {
                    place(b, Error{ErrorCode::Timeout, "embedding batch timed out"});
                    continue;
                }
                place(b, future.get());
            }
        }
    }

    if (failed > 0) {
        spdlog::warn("Embedding: {} of {} texts failed", failed, texts.size());
    }
    return out;
}

} // namespace coderag::embedding
