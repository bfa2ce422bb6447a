#include <coderag/embedding/embedding_provider.h>

#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace coderag::embedding {

namespace {

// FNV-1a keeps bucket assignment stable across processes and platforms
uint64_t fnv1a(std::string_view data, uint64_t seed = 0xcbf29ce484222325ULL) {
    uint64_t hash = seed;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(std::size_t dimension)
    : dimension_(dimension == 0 ? 1 : dimension) {
    spdlog::debug("HashingEmbeddingProvider created with dimension {}", dimension_);
}

Embedding HashingEmbeddingProvider::embed(const std::string& text) const {
    Embedding embedding(dimension_, 0.0f);

    auto addFeature = [&](std::string_view feature, float weight) {
        uint64_t h = fnv1a(feature);
        std::size_t bucket = static_cast<std::size_t>(h % dimension_);
        float sign = ((h >> 63) & 1ULL) ? -1.0f : 1.0f;
        embedding[bucket] += sign * weight;
    };

    std::string word;
    auto flushWord = [&]() {
        if (word.empty()) {
            return;
        }
        addFeature(word, 1.0f);
        if (word.size() > 3) {
            std::string padded = "#" + word + "#";
            for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
                addFeature(std::string_view(padded).substr(i, 3), 0.35f);
            }
        }
        word.clear();
    };

    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            word.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flushWord();
        }
    }
    flushWord();

    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);
    if (norm == 0.0f) {
        return {};
    }
    for (float& val : embedding) {
        val /= norm;
    }
    return embedding;
}

Result<std::vector<Embedding>>
HashingEmbeddingProvider::embedBatch(const std::vector<std::string>& texts) {
    std::vector<Embedding> embeddings;
    embeddings.reserve(texts.size());
    for (const auto& text : texts) {
        embeddings.push_back(embed(text));
    }
    return embeddings;
}

std::shared_ptr<IEmbeddingProvider> createHashingProvider(std::size_t dimension) {
    return std::make_shared<HashingEmbeddingProvider>(dimension);
}

} // namespace coderag::embedding
