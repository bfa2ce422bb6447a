#include <coderag/core/worker_pool.h>
#include <coderag/embedding/embedding_gateway.h>
#include <coderag/search/hybrid_retriever.h>
#include <coderag/storage/document_store.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

namespace coderag::search {

HybridRetriever::HybridRetriever(SearchConfig config, std::shared_ptr<WorkerPool> pool)
    : config_(std::move(config)), tokenizer_(config_.tokenizer), pool_(std::move(pool)) {}

std::vector<storage::Document>
HybridRetriever::vectorCandidates(const std::string& query, std::size_t k,
                                  embedding::EmbeddingGateway& gateway,
                                  storage::IDocumentStore& store) const {
    std::vector<storage::Document> out;
    Embedding query_vector = gateway.embedText(query);
    if (query_vector.empty()) {
        spdlog::warn("[{}] query embedding unavailable, lexical results only", store.collection());
        return out;
    }
    auto hits = store.search(query_vector, k);
    if (!hits) {
        spdlog::warn("[{}] vector search failed: {}", store.collection(), hits.error().message);
        return out;
    }
    out.reserve(hits.value().size());
    for (auto& hit : hits.value()) {
        hit.document.embedding.reset();
        out.push_back(std::move(hit.document));
    }
    return out;
}

Result<std::vector<SearchResult>>
HybridRetriever::search(const std::string& query, std::size_t top_k,
                        embedding::EmbeddingGateway& gateway, storage::IDocumentStore& store,
                        std::shared_ptr<const LexicalIndex> lexical) const {
    if (top_k == 0) {
        return Error{ErrorCode::InvalidArgument, "top_k must be at least 1"};
    }
    const std::size_t candidate_k = top_k * std::max<std::size_t>(config_.oversample_factor, 1);

    auto lexicalSearch = [this, lexical, &query, candidate_k]() {
        if (!lexical) {
            return std::vector<storage::Document>{};
        }
        return lexical->search(query, candidate_k, tokenizer_);
    };

    std::vector<storage::Document> lexical_ranked;
    std::vector<storage::Document> vector_ranked;
    if (pool_) {
        auto pending = pool_->submit(lexicalSearch);
        vector_ranked = vectorCandidates(query, candidate_k, gateway, store);
        lexical_ranked = pending.get();
    } else {
        lexical_ranked = lexicalSearch();
        vector_ranked = vectorCandidates(query, candidate_k, gateway, store);
    }

    auto results = fusion::fuse(vector_ranked, lexical_ranked, top_k, config_.fusion);
    spdlog::debug("[{}] search '{}': {} vector, {} lexical, {} fused", store.collection(), query,
                  vector_ranked.size(), lexical_ranked.size(), results.size());
    return results;
}

} // namespace coderag::search
