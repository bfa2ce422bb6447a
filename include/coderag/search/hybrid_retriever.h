#pragma once

#include <coderag/core/types.h>
#include <coderag/search/bm25_index.h>
#include <coderag/search/lexical_index.h>
#include <coderag/search/rank_fusion.h>
#include <coderag/search/tokenizer.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace coderag {
class WorkerPool;
}
namespace coderag::embedding {
class EmbeddingGateway;
}
namespace coderag::storage {
class IDocumentStore;
}

namespace coderag::search {

/**
 * Configuration for hybrid retrieval
 */
struct SearchConfig {
    std::size_t default_top_k = 5;
    std::size_t oversample_factor = 2; // Candidates per list = top_k * oversample_factor
    FusionConfig fusion;
    Bm25Params bm25;
    TokenizerConfig tokenizer;
};

/**
 * @brief Vector + BM25 retrieval merged by Reciprocal Rank Fusion.
 *
 * Both candidate lists are produced concurrently: lexical scoring runs on the worker pool while
 * the query is embedded and the store is searched. Either side failing degrades to the other;
 * only an invalid top_k is an error.
 */
class HybridRetriever {
public:
    explicit HybridRetriever(SearchConfig config = {}, std::shared_ptr<WorkerPool> pool = nullptr);

    Result<std::vector<SearchResult>> search(const std::string& query, std::size_t top_k,
                                             embedding::EmbeddingGateway& gateway,
                                             storage::IDocumentStore& store,
                                             std::shared_ptr<const LexicalIndex> lexical) const;

    const SearchConfig& config() const { return config_; }
    const Tokenizer& tokenizer() const { return tokenizer_; }

private:
    std::vector<storage::Document> vectorCandidates(const std::string& query, std::size_t k,
                                                    embedding::EmbeddingGateway& gateway,
                                                    storage::IDocumentStore& store) const;

    SearchConfig config_;
    Tokenizer tokenizer_;
    std::shared_ptr<WorkerPool> pool_;
};

} // namespace coderag::search
