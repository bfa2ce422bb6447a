#pragma once

#include <coderag/search/bm25_index.h>
#include <coderag/search/tokenizer.h>
#include <coderag/storage/document.h>

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace coderag::search {

/**
 * @brief Immutable lexical view of one session's corpus.
 *
 * A new snapshot is built for every write and swapped in whole, so readers holding the
 * previous one never see a half-built index.
 */
struct LexicalIndex {
    std::vector<storage::Document> documents; // In store order, without embeddings
    Bm25Index bm25;                           // Empty when documents is empty
    std::set<std::string> indexed_files;

    static std::shared_ptr<const LexicalIndex> build(std::vector<storage::Document> documents,
                                                     const Tokenizer& tokenizer,
                                                     const Bm25Params& params = {});

    /**
     * @brief Documents with positive BM25 score for the query, best first, at most k
     */
    std::vector<storage::Document> search(const std::string& query, std::size_t k,
                                          const Tokenizer& tokenizer) const;

    std::size_t size() const { return documents.size(); }
};

} // namespace coderag::search
