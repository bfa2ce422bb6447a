#include <coderag/search/lexical_index.h>

namespace coderag::search {

std::shared_ptr<const LexicalIndex> LexicalIndex::build(std::vector<storage::Document> documents,
                                                        const Tokenizer& tokenizer,
                                                        const Bm25Params& params) {
    auto index = std::make_shared<LexicalIndex>();
    std::vector<std::vector<std::string>> corpus;
    corpus.reserve(documents.size());
    for (auto& doc : documents) {
        doc.embedding.reset();
        corpus.push_back(tokenizer.tokenize(doc.content));
        auto file = doc.file();
        if (!file.empty()) {
            index->indexed_files.insert(std::move(file));
        }
    }
    index->bm25 = Bm25Index::build(corpus, params);
    index->documents = std::move(documents);
    return index;
}

std::vector<storage::Document> LexicalIndex::search(const std::string& query, std::size_t k,
                                                    const Tokenizer& tokenizer) const {
    std::vector<storage::Document> out;
    if (bm25.empty() || k == 0) {
        return out;
    }
    auto ranked = bm25.topK(tokenizer.tokenize(query), k);
    out.reserve(ranked.size());
    for (const auto& [index, score] : ranked) {
        if (index < documents.size()) {
            out.push_back(documents[index]);
        }
    }
    return out;
}

} // namespace coderag::search
