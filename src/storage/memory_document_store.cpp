#include <coderag/storage/memory_document_store.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace coderag::storage {

InMemoryDocumentStore::InMemoryDocumentStore(std::shared_ptr<InMemoryCollections> shared,
                                             std::string collection, std::size_t dimension)
    : shared_(std::move(shared)), collection_(std::move(collection)), dimension_(dimension) {}

Result<void> InMemoryDocumentStore::initialize() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->collections.try_emplace(collection_);
    initialized_ = true;
    return Result<void>();
}

Result<std::size_t> InMemoryDocumentStore::add(const std::vector<Document>& documents,
                                               const std::vector<Embedding>& embeddings) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    if (documents.size() != embeddings.size()) {
        return Error{ErrorCode::InvalidArgument, "documents and embeddings differ in length"};
    }

    std::lock_guard<std::mutex> lock(shared_->mutex);
    auto& docs = shared_->collections[collection_];
    std::unordered_set<std::string> ids;
    for (const auto& doc : docs) {
        ids.insert(doc.id);
    }

    std::vector<Document> staged;
    for (std::size_t i = 0; i < documents.size(); ++i) {
        if (embeddings[i].empty() || (dimension_ != 0 && embeddings[i].size() != dimension_)) {
            spdlog::warn("[{}] skipping '{}': embedding dimension {} (expected {})", collection_,
                         documents[i].id, embeddings[i].size(), dimension_);
            continue;
        }
        // Same all-or-nothing outcome as a failed SQLite transaction
        if (!ids.insert(documents[i].id).second) {
            return Error{ErrorCode::StorageWriteError,
                         "Failed to insert '" + documents[i].id + "': duplicate id"};
        }
        Document doc = documents[i];
        doc.embedding = embeddings[i];
        staged.push_back(std::move(doc));
    }
    for (auto& doc : staged) {
        docs.push_back(std::move(doc));
    }
    return staged.size();
}

Result<std::vector<ScoredDocument>> InMemoryDocumentStore::search(const Embedding& query,
                                                                  std::size_t top_k,
                                                                  const MetadataFilter& filter) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    std::vector<ScoredDocument> scored;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        const auto& docs = shared_->collections[collection_];
        scored.reserve(docs.size());
        for (const auto& doc : docs) {
            if (!doc.embedding || !matchesFilter(doc, filter)) {
                continue;
            }
            scored.push_back({doc, cosineSimilarity(query, *doc.embedding)});
        }
    }

    std::size_t k = std::min(top_k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(k),
                      scored.end(), [](const ScoredDocument& a, const ScoredDocument& b) {
                          return a.score > b.score;
                      });
    scored.resize(k);
    return scored;
}

Result<std::vector<Document>> InMemoryDocumentStore::scrollAll() {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->collections[collection_];
}

Result<void> InMemoryDocumentStore::deleteCollection() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->collections.erase(collection_);
    initialized_ = false;
    return Result<void>();
}

Result<std::vector<Document>> InMemoryDocumentStore::getByFile(const std::string& path) {
    auto all = scrollAll();
    if (!all) {
        return all.error();
    }
    std::vector<Document> out;
    for (auto& doc : all.value()) {
        if (doc.file() == path) {
            out.push_back(std::move(doc));
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const Document& a, const Document& b) {
        return a.startLine() < b.startLine();
    });
    return out;
}

Result<std::size_t> InMemoryDocumentStore::deleteByFile(const std::string& path) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    std::lock_guard<std::mutex> lock(shared_->mutex);
    auto& docs = shared_->collections[collection_];
    auto before = docs.size();
    docs.erase(std::remove_if(docs.begin(), docs.end(),
                              [&path](const Document& doc) { return doc.file() == path; }),
               docs.end());
    return before - docs.size();
}

Result<std::size_t> InMemoryDocumentStore::count() {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->collections[collection_].size();
}

void InMemoryDocumentStore::close() {
    initialized_ = false;
}

InMemoryDocumentStoreFactory::InMemoryDocumentStoreFactory(std::size_t dimension)
    : shared_(std::make_shared<InMemoryCollections>()), dimension_(dimension) {}

Result<std::unique_ptr<IDocumentStore>>
InMemoryDocumentStoreFactory::open(const std::string& collection) {
    std::unique_ptr<IDocumentStore> store =
        std::make_unique<InMemoryDocumentStore>(shared_, collection, dimension_);
    return store;
}

} // namespace coderag::storage
