#pragma once

#include <coderag/storage/document_store.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace coderag::storage {

// Collections shared by every handle opened from one InMemoryDocumentStoreFactory
struct InMemoryCollections {
    std::mutex mutex;
    std::map<std::string, std::vector<Document>> collections;
};

/**
 * @brief Process-local document store, used for tests and transient chat sessions
 */
class InMemoryDocumentStore : public IDocumentStore {
public:
    InMemoryDocumentStore(std::shared_ptr<InMemoryCollections> shared, std::string collection,
                          std::size_t dimension);

    Result<void> initialize() override;
    Result<std::size_t> add(const std::vector<Document>& documents,
                            const std::vector<Embedding>& embeddings) override;
    Result<std::vector<ScoredDocument>> search(const Embedding& query, std::size_t top_k,
                                               const MetadataFilter& filter = {}) override;
    Result<std::vector<Document>> scrollAll() override;
    Result<void> deleteCollection() override;
    Result<std::vector<Document>> getByFile(const std::string& path) override;
    Result<std::size_t> deleteByFile(const std::string& path) override;
    Result<std::size_t> count() override;
    void close() override;
    bool isInitialized() const override { return initialized_; }
    const std::string& collection() const override { return collection_; }

private:
    std::shared_ptr<InMemoryCollections> shared_;
    std::string collection_;
    std::size_t dimension_;
    bool initialized_ = false;
};

class InMemoryDocumentStoreFactory : public DocumentStoreFactory {
public:
    explicit InMemoryDocumentStoreFactory(std::size_t dimension);

    Result<std::unique_ptr<IDocumentStore>> open(const std::string& collection) override;
    void close() override {}

private:
    std::shared_ptr<InMemoryCollections> shared_;
    std::size_t dimension_;
};

} // namespace coderag::storage
