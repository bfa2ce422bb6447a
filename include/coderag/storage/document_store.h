#pragma once

#include <coderag/core/types.h>
#include <coderag/storage/document.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace coderag::storage {

// Equality conditions on metadata values, all of which must hold
using MetadataFilter = std::map<std::string, std::string>;

/**
 * @brief Durable store for chunk content, metadata and vectors.
 *
 * One instance addresses one named collection. The store is the source of truth the lexical
 * index is rebuilt from.
 */
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    /**
     * @brief Create the collection if missing. Idempotent.
     */
    virtual Result<void> initialize() = 0;

    /**
     * @brief Append documents with their embeddings (paired by position)
     *
     * Pairs whose embedding has the wrong dimension are skipped.
     * @return Number of documents written
     */
    virtual Result<std::size_t> add(const std::vector<Document>& documents,
                                    const std::vector<Embedding>& embeddings) = 0;

    /**
     * @brief Nearest neighbours of a query vector by cosine similarity, best first
     */
    virtual Result<std::vector<ScoredDocument>> search(const Embedding& query, std::size_t top_k,
                                                       const MetadataFilter& filter = {}) = 0;

    /**
     * @brief Every document of the collection in insertion order
     */
    virtual Result<std::vector<Document>> scrollAll() = 0;

    /**
     * @brief Drop the collection and everything in it
     */
    virtual Result<void> deleteCollection() = 0;

    /**
     * @brief Documents whose file metadata equals path, ordered by start line
     */
    virtual Result<std::vector<Document>> getByFile(const std::string& path) = 0;

    /**
     * @brief Remove every document of one file
     * @return Number of documents removed
     */
    virtual Result<std::size_t> deleteByFile(const std::string& path) = 0;

    virtual Result<std::size_t> count() = 0;

    virtual void close() = 0;

    virtual bool isInitialized() const = 0;

    virtual const std::string& collection() const = 0;
};

/**
 * Document store backend selection
 */
enum class DocumentStoreType { Sqlite, InMemory };

const char* documentStoreTypeToString(DocumentStoreType type);
Result<DocumentStoreType> documentStoreTypeFromString(const std::string& name);

/**
 * Configuration for durable storage
 */
struct StorageConfig {
    DocumentStoreType backend = DocumentStoreType::Sqlite;
    std::filesystem::path data_dir;    // SQLite database lives here
    std::filesystem::path context_dir; // Context and lexical cache files
    std::size_t dimension = 1024;      // 0 disables the dimension check
    std::size_t write_batch_size = 100;
    std::string cache_format_version = "coderag-bm25-v1";
};

/**
 * @brief Opens collection handles over one shared backend connection.
 */
class DocumentStoreFactory {
public:
    virtual ~DocumentStoreFactory() = default;

    virtual Result<std::unique_ptr<IDocumentStore>> open(const std::string& collection) = 0;

    virtual void close() = 0;
};

/**
 * @brief Create a factory for the configured backend
 */
Result<std::shared_ptr<DocumentStoreFactory>> createDocumentStoreFactory(const StorageConfig& config);

// Cosine similarity; 0 when either vector is zero or sizes differ
float cosineSimilarity(const Embedding& a, const Embedding& b);

// True when the document matches every condition of the filter
bool matchesFilter(const Document& document, const MetadataFilter& filter);

} // namespace coderag::storage
