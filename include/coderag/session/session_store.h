#pragma once

#include <coderag/chunking/chunk.h>
#include <coderag/core/types.h>
#include <coderag/search/hybrid_retriever.h>
#include <coderag/search/lexical_index.h>
#include <coderag/session/lexical_cache.h>
#include <coderag/session/session_context.h>
#include <coderag/storage/document_store.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace coderag {
class WorkerPool;
}
namespace coderag::embedding {
class EmbeddingGateway;
}

namespace coderag::session {

/**
 * @brief Collaborators shared by every session of a process.
 */
struct SessionDependencies {
    std::shared_ptr<storage::DocumentStoreFactory> store_factory;
    std::shared_ptr<embedding::EmbeddingGateway> gateway;
    std::shared_ptr<WorkerPool> pool;
    storage::StorageConfig storage;
    search::SearchConfig search;
};

struct AddOptions {
    // Delete the stored documents of every file present in the batch before writing it
    bool replace_existing_files = false;
};

/**
 * @brief Per-session index: durable document collection + lexical snapshot + context file.
 *
 * Storage is opened lazily on first use. Writers (addDocuments, reset, close) are serialized;
 * searches run concurrently with each other and with addDocuments but never with a reset.
 */
class SessionStore {
public:
    /**
     * @brief Create a session store; InvalidArgument if the id sanitizes to nothing
     */
    static Result<std::shared_ptr<SessionStore>> create(const std::string& session_id,
                                                        SessionDependencies deps);

    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Open the collection, restore context and lexical index. Idempotent.
     *
     * The lexical index comes from the cache file when it is current; otherwise it is
     * rebuilt from every document in the store.
     */
    Result<void> initialize();

    /**
     * @brief Persist chunks with their embeddings (paired by position)
     *
     * Chunks whose embedding is missing or has the wrong dimension are dropped. Returns the
     * number written; 0 when no chunk has a usable embedding. The lexical index is rebuilt
     * over the whole corpus afterwards.
     */
    Result<std::size_t> addDocuments(const std::vector<chunking::Chunk>& chunks,
                                     const std::vector<Embedding>& embeddings,
                                     const AddOptions& options = {});

    /**
     * @brief Hybrid search; top_k 0 uses the configured default
     */
    Result<std::vector<search::SearchResult>> search(const std::string& query,
                                                     std::size_t top_k = 0);

    /**
     * @brief Drop the collection, the cache, the context file and all in-memory state
     */
    Result<void> reset();

    /**
     * @brief Indexed chunks of one file in reading order
     */
    Result<std::vector<storage::Document>> documentsByFile(const std::string& path);

    // Release the storage handle; the next call re-initializes
    void close();

    // Context file
    Result<void> saveContext(const std::string& repo_url, const nlohmann::json& global_context);
    std::optional<nlohmann::json> loadContext();
    Result<void> saveReport(const std::string& report, const std::string& language = "en");
    std::optional<std::string> report(const std::string& language = "en") const;
    std::vector<std::string> availableLanguages() const;
    bool hasIndex() const;

    const std::string& sessionId() const { return session_id_; }
    const std::string& collectionName() const { return collection_name_; }
    std::optional<std::string> repoUrl() const;
    nlohmann::json globalContext() const;
    std::set<std::string> indexedFiles() const;
    std::size_t documentCount() const;
    bool isInitialized() const;

    std::shared_ptr<const search::LexicalIndex> lexicalSnapshot() const;

private:
    SessionStore(std::string session_id, SessionDependencies deps);

    Result<void> initializeLocked();
    Result<void> rebuildLexicalIndex();
    void rebuildFrom(std::vector<storage::Document> stored);
    std::shared_ptr<const search::LexicalIndex> buildIndex(std::vector<storage::Document> docs) const;
    void publish(std::shared_ptr<const search::LexicalIndex> snapshot);
    void restoreContext();

    std::string session_id_;
    std::string collection_name_;
    SessionDependencies deps_;
    search::HybridRetriever retriever_;
    SessionContext context_;
    LexicalCache cache_;

    // Guards store_ and initialized_: shared for reads, exclusive for reset/close/open
    mutable std::shared_mutex state_mutex_;
    std::unique_ptr<storage::IDocumentStore> store_;
    bool initialized_ = false;

    // Serializes writers
    std::mutex write_mutex_;

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const search::LexicalIndex> snapshot_;

    mutable std::mutex meta_mutex_;
    std::optional<std::string> repo_url_;
    nlohmann::json global_context_ = nlohmann::json::object();
};

} // namespace coderag::session
