#pragma once

#include <coderag/storage/document_store.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace coderag::storage {

/**
 * @brief One SQLite connection shared by every collection handle.
 *
 * All statements run under mutex(); collections are disjoint partitions of one table.
 */
class SqliteConnection {
public:
    static Result<std::shared_ptr<SqliteConnection>> open(const std::filesystem::path& path);

    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    sqlite3* handle() const { return db_; }
    std::mutex& mutex() { return mutex_; }
    const std::filesystem::path& path() const { return path_; }

    // Caller holds mutex()
    Result<void> execute(const std::string& sql);

    void close();

private:
    SqliteConnection(sqlite3* db, std::filesystem::path path) : db_(db), path_(std::move(path)) {}

    sqlite3* db_;
    std::filesystem::path path_;
    std::mutex mutex_;
};

class SqliteDocumentStore : public IDocumentStore {
public:
    SqliteDocumentStore(std::shared_ptr<SqliteConnection> connection, std::string collection,
                        std::size_t dimension, std::size_t write_batch_size = 100);
    ~SqliteDocumentStore() override;

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
    Result<std::size_t> insertBatch(const std::vector<const Document*>& documents,
                                    const std::vector<const Embedding*>& embeddings);
    Result<std::vector<Document>> selectDocuments(const std::string& sql, bool with_embeddings,
                                                  const std::string* file_filter);

    std::shared_ptr<SqliteConnection> connection_;
    std::string collection_;
    std::size_t dimension_;
    std::size_t write_batch_size_;
    bool initialized_ = false;
};

class SqliteDocumentStoreFactory : public DocumentStoreFactory {
public:
    SqliteDocumentStoreFactory(std::shared_ptr<SqliteConnection> connection, StorageConfig config);

    Result<std::unique_ptr<IDocumentStore>> open(const std::string& collection) override;
    void close() override;

private:
    std::shared_ptr<SqliteConnection> connection_;
    StorageConfig config_;
};

} // namespace coderag::storage
