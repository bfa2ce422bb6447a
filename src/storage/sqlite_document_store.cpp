#include <coderag/storage/sqlite_document_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <algorithm>
#include <cstring>

namespace coderag::storage {

namespace {

using json = nlohmann::json;

inline int stepWithRetry(sqlite3_stmt* stmt, int max_attempts = 20) {
    int attempt = 0;
    while (true) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            int exp = attempt;
            if (exp > 7)
                exp = 7;
            int sleep_ms = 10 * (1 << exp);
            ++attempt;
            if (attempt <= max_attempts) {
                spdlog::warn("sqlite3_step busy/locked (rc={}): retry {}/{} after {} ms", rc,
                             attempt, max_attempts, sleep_ms);
                sqlite3_sleep(sleep_ms);
                continue;
            }
        }
        return rc;
    }
}

// Rolls back unless commit() was reached
class TransactionGuard {
public:
    explicit TransactionGuard(sqlite3* db) : db_(db) {}

    ~TransactionGuard() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    void commit() { committed_ = true; }

private:
    sqlite3* db_;
    bool committed_ = false;
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Result<Statement> prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to prepare statement: " + std::string(sqlite3_errmsg(db))};
    }
    return Statement(raw);
}

std::string columnText(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

std::map<std::string, std::string> decodeMetadata(const std::string& raw) {
    std::map<std::string, std::string> metadata;
    try {
        auto j = json::parse(raw);
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it->is_string()) {
                metadata[it.key()] = it->get<std::string>();
            } else {
                metadata[it.key()] = it->dump();
            }
        }
    } catch (const json::exception& e) {
        spdlog::warn("Unreadable document metadata: {}", e.what());
    }
    return metadata;
}

std::string encodeMetadata(const std::map<std::string, std::string>& metadata) {
    json j = json::object();
    for (const auto& [key, value] : metadata) {
        j[key] = value;
    }
    return j.dump();
}

constexpr const char* kSelectColumns = "SELECT id, content, metadata, embedding FROM documents";

} // namespace

// ===== SqliteConnection =====

Result<std::shared_ptr<SqliteConnection>>
SqliteConnection::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         "Cannot create " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.string().c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) {
            sqlite3_close(db);
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + msg};
    }
    sqlite3_busy_timeout(db, 10000);

    std::shared_ptr<SqliteConnection> conn(new SqliteConnection(db, path));
    std::lock_guard<std::mutex> lock(conn->mutex_);
    if (auto wal = conn->execute("PRAGMA journal_mode=WAL"); !wal) {
        spdlog::warn("WAL mode unavailable for {}: {}", path.string(), wal.error().message);
    }
    for (const char* sql : {"PRAGMA synchronous=NORMAL", "PRAGMA temp_store=MEMORY",
                            "CREATE TABLE IF NOT EXISTS documents ("
                            " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
                            " collection TEXT NOT NULL,"
                            " id TEXT NOT NULL,"
                            " file TEXT,"
                            " start_line INTEGER,"
                            " content TEXT NOT NULL,"
                            " metadata TEXT NOT NULL,"
                            " embedding BLOB,"
                            " UNIQUE(collection, id))",
                            "CREATE INDEX IF NOT EXISTS idx_documents_file"
                            " ON documents(collection, file)",
                            "CREATE TABLE IF NOT EXISTS collections ("
                            " name TEXT PRIMARY KEY,"
                            " dimension INTEGER,"
                            " created_at INTEGER)"}) {
        auto r = conn->execute(sql);
        if (!r) {
            return r.error();
        }
    }
    spdlog::debug("Opened document database {}", path.string());
    return conn;
}

SqliteConnection::~SqliteConnection() {
    close();
}

void SqliteConnection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<void> SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::NotInitialized, "Database is closed"};
    }
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        return Error{ErrorCode::DatabaseError, msg};
    }
    return Result<void>();
}

// ===== SqliteDocumentStore =====

SqliteDocumentStore::SqliteDocumentStore(std::shared_ptr<SqliteConnection> connection,
                                         std::string collection, std::size_t dimension,
                                         std::size_t write_batch_size)
    : connection_(std::move(connection)), collection_(std::move(collection)),
      dimension_(dimension), write_batch_size_(std::max<std::size_t>(write_batch_size, 1)) {}

SqliteDocumentStore::~SqliteDocumentStore() {
    close();
}

Result<void> SqliteDocumentStore::initialize() {
    if (initialized_) {
        return Result<void>();
    }
    std::lock_guard<std::mutex> lock(connection_->mutex());
    sqlite3* db = connection_->handle();
    if (!db) {
        return Error{ErrorCode::NotInitialized, "Database is closed"};
    }
    auto stmt = prepare(db, "INSERT OR IGNORE INTO collections(name, dimension, created_at)"
                            " VALUES(?, ?, strftime('%s','now'))");
    if (!stmt) {
        return stmt.error();
    }
    sqlite3_bind_text(stmt.value().get(), 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.value().get(), 2, static_cast<sqlite3_int64>(dimension_));
    int rc = stepWithRetry(stmt.value().get());
    if (rc != SQLITE_DONE) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to register collection: " + std::string(sqlite3_errmsg(db))};
    }
    initialized_ = true;
    return Result<void>();
}

Result<std::size_t> SqliteDocumentStore::insertBatch(const std::vector<const Document*>& documents,
                                                     const std::vector<const Embedding*>& embeddings) {
    sqlite3* db = connection_->handle();
    auto begin = connection_->execute("BEGIN IMMEDIATE TRANSACTION");
    if (!begin) {
        return Error{ErrorCode::StorageWriteError,
                     "Failed to begin transaction: " + begin.error().message};
    }
    TransactionGuard guard(db);

    auto stmt = prepare(db, "INSERT INTO documents"
                            "(collection, id, file, start_line, content, metadata, embedding)"
                            " VALUES(?, ?, ?, ?, ?, ?, ?)");
    if (!stmt) {
        return Error{ErrorCode::StorageWriteError, stmt.error().message};
    }
    sqlite3_stmt* s = stmt.value().get();

    for (std::size_t i = 0; i < documents.size(); ++i) {
        const Document& doc = *documents[i];
        const Embedding& vec = *embeddings[i];
        std::string metadata = encodeMetadata(doc.metadata);
        std::string file = doc.file();

        sqlite3_reset(s);
        sqlite3_clear_bindings(s);
        sqlite3_bind_text(s, 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 2, doc.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 3, file.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(s, 4, static_cast<sqlite3_int64>(doc.startLine()));
        sqlite3_bind_text(s, 5, doc.content.c_str(), static_cast<int>(doc.content.size()),
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(s, 6, metadata.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(s, 7, vec.data(), static_cast<int>(vec.size() * sizeof(float)),
                          SQLITE_TRANSIENT);

        int rc = stepWithRetry(s);
        if (rc != SQLITE_DONE) {
            return Error{ErrorCode::StorageWriteError,
                         "Failed to insert '" + doc.id + "': " + sqlite3_errmsg(db)};
        }
    }

    auto commit = connection_->execute("COMMIT");
    if (!commit) {
        return Error{ErrorCode::StorageWriteError,
                     "Failed to commit transaction: " + commit.error().message};
    }
    guard.commit();
    return documents.size();
}

Result<std::size_t> SqliteDocumentStore::add(const std::vector<Document>& documents,
                                             const std::vector<Embedding>& embeddings) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    if (documents.size() != embeddings.size()) {
        return Error{ErrorCode::InvalidArgument, "documents and embeddings differ in length"};
    }

    std::vector<const Document*> docs;
    std::vector<const Embedding*> vecs;
    for (std::size_t i = 0; i < documents.size(); ++i) {
        if (embeddings[i].empty() || (dimension_ != 0 && embeddings[i].size() != dimension_)) {
            spdlog::warn("[{}] skipping '{}': embedding dimension {} (expected {})", collection_,
                         documents[i].id, embeddings[i].size(), dimension_);
            continue;
        }
        docs.push_back(&documents[i]);
        vecs.push_back(&embeddings[i]);
    }

    std::lock_guard<std::mutex> lock(connection_->mutex());
    if (!connection_->handle()) {
        return Error{ErrorCode::NotInitialized, "Database is closed"};
    }

    std::size_t written = 0;
    for (std::size_t start = 0; start < docs.size(); start += write_batch_size_) {
        std::size_t end = std::min(docs.size(), start + write_batch_size_);
        std::vector<const Document*> batch_docs(docs.begin() + start, docs.begin() + end);
        std::vector<const Embedding*> batch_vecs(vecs.begin() + start, vecs.begin() + end);
        auto r = insertBatch(batch_docs, batch_vecs);
        if (!r) {
            spdlog::error("[{}] batch write failed after {} documents: {}", collection_, written,
                          r.error().message);
            return r.error();
        }
        written += r.value();
    }
    spdlog::debug("[{}] wrote {} documents", collection_, written);
    return written;
}

Result<std::vector<Document>> SqliteDocumentStore::selectDocuments(const std::string& sql,
                                                                   bool with_embeddings,
                                                                   const std::string* file_filter) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    std::lock_guard<std::mutex> lock(connection_->mutex());
    sqlite3* db = connection_->handle();
    if (!db) {
        return Error{ErrorCode::NotInitialized, "Database is closed"};
    }
    auto stmt = prepare(db, sql);
    if (!stmt) {
        return stmt.error();
    }
    sqlite3_stmt* s = stmt.value().get();
    sqlite3_bind_text(s, 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
    if (file_filter) {
        sqlite3_bind_text(s, 2, file_filter->c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<Document> out;
    int rc;
    while ((rc = stepWithRetry(s)) == SQLITE_ROW) {
        Document doc;
        doc.id = columnText(s, 0);
        doc.content = columnText(s, 1);
        doc.metadata = decodeMetadata(columnText(s, 2));
        if (with_embeddings && sqlite3_column_type(s, 3) == SQLITE_BLOB) {
            const void* blob = sqlite3_column_blob(s, 3);
            int bytes = sqlite3_column_bytes(s, 3);
            Embedding vec(static_cast<std::size_t>(bytes) / sizeof(float));
            if (!vec.empty()) {
                std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
            }
            doc.embedding = std::move(vec);
        }
        out.push_back(std::move(doc));
    }
    if (rc != SQLITE_DONE) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to read documents: " + std::string(sqlite3_errmsg(db))};
    }
    return out;
}

Result<std::vector<ScoredDocument>> SqliteDocumentStore::search(const Embedding& query,
                                                                std::size_t top_k,
                                                                const MetadataFilter& filter) {
    if (query.empty() || top_k == 0) {
        return std::vector<ScoredDocument>{};
    }
    auto rows = selectDocuments(std::string(kSelectColumns) +
                                    " WHERE collection = ? AND embedding IS NOT NULL ORDER BY seq",
                                true, nullptr);
    if (!rows) {
        return rows.error();
    }

    std::vector<ScoredDocument> scored;
    scored.reserve(rows.value().size());
    for (auto& doc : rows.value()) {
        if (!doc.embedding || !matchesFilter(doc, filter)) {
            continue;
        }
        float score = cosineSimilarity(query, *doc.embedding);
        scored.push_back({std::move(doc), score});
    }

    std::size_t k = std::min(top_k, scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(k),
                      scored.end(), [](const ScoredDocument& a, const ScoredDocument& b) {
                          return a.score > b.score;
                      });
    scored.resize(k);
    return scored;
}

Result<std::vector<Document>> SqliteDocumentStore::scrollAll() {
    return selectDocuments(std::string(kSelectColumns) + " WHERE collection = ? ORDER BY seq",
                           false, nullptr);
}

Result<std::vector<Document>> SqliteDocumentStore::getByFile(const std::string& path) {
    return selectDocuments(std::string(kSelectColumns) +
                               " WHERE collection = ? AND file = ? ORDER BY start_line, seq",
                           false, &path);
}

Result<std::size_t> SqliteDocumentStore::deleteByFile(const std::string& path) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    std::lock_guard<std::mutex> lock(connection_->mutex());
    sqlite3* db = connection_->handle();
    if (!db) {
        return Error{ErrorCode::NotInitialized, "Database is closed"};
    }
    auto stmt = prepare(db, "DELETE FROM documents WHERE collection = ? AND file = ?");
    if (!stmt) {
        return stmt.error();
    }
    sqlite3_bind_text(stmt.value().get(), 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.value().get(), 2, path.c_str(), -1, SQLITE_TRANSIENT);
    if (stepWithRetry(stmt.value().get()) != SQLITE_DONE) {
        return Error{ErrorCode::StorageWriteError,
                     "Failed to delete '" + path + "': " + sqlite3_errmsg(db)};
    }
    return static_cast<std::size_t>(sqlite3_changes(db));
}

Result<std::size_t> SqliteDocumentStore::count() {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Document store not initialized"};
    }
    std::lock_guard<std::mutex> lock(connection_->mutex());
    sqlite3* db = connection_->handle();
    if (!db) {
        return Error{ErrorCode::NotInitialized, "Database is closed"};
    }
    auto stmt = prepare(db, "SELECT COUNT(*) FROM documents WHERE collection = ?");
    if (!stmt) {
        return stmt.error();
    }
    sqlite3_bind_text(stmt.value().get(), 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
    if (stepWithRetry(stmt.value().get()) != SQLITE_ROW) {
        return Error{ErrorCode::DatabaseError, sqlite3_errmsg(db)};
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.value().get(), 0));
}

Result<void> SqliteDocumentStore::deleteCollection() {
    std::lock_guard<std::mutex> lock(connection_->mutex());
    sqlite3* db = connection_->handle();
    if (!db) {
        return Error{ErrorCode::NotInitialized, "Database is closed"};
    }
    auto begin = connection_->execute("BEGIN IMMEDIATE TRANSACTION");
    if (!begin) {
        return begin;
    }
    TransactionGuard guard(db);
    for (const char* sql : {"DELETE FROM documents WHERE collection = ?",
                            "DELETE FROM collections WHERE name = ?"}) {
        auto stmt = prepare(db, sql);
        if (!stmt) {
            return stmt.error();
        }
        sqlite3_bind_text(stmt.value().get(), 1, collection_.c_str(), -1, SQLITE_TRANSIENT);
        if (stepWithRetry(stmt.value().get()) != SQLITE_DONE) {
            return Error{ErrorCode::DatabaseError,
                         "Failed to delete collection: " + std::string(sqlite3_errmsg(db))};
        }
    }
    auto commit = connection_->execute("COMMIT");
    if (!commit) {
        return commit;
    }
    guard.commit();
    initialized_ = false;
    spdlog::info("[{}] collection deleted", collection_);
    return Result<void>();
}

void SqliteDocumentStore::close() {
    initialized_ = false;
}

// ===== SqliteDocumentStoreFactory =====

SqliteDocumentStoreFactory::SqliteDocumentStoreFactory(std::shared_ptr<SqliteConnection> connection,
                                                       StorageConfig config)
    : connection_(std::move(connection)), config_(std::move(config)) {}

Result<std::unique_ptr<IDocumentStore>>
SqliteDocumentStoreFactory::open(const std::string& collection) {
    std::unique_ptr<IDocumentStore> store = std::make_unique<SqliteDocumentStore>(
        connection_, collection, config_.dimension, config_.write_batch_size);
    return store;
}

void SqliteDocumentStoreFactory::close() {
    connection_->close();
}

} // namespace coderag::storage
