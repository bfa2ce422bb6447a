#include <coderag/embedding/embedding_gateway.h>
#include <coderag/session/session_id.h>
#include <coderag/session/session_store.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <string_view>
#include <unordered_map>

namespace coderag::session {

namespace {

// Ordinal suffix of a "<file>_<n>" document id
std::optional<std::size_t> idOrdinal(const std::string& id) {
    auto pos = id.rfind('_');
    if (pos == std::string::npos || pos + 1 >= id.size()) {
        return std::nullopt;
    }
    std::size_t value = 0;
    const char* first = id.data() + pos + 1;
    const char* last = id.data() + id.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

storage::Document toDocument(const chunking::Chunk& chunk, std::string id) {
    storage::Document doc;
    doc.id = std::move(id);
    doc.content = chunk.content;
    doc.metadata[storage::kMetaFile] = chunk.file_path;
    doc.metadata[storage::kMetaKind] = chunking::chunkKindToString(chunk.kind);
    doc.metadata[storage::kMetaSymbol] = chunk.symbol_name;
    doc.metadata[storage::kMetaStartLine] = std::to_string(chunk.start_line);
    if (chunk.enclosing_type) {
        doc.metadata[storage::kMetaEnclosingType] = *chunk.enclosing_type;
    }
    return doc;
}

// Same documents (id and content) as the durable store, in any order
bool mirrorsStore(const search::LexicalIndex& cached, const std::vector<storage::Document>& stored) {
    if (cached.documents.size() != stored.size()) {
        return false;
    }
    std::unordered_map<std::string_view, std::string_view> contents;
    contents.reserve(stored.size());
    for (const auto& doc : stored) {
        contents.emplace(doc.id, doc.content);
    }
    for (const auto& doc : cached.documents) {
        auto it = contents.find(doc.id);
        if (it == contents.end() || it->second != doc.content) {
            return false;
        }
    }
    return contents.size() == stored.size();
}

} // namespace

Result<std::shared_ptr<SessionStore>> SessionStore::create(const std::string& session_id,
                                                           SessionDependencies deps) {
    auto clean = sanitizeSessionId(session_id);
    if (!clean) {
        return clean.error();
    }
    if (!deps.store_factory || !deps.gateway) {
        return Error{ErrorCode::InvalidArgument, "Session store needs a store factory and gateway"};
    }
    return std::shared_ptr<SessionStore>(new SessionStore(std::move(clean).value(), std::move(deps)));
}

SessionStore::SessionStore(std::string session_id, SessionDependencies deps)
    : session_id_(std::move(session_id)), collection_name_("repo_" + session_id_),
      deps_(std::move(deps)), retriever_(deps_.search, deps_.pool),
      context_(deps_.storage.context_dir / (session_id_ + ".json")),
      cache_(deps_.storage.context_dir / (session_id_ + "_bm25.json"),
             deps_.storage.cache_format_version) {}

SessionStore::~SessionStore() {
    close();
}

Result<void> SessionStore::initialize() {
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        if (initialized_) {
            return {};
        }
    }
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    return initializeLocked();
}

Result<void> SessionStore::initializeLocked() {
    if (initialized_) {
        return {};
    }

    auto opened = deps_.store_factory->open(collection_name_);
    if (!opened) {
        return opened.error();
    }
    auto store = std::move(opened).value();
    if (auto r = store->initialize(); !r) {
        return r;
    }
    store_ = std::move(store);

    restoreContext();

    auto stored = store_->scrollAll();
    if (!stored) {
        store_->close();
        store_.reset();
        return stored.error();
    }

    auto cached = cache_.load();
    if (cached && !mirrorsStore(*cached.value(), stored.value())) {
        spdlog::warn("[{}] lexical cache is stale ({} cached, {} stored documents)", session_id_,
                     cached.value()->size(), stored.value().size());
        cached = Error{ErrorCode::CorruptedData, "stale lexical cache"};
    } else if (!cached && cached.error().code == ErrorCode::CorruptedData) {
        spdlog::warn("[{}] discarding lexical cache: {}", session_id_, cached.error().message);
        if (auto removed = cache_.remove(); !removed) {
            spdlog::warn("[{}] {}", session_id_, removed.error().message);
        }
    }

    if (cached) {
        spdlog::debug("[{}] lexical cache hit: {} documents", session_id_,
                      cached.value()->size());
        publish(std::move(cached).value());
    } else {
        rebuildFrom(std::move(stored).value());
    }

    initialized_ = true;
    spdlog::debug("[{}] session store initialized", session_id_);
    return {};
}

// Built on the calling thread: write_mutex_ holders must not wait on the worker pool
std::shared_ptr<const search::LexicalIndex>
SessionStore::buildIndex(std::vector<storage::Document> docs) const {
    return search::LexicalIndex::build(std::move(docs), retriever_.tokenizer(), deps_.search.bm25);
}

void SessionStore::publish(std::shared_ptr<const search::LexicalIndex> snapshot) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(snapshot);
}

std::shared_ptr<const search::LexicalIndex> SessionStore::lexicalSnapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

Result<void> SessionStore::rebuildLexicalIndex() {
    auto all = store_->scrollAll();
    if (!all) {
        return all.error();
    }
    rebuildFrom(std::move(all).value());
    return {};
}

void SessionStore::rebuildFrom(std::vector<storage::Document> stored) {
    spdlog::info("[{}] rebuilding lexical index from {} stored documents", session_id_,
                 stored.size());
    auto snapshot = buildIndex(std::move(stored));
    publish(snapshot);
    if (auto saved = cache_.save(*snapshot); !saved) {
        spdlog::warn("[{}] lexical cache not written: {}", session_id_, saved.error().message);
    }
}

void SessionStore::restoreContext() {
    auto data = context_.load();
    std::lock_guard<std::mutex> lock(meta_mutex_);
    if (!data) {
        if (data.error().code != ErrorCode::FileNotFound) {
            spdlog::warn("[{}] context not loaded: {}", session_id_, data.error().message);
        }
        return;
    }
    const auto& ctx = data.value();
    auto url = ctx.find("repo_url");
    if (url != ctx.end() && url->is_string()) {
        repo_url_ = url->get<std::string>();
    } else {
        repo_url_.reset();
    }
    global_context_ = ctx.value("global_context", nlohmann::json::object());
}

Result<std::size_t> SessionStore::addDocuments(const std::vector<chunking::Chunk>& chunks,
                                               const std::vector<Embedding>& embeddings,
                                               const AddOptions& options) {
    if (chunks.size() != embeddings.size()) {
        return Error{ErrorCode::InvalidArgument, "chunks and embeddings differ in length"};
    }
    if (chunks.empty()) {
        return std::size_t{0};
    }

    std::lock_guard<std::mutex> writer(write_mutex_);
    if (auto r = initialize(); !r) {
        return r.error();
    }
    std::shared_lock<std::shared_mutex> state(state_mutex_);
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Session store closed"};
    }

    auto current = lexicalSnapshot();
    std::vector<storage::Document> corpus;
    if (current) {
        corpus = current->documents;
    }

    auto stored_count = store_->count();
    if (!stored_count) {
        return stored_count.error();
    }
    std::size_t next_ordinal = std::max(corpus.size(), stored_count.value());
    for (const auto& doc : corpus) {
        if (auto ordinal = idOrdinal(doc.id); ordinal && *ordinal >= next_ordinal) {
            next_ordinal = *ordinal + 1;
        }
    }

    const std::size_t dimension = deps_.storage.dimension;
    std::vector<storage::Document> documents;
    std::vector<Embedding> vectors;
    std::set<std::string> files;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& vec = embeddings[i];
        if (vec.empty() || (dimension != 0 && vec.size() != dimension)) {
            continue;
        }
        const auto& file = chunks[i].file_path.empty() ? std::string("unknown")
                                                        : chunks[i].file_path;
        documents.push_back(
            toDocument(chunks[i], file + "_" + std::to_string(next_ordinal + documents.size())));
        vectors.push_back(vec);
        files.insert(chunks[i].file_path);
    }

    const std::size_t dropped = chunks.size() - documents.size();
    if (documents.empty()) {
        spdlog::error("[{}] no usable embeddings for {} chunks", session_id_, chunks.size());
        return std::size_t{0};
    }
    if (dropped > 0) {
        spdlog::warn("[{}] dropped {} chunks without a valid embedding", session_id_, dropped);
    }

    if (options.replace_existing_files) {
        for (const auto& file : files) {
            if (!current || current->indexed_files.count(file) == 0) {
                continue;
            }
            auto removed = store_->deleteByFile(file);
            if (!removed) {
                return removed.error();
            }
            spdlog::debug("[{}] replaced {} stale documents of {}", session_id_, removed.value(),
                          file);
        }
        corpus.erase(std::remove_if(corpus.begin(), corpus.end(),
                                    [&files](const storage::Document& doc) {
                                        return files.count(doc.file()) > 0;
                                    }),
                     corpus.end());
    }

    auto written = store_->add(documents, vectors);
    if (!written) {
        spdlog::error("[{}] document write failed: {}", session_id_, written.error().message);
        if (auto rebuilt = rebuildLexicalIndex(); !rebuilt) {
            spdlog::error("[{}] lexical rebuild failed: {}", session_id_,
                          rebuilt.error().message);
        }
        return written.error();
    }

    corpus.reserve(corpus.size() + documents.size());
    for (auto& doc : documents) {
        corpus.push_back(std::move(doc));
    }
    auto snapshot = buildIndex(std::move(corpus));
    publish(snapshot);
    if (auto saved = cache_.save(*snapshot); !saved) {
        spdlog::warn("[{}] lexical cache not written: {}", session_id_, saved.error().message);
    }

    spdlog::info("[{}] added {} documents ({} total, {} files)", session_id_, written.value(),
                 snapshot->size(), snapshot->indexed_files.size());
    return written.value();
}

Result<std::vector<search::SearchResult>> SessionStore::search(const std::string& query,
                                                               std::size_t top_k) {
    if (top_k == 0) {
        top_k = deps_.search.default_top_k;
    }
    if (auto r = initialize(); !r) {
        return r.error();
    }
    std::shared_lock<std::shared_mutex> state(state_mutex_);
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Session store closed"};
    }
    return retriever_.search(query, top_k, *deps_.gateway, *store_, lexicalSnapshot());
}

Result<void> SessionStore::reset() {
    std::lock_guard<std::mutex> writer(write_mutex_);
    if (auto r = initialize(); !r) {
        return r;
    }
    std::unique_lock<std::shared_mutex> state(state_mutex_);
    if (!store_) {
        return Error{ErrorCode::NotInitialized, "Session store closed"};
    }
    if (auto r = store_->deleteCollection(); !r) {
        return r;
    }
    if (auto r = store_->initialize(); !r) {
        return r;
    }

    if (auto r = context_.remove(); !r) {
        spdlog::warn("[{}] {}", session_id_, r.error().message);
    }
    if (auto r = cache_.remove(); !r) {
        spdlog::warn("[{}] {}", session_id_, r.error().message);
    }

    publish(buildIndex({}));
    {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        repo_url_.reset();
        global_context_ = nlohmann::json::object();
    }
    spdlog::info("[{}] session reset", session_id_);
    return {};
}

Result<std::vector<storage::Document>> SessionStore::documentsByFile(const std::string& path) {
    if (auto r = initialize(); !r) {
        return r.error();
    }
    std::vector<storage::Document> out;
    auto snapshot = lexicalSnapshot();
    if (!snapshot) {
        return out;
    }
    for (const auto& doc : snapshot->documents) {
        if (doc.file() == path) {
            out.push_back(doc);
        }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const storage::Document& a, const storage::Document& b) {
                         return a.startLine() < b.startLine();
                     });
    return out;
}

void SessionStore::close() {
    std::lock_guard<std::mutex> writer(write_mutex_);
    std::unique_lock<std::shared_mutex> state(state_mutex_);
    if (store_) {
        store_->close();
        store_.reset();
    }
    initialized_ = false;
    publish(nullptr);
}

Result<void> SessionStore::saveContext(const std::string& repo_url,
                                       const nlohmann::json& global_context) {
    auto saved = context_.save(repo_url, global_context);
    if (!saved) {
        spdlog::error("[{}] failed to save context: {}", session_id_, saved.error().message);
        return saved;
    }
    std::lock_guard<std::mutex> lock(meta_mutex_);
    repo_url_ = repo_url;
    global_context_ = global_context.is_null() ? nlohmann::json::object() : global_context;
    return {};
}

std::optional<nlohmann::json> SessionStore::loadContext() {
    auto data = context_.load();
    if (!data) {
        if (data.error().code != ErrorCode::FileNotFound) {
            spdlog::error("[{}] failed to load context: {}", session_id_, data.error().message);
        }
        return std::nullopt;
    }
    restoreContext();
    return std::move(data).value();
}

Result<void> SessionStore::saveReport(const std::string& report, const std::string& language) {
    return context_.saveReport(report, language);
}

std::optional<std::string> SessionStore::report(const std::string& language) const {
    return context_.report(language);
}

std::vector<std::string> SessionStore::availableLanguages() const {
    return context_.availableLanguages();
}

bool SessionStore::hasIndex() const {
    return context_.hasIndex();
}

std::optional<std::string> SessionStore::repoUrl() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return repo_url_;
}

nlohmann::json SessionStore::globalContext() const {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    return global_context_;
}

std::set<std::string> SessionStore::indexedFiles() const {
    auto snapshot = lexicalSnapshot();
    return snapshot ? snapshot->indexed_files : std::set<std::string>{};
}

std::size_t SessionStore::documentCount() const {
    auto snapshot = lexicalSnapshot();
    return snapshot ? snapshot->size() : 0;
}

bool SessionStore::isInitialized() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return initialized_;
}

} // namespace coderag::session
