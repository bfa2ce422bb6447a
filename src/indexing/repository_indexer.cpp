#include <coderag/core/worker_pool.h>
#include <coderag/embedding/embedding_gateway.h>
#include <coderag/indexing/repository_indexer.h>
#include <coderag/lock/repo_lock.h>
#include <coderag/session/session_manager.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <future>
#include <sstream>

namespace coderag::indexing {

nlohmann::json IndexingReport::toJson() const {
    return {{"session_id", session_id}, {"files", files},     {"chunks", chunks},
            {"embedded", embedded},     {"added", added},     {"dropped", dropped},
            {"duration_ms", duration.count()}};
}

RepositoryIndexer::RepositoryIndexer(std::shared_ptr<session::SessionManager> sessions,
                                     std::shared_ptr<lock::RepoLock> locks,
                                     std::shared_ptr<embedding::EmbeddingGateway> gateway,
                                     chunking::ChunkerConfig chunker_config,
                                     std::shared_ptr<WorkerPool> pool)
    : sessions_(std::move(sessions)), locks_(std::move(locks)), gateway_(std::move(gateway)),
      chunker_(chunker_config), pool_(std::move(pool)) {}

std::vector<chunking::Chunk>
RepositoryIndexer::chunkFiles(const std::vector<SourceFile>& files,
                              const ProgressCallback& progress) const {
    std::vector<std::vector<chunking::Chunk>> per_file(files.size());
    if (pool_) {
        std::vector<std::future<std::vector<chunking::Chunk>>> pending;
        pending.reserve(files.size());
        for (const auto& file : files) {
            pending.push_back(
                pool_->submit([this, &file]() { return chunker_.chunk(file.content, file.path); }));
        }
        for (std::size_t i = 0; i < pending.size(); ++i) {
            per_file[i] = pending[i].get();
            if (progress) {
                progress("chunk", i + 1, files.size());
            }
        }
    } else {
        for (std::size_t i = 0; i < files.size(); ++i) {
            per_file[i] = chunker_.chunk(files[i].content, files[i].path);
            if (progress) {
                progress("chunk", i + 1, files.size());
            }
        }
    }

    std::vector<chunking::Chunk> chunks;
    for (auto& file_chunks : per_file) {
        for (auto& chunk : file_chunks) {
            chunks.push_back(std::move(chunk));
        }
    }
    return chunks;
}

Result<IndexingReport> RepositoryIndexer::indexRepository(const std::string& session_id,
                                                          const std::vector<SourceFile>& files,
                                                          const IndexingOptions& options,
                                                          const ProgressCallback& progress) {
    auto started = std::chrono::steady_clock::now();

    auto store = sessions_->getOrCreate(session_id);
    if (!store) {
        return store.error();
    }
    auto& session = *store.value();

    if (locks_ && locks_->isLocked(session.sessionId())) {
        spdlog::info("[{}] another writer is indexing this repository, waiting", session.sessionId());
    }
    std::optional<lock::RepoLockGuard> guard;
    if (locks_) {
        auto acquired = locks_->acquire(session.sessionId(), options.lock_timeout);
        if (!acquired) {
            return acquired.error();
        }
        guard.emplace(std::move(acquired).value());
    }

    if (options.reset_first) {
        if (auto r = session.reset(); !r) {
            return r.error();
        }
    }

    IndexingReport report;
    report.session_id = session.sessionId();
    report.files = files.size();

    auto chunks = chunkFiles(files, progress);
    report.chunks = chunks.size();
    spdlog::info("[{}] {} files -> {} chunks", report.session_id, report.files, report.chunks);

    if (!chunks.empty()) {
        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& chunk : chunks) {
            texts.push_back(chunk.content);
        }
        auto embeddings = gateway_->embedBatch(texts);
        report.embedded = static_cast<std::size_t>(
            std::count_if(embeddings.begin(), embeddings.end(),
                          [](const Embedding& e) { return !e.empty(); }));
        if (progress) {
            progress("embed", report.embedded, chunks.size());
        }

        session::AddOptions add_options;
        add_options.replace_existing_files = options.replace_existing_files;
        auto added = session.addDocuments(chunks, embeddings, add_options);
        if (!added) {
            return added.error();
        }
        report.added = added.value();
        if (progress) {
            progress("store", report.added, chunks.size());
        }
    }
    report.dropped = report.chunks - std::min(report.chunks, report.added);

    if (options.repo_url) {
        nlohmann::json context = options.global_context;
        if (context.is_null()) {
            std::vector<std::string> tree;
            tree.reserve(files.size());
            for (const auto& file : files) {
                tree.push_back(file.path);
            }
            context = {{"file_tree", tree}, {"file_count", files.size()}};
        }
        if (auto r = session.saveContext(*options.repo_url, context); !r) {
            return r.error();
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("[{}] indexed: {} chunks, {} embedded, {} added, {} dropped in {} ms",
                 report.session_id, report.chunks, report.embedded, report.added, report.dropped,
                 report.duration.count());
    return report;
}

bool looksLikeText(std::string_view content) {
    auto probe = content.substr(0, std::min<std::size_t>(content.size(), 8192));
    return probe.find('\0') == std::string_view::npos;
}

Result<std::vector<SourceFile>> collectSourceFiles(const std::filesystem::path& root,
                                                   const FileWalkerConfig& config) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Error{ErrorCode::FileNotFound, "Not a directory: " + root.string()};
    }

    std::vector<SourceFile> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied, "Cannot list " + root.string() + ": " +
                                                      ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Skipping unreadable entry under {}: {}", root.string(), ec.message());
            ec.clear();
            continue;
        }
        const auto& entry = *it;
        auto name = entry.path().filename().string();
        if (entry.is_directory(ec)) {
            if (config.excluded_dirs.count(name) > 0) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto size = entry.file_size(ec);
        if (ec || size == 0 || size > config.max_file_size) {
            ec.clear();
            continue;
        }

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in) {
            continue;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        std::string content = buffer.str();
        if (!looksLikeText(content)) {
            continue;
        }
        files.push_back({fs::relative(entry.path(), root).generic_string(), std::move(content)});
    }

    std::sort(files.begin(), files.end(),
              [](const SourceFile& a, const SourceFile& b) { return a.path < b.path; });
    spdlog::debug("Collected {} source files under {}", files.size(), root.string());
    return files;
}

} // namespace coderag::indexing
