#pragma once

#include <coderag/chunking/code_chunker.h>
#include <coderag/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace coderag {
class WorkerPool;
}
namespace coderag::embedding {
class EmbeddingGateway;
}
namespace coderag::lock {
class RepoLock;
}
namespace coderag::session {
class SessionManager;
}

namespace coderag::indexing {

/**
 * A repository file, path relative to the repository root
 */
struct SourceFile {
    std::string path;
    std::string content;
};

/**
 * @brief Options for one indexing run
 */
struct IndexingOptions {
    bool reset_first = true;             // Start from an empty session
    bool replace_existing_files = false; // Drop stored chunks of re-indexed files
    std::optional<std::string> repo_url; // Saved with the session context when set
    nlohmann::json global_context;       // Defaults to the indexed file tree
    std::optional<std::chrono::milliseconds> lock_timeout;
};

/**
 * @brief Counters of one indexing run
 */
struct IndexingReport {
    std::string session_id;
    std::size_t files = 0;
    std::size_t chunks = 0;
    std::size_t embedded = 0; // Chunks that received a vector
    std::size_t added = 0;    // Documents written
    std::size_t dropped = 0;  // chunks - added
    std::chrono::milliseconds duration{0};

    nlohmann::json toJson() const;
};

/**
 * @brief Progress callback: stage name ("chunk", "embed", "store"), done, total
 */
using ProgressCallback = std::function<void(std::string_view stage, std::size_t done,
                                            std::size_t total)>;

/**
 * @brief Chunk, embed and store a repository into its session, under the repository lock.
 */
class RepositoryIndexer {
public:
    RepositoryIndexer(std::shared_ptr<session::SessionManager> sessions,
                      std::shared_ptr<lock::RepoLock> locks,
                      std::shared_ptr<embedding::EmbeddingGateway> gateway,
                      chunking::ChunkerConfig chunker_config,
                      std::shared_ptr<WorkerPool> pool = nullptr);

    /**
     * @brief Index files into session_id
     *
     * LockTimeout when another writer holds the session ("repository busy").
     */
    Result<IndexingReport> indexRepository(const std::string& session_id,
                                           const std::vector<SourceFile>& files,
                                           const IndexingOptions& options = {},
                                           const ProgressCallback& progress = {});

private:
    std::vector<chunking::Chunk> chunkFiles(const std::vector<SourceFile>& files,
                                            const ProgressCallback& progress) const;

    std::shared_ptr<session::SessionManager> sessions_;
    std::shared_ptr<lock::RepoLock> locks_;
    std::shared_ptr<embedding::EmbeddingGateway> gateway_;
    chunking::CodeChunker chunker_;
    std::shared_ptr<WorkerPool> pool_;
};

/**
 * Configuration for repository file discovery
 */
struct FileWalkerConfig {
    std::size_t max_file_size = 1024 * 1024;
    std::set<std::string> excluded_dirs = {".git",  "node_modules", "build",      "dist",
                                           "venv",  ".venv",        "__pycache__", "target"};
};

// Binary content has a NUL byte in its first 8 KiB
bool looksLikeText(std::string_view content);

/**
 * @brief Text files below root, sorted by relative path
 */
Result<std::vector<SourceFile>> collectSourceFiles(const std::filesystem::path& root,
                                                   const FileWalkerConfig& config = {});

} // namespace coderag::indexing
