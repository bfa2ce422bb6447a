#pragma once

#include <coderag/chunking/code_chunker.h>
#include <coderag/core/types.h>
#include <coderag/embedding/embedding_gateway.h>
#include <coderag/lock/repo_lock.h>
#include <coderag/search/hybrid_retriever.h>
#include <coderag/storage/document_store.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace coderag::config {

/**
 * Session cache configuration
 */
struct SessionConfig {
    std::size_t max_sessions = 100;
    std::size_t worker_threads = 0; // 0 = hardware concurrency
};

/**
 * @brief Every tunable of the engine, grouped by subsystem.
 */
struct EngineConfig {
    chunking::ChunkerConfig chunking;
    search::SearchConfig search;
    embedding::EmbeddingConfig embedding;
    storage::StorageConfig storage;
    SessionConfig session;
    lock::LockConfig lock;

    // Defaults rooted at data_dir (context and lock directories below it)
    static EngineConfig defaults(const std::filesystem::path& data_dir);
};

/**
 * @brief Load configuration: defaults, then the TOML file, then CODERAG_* environment.
 *
 * A missing file is not an error. Malformed numbers or unknown backend names are
 * InvalidArgument naming the offending key.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& config_path = {});

// Apply one "[section] key = value" setting
Result<void> applySetting(EngineConfig& config, const std::string& section, const std::string& key,
                          const std::string& value);

Result<void> applyEnvironmentOverrides(EngineConfig& config);

} // namespace coderag::config
