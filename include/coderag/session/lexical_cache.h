#pragma once

#include <coderag/core/types.h>
#include <coderag/search/lexical_index.h>

#include <filesystem>
#include <memory>
#include <string>

namespace coderag::session {

/**
 * @brief Versioned on-disk copy of a session's lexical index.
 *
 * JSON {format_version, bm25, documents, indexed_files}. The store is the source of truth:
 * a missing, stale or unreadable cache only means the index is rebuilt from it.
 */
class LexicalCache {
public:
    LexicalCache(std::filesystem::path path, std::string format_version);

    /**
     * @brief Load the cached snapshot
     *
     * FileNotFound when absent; CorruptedData on a version mismatch or a malformed file.
     */
    Result<std::shared_ptr<const search::LexicalIndex>> load() const;

    // Atomic; an empty index is not written
    Result<void> save(const search::LexicalIndex& index) const;

    Result<void> remove() const;

    const std::filesystem::path& path() const { return path_; }
    const std::string& formatVersion() const { return format_version_; }

private:
    std::filesystem::path path_;
    std::string format_version_;
};

} // namespace coderag::session
