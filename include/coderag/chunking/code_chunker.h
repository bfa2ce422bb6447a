#pragma once

#include <coderag/chunking/chunk.h>

#include <cstddef>
#include <string>
#include <vector>

namespace coderag::chunking {

/**
 * Dialect used to split a file, selected once per file extension
 */
enum class ChunkingStrategy {
    Declarative,    // Indentation grammar with a real outline (Python)
    BraceDelimited, // C-family grammars, top-level {...} spans
    Fallback        // Fixed-size line windows
};

const char* strategyToString(ChunkingStrategy strategy);

/**
 * Configuration for code chunking
 */
struct ChunkerConfig {
    std::size_t min_chunk_size = 50;         // Declarations below this may be dropped
    std::size_t max_chunk_size = 2000;       // Upper bound on chunk content length
    std::size_t max_context_size = 800;      // Budget for injected "other globals"
    std::size_t fallback_window_lines = 100; // Lines per fallback window
};

/**
 * @brief Pick the chunking dialect for a path from its extension.
 */
ChunkingStrategy strategyForPath(const std::string& path);

/**
 * @brief Language-aware chunker.
 *
 * Deterministic for a given content, path and configuration. Input that fails to parse under
 * its dialect is re-chunked with line windows; no error is ever surfaced.
 */
class CodeChunker {
public:
    explicit CodeChunker(ChunkerConfig config = {});

    std::vector<Chunk> chunk(const std::string& content, const std::string& path) const;

    // Chunk with an explicit dialect instead of the extension-derived one
    std::vector<Chunk> chunkWith(ChunkingStrategy strategy, const std::string& content,
                                 const std::string& path) const;

    const ChunkerConfig& config() const { return config_; }

private:
    ChunkerConfig config_;
};

} // namespace coderag::chunking
