#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace coderag::chunking {

/**
 * Kind of retrievable unit produced by the chunker
 */
enum class ChunkKind { Class, Function, Method, Script, GlobalContext, TextBlock };

const char* chunkKindToString(ChunkKind kind);
std::optional<ChunkKind> chunkKindFromString(std::string_view name);

/**
 * A self-contained span of source text with metadata.
 *
 * content = synthesized context header (header_size bytes, may be zero) + verbatim source span.
 */
struct Chunk {
    std::string content;
    std::string file_path;
    ChunkKind kind = ChunkKind::TextBlock;
    std::string symbol_name;
    std::size_t start_line = 1; // 1-based
    std::optional<std::string> enclosing_type;
    std::size_t header_size = 0;

    std::string_view body() const {
        return std::string_view(content).substr(header_size < content.size() ? header_size
                                                                             : content.size());
    }

    std::string_view header() const {
        return std::string_view(content).substr(0, std::min(header_size, content.size()));
    }
};

} // namespace coderag::chunking
