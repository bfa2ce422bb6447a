#include "chunker_detail.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace coderag::chunking {

const char* chunkKindToString(ChunkKind kind) {
    switch (kind) {
        case ChunkKind::Class: return "class";
        case ChunkKind::Function: return "function";
        case ChunkKind::Method: return "method";
        case ChunkKind::Script: return "script";
        case ChunkKind::GlobalContext: return "global_context";
        case ChunkKind::TextBlock: return "text_chunk";
    }
    return "text_chunk";
}

std::optional<ChunkKind> chunkKindFromString(std::string_view name) {
    static constexpr std::array<ChunkKind, 6> kAll = {
        ChunkKind::Class,  ChunkKind::Function,      ChunkKind::Method,
        ChunkKind::Script, ChunkKind::GlobalContext, ChunkKind::TextBlock};
    for (auto kind : kAll) {
        if (name == chunkKindToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const char* strategyToString(ChunkingStrategy strategy) {
    switch (strategy) {
        case ChunkingStrategy::Declarative: return "declarative";
        case ChunkingStrategy::BraceDelimited: return "brace";
        case ChunkingStrategy::Fallback: return "fallback";
    }
    return "fallback";
}

ChunkingStrategy strategyForPath(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".py" || ext == ".pyi") {
        return ChunkingStrategy::Declarative;
    }

    static const std::array<const char*, 22> kBraceExtensions = {
        ".java", ".js",  ".ts",  ".jsx", ".tsx", ".mjs",   ".cjs", ".go",
        ".cpp",  ".cc",  ".cxx", ".c",   ".h",   ".hpp",   ".hh",  ".cs",
        ".php",  ".rs",  ".kt",  ".kts", ".swift", ".scala"};
    for (const char* candidate : kBraceExtensions) {
        if (ext == candidate) {
            return ChunkingStrategy::BraceDelimited;
        }
    }
    return ChunkingStrategy::Fallback;
}

CodeChunker::CodeChunker(ChunkerConfig config) : config_(config) {
    if (config_.max_chunk_size == 0) {
        config_.max_chunk_size = 1;
    }
    if (config_.fallback_window_lines == 0) {
        config_.fallback_window_lines = 1;
    }
}

std::vector<Chunk> CodeChunker::chunk(const std::string& content, const std::string& path) const {
    return chunkWith(strategyForPath(path), content, path);
}

std::vector<Chunk> CodeChunker::chunkWith(ChunkingStrategy strategy, const std::string& content,
                                          const std::string& path) const {
    if (content.empty()) {
        return {};
    }

    Result<std::vector<Chunk>> result = std::vector<Chunk>{};
    switch (strategy) {
        case ChunkingStrategy::Declarative:
            result = detail::chunkDeclarative(content, path, config_);
            break;
        case ChunkingStrategy::BraceDelimited:
            result = detail::chunkBraceDelimited(content, path, config_);
            break;
        case ChunkingStrategy::Fallback:
            return detail::chunkLineWindows(content, path, config_);
    }

    if (!result) {
        spdlog::debug("Chunker: {} parse failed for {} ({}), using line windows",
                      strategyToString(strategy), path, result.error().message);
        return detail::chunkLineWindows(content, path, config_);
    }
    if (result.value().empty() && !detail::isBlank(content)) {
        return detail::chunkLineWindows(content, path, config_);
    }
    return std::move(result).value();
}

namespace detail {

LineIndex::LineIndex(std::string_view text) {
    starts_.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            starts_.push_back(i + 1);
        }
    }
}

std::size_t LineIndex::lineOf(std::size_t offset) const {
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    return static_cast<std::size_t>(it - starts_.begin());
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

LineSpan trimBlankLines(LineSpan span) {
    std::string_view text = span.text;
    // Leading blank lines
    while (!text.empty()) {
        auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        if (nl == std::string_view::npos || !isBlank(line)) {
            break;
        }
        text.remove_prefix(nl + 1);
        ++span.start_line;
    }
    // Trailing whitespace (whole blank lines and the final newline)
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    span.text = text;
    return span;
}

std::vector<LineSpan> splitByLines(std::string_view text, std::size_t first_line,
                                   std::size_t budget, std::size_t max_lines) {
    std::vector<LineSpan> spans;
    budget = std::max<std::size_t>(budget, 1);
    max_lines = std::max<std::size_t>(max_lines, 1);

    std::size_t pos = 0;
    std::size_t line = first_line;
    std::size_t cur_start = 0;
    std::size_t cur_line = first_line;
    std::size_t cur_lines = 0;

    auto flush = [&](std::size_t end) {
        if (cur_lines > 0) {
            std::string_view piece = text.substr(cur_start, end - cur_start);
            if (!piece.empty() && piece.back() == '\n') {
                piece.remove_suffix(1);
            }
            spans.push_back({piece, cur_line});
        }
        cur_lines = 0;
    };

    while (pos < text.size()) {
        auto nl = text.find('\n', pos);
        std::size_t end = (nl == std::string_view::npos) ? text.size() : nl + 1;
        std::size_t line_len = end - pos;

        if (line_len > budget) {
            flush(pos);
            for (std::size_t off = pos; off < end; off += budget) {
                std::string_view piece = text.substr(off, std::min(budget, end - off));
                if (!piece.empty() && piece.back() == '\n') {
                    piece.remove_suffix(1);
                }
                if (!piece.empty()) {
                    spans.push_back({piece, line});
                }
            }
        } else {
            if (cur_lines > 0 && ((pos + line_len - cur_start) > budget || cur_lines >= max_lines)) {
                flush(pos);
            }
            if (cur_lines == 0) {
                cur_start = pos;
                cur_line = line;
            }
            ++cur_lines;
        }
        pos = end;
        ++line;
    }
    flush(text.size());
    return spans;
}

void emitBounded(std::vector<Chunk>& out, const Chunk& proto, std::string_view header,
                 LineSpan body, const ChunkerConfig& config) {
    const std::size_t max = config.max_chunk_size;

    if (header.size() + body.text.size() <= max) {
        Chunk chunk = proto;
        chunk.content.reserve(header.size() + body.text.size());
        chunk.content.assign(header);
        chunk.content.append(body.text);
        chunk.header_size = header.size();
        out.push_back(std::move(chunk));
        return;
    }

    if (body.text.size() <= max) {
        Chunk chunk = proto;
        chunk.content.assign(body.text);
        chunk.header_size = 0;
        out.push_back(std::move(chunk));
        return;
    }

    const bool keep_header = header.size() < max / 2;
    const std::size_t budget = keep_header ? max - header.size() : max;
    auto parts = splitByLines(body.text, body.start_line, budget, static_cast<std::size_t>(-1));
    spdlog::debug("Chunker: '{}' in {} exceeds {} bytes, split into {} text blocks",
                  proto.symbol_name, proto.file_path, max, parts.size());
    for (const auto& part : parts) {
        if (isBlank(part.text)) {
            continue;
        }
        Chunk chunk = proto;
        if (proto.kind != ChunkKind::GlobalContext) {
            chunk.kind = ChunkKind::TextBlock;
        }
        if (keep_header) {
            chunk.content.assign(header);
            chunk.header_size = header.size();
        } else {
            chunk.content.clear();
            chunk.header_size = 0;
        }
        chunk.content.append(part.text);
        chunk.start_line = part.start_line;
        out.push_back(std::move(chunk));
    }
}

std::vector<Chunk> chunkLineWindows(std::string_view content, const std::string& path,
                                    const ChunkerConfig& config) {
    std::vector<Chunk> chunks;
    for (const auto& span :
         splitByLines(content, 1, config.max_chunk_size, config.fallback_window_lines)) {
        if (isBlank(span.text)) {
            continue;
        }
        Chunk chunk;
        chunk.content.assign(span.text);
        chunk.file_path = path;
        chunk.kind = ChunkKind::TextBlock;
        chunk.symbol_name = "chunk_" + std::to_string(span.start_line - 1);
        chunk.start_line = span.start_line;
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

} // namespace detail

} // namespace coderag::chunking
