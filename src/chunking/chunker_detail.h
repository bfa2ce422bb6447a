#pragma once

#include <coderag/chunking/code_chunker.h>
#include <coderag/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace coderag::chunking::detail {

// A contiguous slice of the source with its 1-based first line
struct LineSpan {
    std::string_view text;
    std::size_t start_line = 1;
};

// Maps byte offsets in a text to 1-based line numbers
class LineIndex {
public:
    explicit LineIndex(std::string_view text);
    std::size_t lineOf(std::size_t offset) const;

private:
    std::vector<std::size_t> starts_;
};

// Split text into consecutive spans holding at most max_lines lines and budget bytes each.
// A single line longer than budget is cut at the byte level.
std::vector<LineSpan> splitByLines(std::string_view text, std::size_t first_line,
                                   std::size_t budget, std::size_t max_lines);

// Remove leading/trailing blank lines, adjusting start_line accordingly
LineSpan trimBlankLines(LineSpan span);

bool isBlank(std::string_view text);

// Append one chunk made of header + body when it fits max_chunk_size. Otherwise drop the header
// when the body alone fits, or line-split the body into TextBlock parts as a last resort.
// Whole chunks keep proto.start_line; split parts carry their own first line.
void emitBounded(std::vector<Chunk>& out, const Chunk& proto, std::string_view header,
                 LineSpan body, const ChunkerConfig& config);

std::vector<Chunk> chunkLineWindows(std::string_view content, const std::string& path,
                                    const ChunkerConfig& config);

Result<std::vector<Chunk>> chunkDeclarative(std::string_view content, const std::string& path,
                                            const ChunkerConfig& config);

Result<std::vector<Chunk>> chunkBraceDelimited(std::string_view content, const std::string& path,
                                               const ChunkerConfig& config);

} // namespace coderag::chunking::detail
