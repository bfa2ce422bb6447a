#include "chunker_detail.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>

namespace coderag::chunking::detail {

namespace {

// One physical line of a Python source
struct PyLine {
    std::size_t begin = 0; // offset of first byte
    std::size_t end = 0;   // offset one past the last byte, newline excluded
    std::size_t indent = 0;
    bool blank = false;        // whitespace or comment only
    bool continuation = false; // starts inside brackets, a string or after a backslash
};

// A statement at a given indentation: lines [first, last] inclusive
struct PyStmt {
    std::size_t first = 0;
    std::size_t last = 0;
};

bool isIdentChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

Result<std::vector<PyLine>> scanLines(std::string_view src) {
    std::vector<PyLine> lines;
    int depth = 0;
    char triple = 0;
    bool backslash = false;

    std::size_t pos = 0;
    while (pos <= src.size()) {
        auto nl = src.find('\n', pos);
        std::size_t end = (nl == std::string_view::npos) ? src.size() : nl;
        std::size_t scan_end = end;
        if (scan_end > pos && src[scan_end - 1] == '\r') {
            --scan_end;
        }

        PyLine line;
        line.begin = pos;
        line.end = end;
        line.continuation = depth > 0 || triple != 0 || backslash;
        backslash = false;

        std::size_t i = pos;
        while (i < scan_end && (src[i] == ' ' || src[i] == '\t' || src[i] == '\f')) {
            line.indent = (src[i] == '\t') ? (line.indent / 8 + 1) * 8 : line.indent + 1;
            ++i;
        }
        if (!line.continuation) {
            line.blank = (i >= scan_end || src[i] == '#');
        }

        while (i < scan_end) {
            char c = src[i];
            if (triple != 0) {
                if (c == '\\') {
                    i += 2;
                    continue;
                }
                if (c == triple && src.substr(i, 3) == std::string(3, triple)) {
                    triple = 0;
                    i += 3;
                    continue;
                }
                ++i;
                continue;
            }
            if (c == '#') {
                break;
            }
            if (c == '"' || c == '\'') {
                if (src.substr(i, 3) == std::string(3, c)) {
                    triple = c;
                    i += 3;
                    continue;
                }
                std::size_t j = i + 1;
                while (j < scan_end && src[j] != c) {
                    j += (src[j] == '\\') ? 2 : 1;
                }
                if (j >= scan_end) {
                    return Error{ErrorCode::ParseError,
                                 "unterminated string literal at line " +
                                     std::to_string(lines.size() + 1)};
                }
                i = j + 1;
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                ++depth;
            } else if (c == ')' || c == ']' || c == '}') {
                if (--depth < 0) {
                    return Error{ErrorCode::ParseError, "unmatched closing bracket at line " +
                                                            std::to_string(lines.size() + 1)};
                }
            } else if (c == '\\' && i + 1 == scan_end) {
                backslash = true;
            }
            ++i;
        }

        lines.push_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        pos = nl + 1;
    }

    if (triple != 0) {
        return Error{ErrorCode::ParseError, "unterminated triple-quoted string"};
    }
    if (depth != 0) {
        return Error{ErrorCode::ParseError, "unbalanced brackets at end of file"};
    }
    return lines;
}

bool startsStatement(const PyLine& line) {
    return !line.blank && !line.continuation;
}

// Split lines [from, to) into statements at the given indentation
Result<std::vector<PyStmt>> collectStatements(const std::vector<PyLine>& lines, std::size_t from,
                                              std::size_t to, std::size_t indent) {
    std::vector<PyStmt> stmts;
    for (std::size_t i = from; i < to; ++i) {
        const auto& line = lines[i];
        if (!startsStatement(line)) {
            continue;
        }
        if (line.indent == indent) {
            if (!stmts.empty()) {
                stmts.back().last = i - 1;
            }
            stmts.push_back({i, i});
        } else if (line.indent < indent) {
            return Error{ErrorCode::ParseError,
                         "unindent does not match any outer level at line " +
                             std::to_string(i + 1)};
        } else if (stmts.empty()) {
            return Error{ErrorCode::ParseError, "unexpected indent at line " + std::to_string(i + 1)};
        }
    }
    if (!stmts.empty()) {
        stmts.back().last = to - 1;
    }
    // Trailing blank lines belong to nobody
    for (auto& stmt : stmts) {
        while (stmt.last > stmt.first && lines[stmt.last].blank) {
            --stmt.last;
        }
    }
    return stmts;
}

// Last line of the logical line starting at `first`
std::size_t logicalEnd(const std::vector<PyLine>& lines, std::size_t first, std::size_t last) {
    std::size_t i = first;
    while (i + 1 <= last && lines[i + 1].continuation) {
        ++i;
    }
    return i;
}

std::string_view lineText(std::string_view src, const std::vector<PyLine>& lines,
                          std::size_t first, std::size_t last) {
    return src.substr(lines[first].begin, lines[last].end - lines[first].begin);
}

// Statement text starting after indentation
std::string_view stmtHead(std::string_view src, const std::vector<PyLine>& lines,
                          const PyStmt& stmt) {
    std::size_t begin = lines[stmt.first].begin;
    while (begin < lines[stmt.first].end && (src[begin] == ' ' || src[begin] == '\t')) {
        ++begin;
    }
    return src.substr(begin, lines[stmt.last].end - begin);
}

bool hasKeyword(std::string_view text, std::string_view keyword) {
    if (text.substr(0, keyword.size()) != keyword || text.size() == keyword.size()) {
        return false;
    }
    unsigned char next = static_cast<unsigned char>(text[keyword.size()]);
    return !isIdentChar(next);
}

std::string_view stripAsync(std::string_view text) {
    if (hasKeyword(text, "async")) {
        text.remove_prefix(5);
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
            text.remove_prefix(1);
        }
    }
    return text;
}

bool isDef(std::string_view head) {
    return hasKeyword(stripAsync(head), "def");
}

bool isClass(std::string_view head) {
    return hasKeyword(head, "class");
}

bool isImport(std::string_view head) {
    return hasKeyword(head, "import") || hasKeyword(head, "from");
}

// Identifier following "class" or "def"
std::string declName(std::string_view head) {
    head = stripAsync(head);
    auto space = head.find_first_of(" \t");
    if (space == std::string_view::npos) {
        return {};
    }
    std::size_t i = space;
    while (i < head.size() && (head[i] == ' ' || head[i] == '\t')) {
        ++i;
    }
    std::size_t start = i;
    while (i < head.size() && isIdentChar(static_cast<unsigned char>(head[i]))) {
        ++i;
    }
    return std::string(head.substr(start, i - start));
}

struct Declaration {
    ChunkKind kind = ChunkKind::Function;
    std::string name;
    PyStmt span;            // includes decorators
    std::size_t def_line{}; // index of the class/def line
};

std::string joinViews(const std::vector<std::string_view>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.append(sep);
        }
        out.append(parts[i]);
    }
    return out;
}

class PythonOutline {
public:
    PythonOutline(std::string_view src, const std::string& path, const ChunkerConfig& config,
                  std::vector<PyLine> lines)
        : src_(src), path_(path), config_(config), lines_(std::move(lines)) {}

    Result<std::vector<Chunk>> run();

private:
    LineSpan spanOf(const PyStmt& stmt) const {
        return {lineText(src_, lines_, stmt.first, stmt.last), stmt.first + 1};
    }

    Result<void> emitClass(const Declaration& decl, const std::string& header);
    void emitDecl(const Chunk& proto, const std::string& header, const PyStmt& span);

    // Split statements into decorated declarations and the rest
    void classify(const std::vector<PyStmt>& stmts, std::vector<Declaration>& decls,
                  std::vector<PyStmt>& rest) const;

    std::string_view src_;
    const std::string& path_;
    const ChunkerConfig& config_;
    std::vector<PyLine> lines_;
    std::vector<Chunk> chunks_;
    std::vector<bool> small_;
};

void PythonOutline::classify(const std::vector<PyStmt>& stmts, std::vector<Declaration>& decls,
                             std::vector<PyStmt>& rest) const {
    std::optional<std::size_t> decorator_start;
    for (const auto& stmt : stmts) {
        auto head = stmtHead(src_, lines_, stmt);
        if (!head.empty() && head.front() == '@') {
            if (!decorator_start) {
                decorator_start = stmt.first;
            }
            continue;
        }
        if (isClass(head) || isDef(head)) {
            Declaration decl;
            decl.kind = isClass(head) ? ChunkKind::Class : ChunkKind::Function;
            decl.name = declName(head);
            decl.span = {decorator_start.value_or(stmt.first), stmt.last};
            decl.def_line = stmt.first;
            decls.push_back(std::move(decl));
        } else {
            if (decorator_start) {
                rest.push_back({*decorator_start, stmt.last});
            } else {
                rest.push_back(stmt);
            }
        }
        decorator_start.reset();
    }
    if (decorator_start) {
        rest.push_back({*decorator_start, stmts.back().last});
    }
}

void PythonOutline::emitDecl(const Chunk& proto, const std::string& header, const PyStmt& span) {
    auto body = spanOf(span);
    emitBounded(chunks_, proto, header, body, config_);
    small_.resize(chunks_.size(), body.text.size() < config_.min_chunk_size);
}

Result<void> PythonOutline::emitClass(const Declaration& decl, const std::string& header) {
    Chunk proto;
    proto.file_path = path_;
    proto.kind = ChunkKind::Class;
    proto.symbol_name = decl.name;
    proto.start_line = decl.def_line + 1;

    auto whole = spanOf(decl.span);
    if (whole.text.size() <= config_.max_chunk_size) {
        emitDecl(proto, header, decl.span);
        return Result<void>();
    }

    // Body statements of the class, after the header logical line
    std::size_t header_end = logicalEnd(lines_, decl.def_line, decl.span.last);
    std::size_t body_indent = 0;
    bool found = false;
    for (std::size_t i = header_end + 1; i <= decl.span.last; ++i) {
        if (startsStatement(lines_[i])) {
            body_indent = lines_[i].indent;
            found = true;
            break;
        }
    }
    if (!found) {
        emitDecl(proto, header, decl.span);
        return Result<void>();
    }

    auto members = collectStatements(lines_, header_end + 1, decl.span.last + 1, body_indent);
    if (!members) {
        return members.error();
    }

    std::vector<Declaration> methods;
    std::vector<PyStmt> fields;
    classify(members.value(), methods, fields);

    if (methods.empty()) {
        emitDecl(proto, header, decl.span);
        return Result<void>();
    }

    // Class stub: signature, docstring and as many field assignments as the budget allows
    std::string stub(lineText(src_, lines_, decl.span.first, header_end));
    std::string indent(body_indent, ' ');
    bool elided = false;
    for (const auto& field : fields) {
        auto text = lineText(src_, lines_, field.first, field.last);
        if (stub.size() + text.size() + 1 > config_.max_context_size) {
            elided = true;
            continue;
        }
        stub.push_back('\n');
        stub.append(text);
    }
    if (elided) {
        stub += "\n" + indent + "# ...";
    }

    std::string method_header = header + stub + "\n\n";
    for (const auto& method : methods) {
        Chunk member = proto;
        member.kind = method.kind == ChunkKind::Class ? ChunkKind::Class : ChunkKind::Method;
        member.symbol_name = method.name;
        member.start_line = method.def_line + 1;
        member.enclosing_type = decl.name;
        emitDecl(member, method_header, method.span);
    }
    return Result<void>();
}

Result<std::vector<Chunk>> PythonOutline::run() {
    auto top = collectStatements(lines_, 0, lines_.size(), 0);
    if (!top) {
        return top.error();
    }
    if (top.value().empty()) {
        return std::vector<Chunk>{};
    }

    std::vector<Declaration> decls;
    std::vector<PyStmt> rest;
    classify(top.value(), decls, rest);

    std::vector<std::string_view> imports;
    std::vector<std::string_view> others;
    std::size_t others_line = 0;
    for (const auto& stmt : rest) {
        auto text = lineText(src_, lines_, stmt.first, stmt.last);
        if (isImport(stmtHead(src_, lines_, stmt))) {
            imports.push_back(text);
        } else {
            if (others.empty()) {
                others_line = stmt.first + 1;
            }
            others.push_back(text);
        }
    }

    if (decls.empty()) {
        // Pure script
        auto script = trimBlankLines({src_, 1});
        if (static_cast<double>(script.text.size()) > 1.5 * config_.max_chunk_size) {
            return chunkLineWindows(src_, path_, config_);
        }
        Chunk chunk;
        chunk.content.assign(script.text);
        chunk.file_path = path_;
        chunk.kind = ChunkKind::Script;
        chunk.symbol_name = std::filesystem::path(path_).stem().string();
        chunk.start_line = script.start_line;
        return std::vector<Chunk>{std::move(chunk)};
    }

    std::string imports_text = joinViews(imports, "\n");
    std::string others_text = joinViews(others, "\n");
    bool inline_others = !others.empty() && others_text.size() < config_.max_context_size;

    std::string header = imports_text;
    if (inline_others) {
        if (!header.empty()) {
            header.push_back('\n');
        }
        header += others_text;
    }
    if (!header.empty()) {
        header += "\n\n";
    }

    if (!others.empty() && !inline_others) {
        Chunk globals;
        globals.file_path = path_;
        globals.kind = ChunkKind::GlobalContext;
        globals.symbol_name = "globals";
        globals.start_line = others_line;
        emitBounded(chunks_, globals, "", {others_text, others_line}, config_);
        small_.resize(chunks_.size(), false);
    }

    for (const auto& decl : decls) {
        if (decl.kind == ChunkKind::Class) {
            auto r = emitClass(decl, header);
            if (!r) {
                return r.error();
            }
            continue;
        }
        Chunk proto;
        proto.file_path = path_;
        proto.kind = ChunkKind::Function;
        proto.symbol_name = decl.name;
        proto.start_line = decl.def_line + 1;
        emitDecl(proto, header, decl.span);
    }

    // Tiny declarations only go when something larger carries the file
    bool has_large = std::find(small_.begin(), small_.end(), false) != small_.end();
    if (!has_large) {
        return std::move(chunks_);
    }
    std::vector<Chunk> kept;
    kept.reserve(chunks_.size());
    for (std::size_t i = 0; i < chunks_.size(); ++i) {
        if (!small_[i]) {
            kept.push_back(std::move(chunks_[i]));
        }
    }
    return kept;
}

} // namespace

Result<std::vector<Chunk>> chunkDeclarative(std::string_view content, const std::string& path,
                                            const ChunkerConfig& config) {
    auto lines = scanLines(content);
    if (!lines) {
        return lines.error();
    }
    PythonOutline outline(content, path, config, std::move(lines).value());
    return outline.run();
}

} // namespace coderag::chunking::detail
