#include "chunker_detail.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <optional>

namespace coderag::chunking::detail {

namespace {

constexpr int kMaxNesting = 4;

struct LexOptions {
    bool single_quote_strings = false; // JS family and PHP use '...' for strings
    bool backtick_strings = false;     // JS template literals, Go raw strings
};

LexOptions lexOptionsFor(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    LexOptions opts;
    if (ext == ".js" || ext == ".jsx" || ext == ".ts" || ext == ".tsx" || ext == ".mjs" ||
        ext == ".cjs") {
        opts.single_quote_strings = true;
        opts.backtick_strings = true;
    } else if (ext == ".php") {
        opts.single_quote_strings = true;
    } else if (ext == ".go") {
        opts.backtick_strings = true;
    }
    return opts;
}

// A top-level unit of a brace region
struct BraceItem {
    enum class Type { Block, Statement, Directive };
    Type type = Type::Statement;
    std::size_t begin = 0;      // first non-space byte, leading comments included
    std::size_t code_begin = 0; // first byte that is neither space nor comment
    std::size_t brace = 0;      // opening brace (blocks only)
    std::size_t close = 0;      // closing brace (blocks only)
    std::size_t end = 0;        // one past the last byte
};

bool isIdentStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool isIdentChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

class BraceLexer {
public:
    BraceLexer(std::string_view src, LexOptions opts) : src_(src), opts_(opts) {}

    // Top-level items of [from, to)
    Result<std::vector<BraceItem>> scan(std::size_t from, std::size_t to) const;

    // Skip a literal or comment starting at i; returns i unchanged when none starts there
    Result<std::size_t> skipNoise(std::size_t i, std::size_t to) const;

    // First byte in [from, to) that is neither whitespace nor part of a comment
    std::size_t skipSpaceAndComments(std::size_t from, std::size_t to) const;

    bool hasCode(std::size_t from, std::size_t to) const {
        return skipSpaceAndComments(from, to) < to;
    }

private:
    std::size_t lineEnd(std::size_t i, std::size_t to) const {
        auto nl = src_.find('\n', i);
        return (nl == std::string_view::npos || nl > to) ? to : nl;
    }

    // A directive runs to end of line, following backslash continuations
    std::size_t directiveEnd(std::size_t i, std::size_t to) const {
        while (true) {
            std::size_t e = lineEnd(i, to);
            std::size_t last = e;
            while (last > i && (src_[last - 1] == '\r' || src_[last - 1] == ' ')) {
                --last;
            }
            if (e < to && last > i && src_[last - 1] == '\\') {
                i = e + 1;
                continue;
            }
            return e;
        }
    }

    Result<std::size_t> skipQuoted(std::size_t i, std::size_t to, char quote,
                                   bool multiline) const;

    void pushSegment(std::vector<BraceItem>& items, BraceItem::Type type, std::size_t seg,
                     std::size_t end) const;

    std::string_view src_;
    LexOptions opts_;
};

Result<std::size_t> BraceLexer::skipQuoted(std::size_t i, std::size_t to, char quote,
                                           bool multiline) const {
    std::size_t j = i + 1;
    while (j < to && src_[j] != quote) {
        if (src_[j] == '\\') {
            j += 2;
            continue;
        }
        if (src_[j] == '\n' && !multiline) {
            break;
        }
        ++j;
    }
    if (j >= to || src_[j] != quote) {
        return Error{ErrorCode::ParseError, "unterminated literal"};
    }
    return j + 1;
}

Result<std::size_t> BraceLexer::skipNoise(std::size_t i, std::size_t to) const {
    char c = src_[i];
    char next = (i + 1 < to) ? src_[i + 1] : '\0';

    if (c == '/' && next == '/') {
        return lineEnd(i, to);
    }
    if (c == '/' && next == '*') {
        auto close = src_.find("*/", i + 2);
        if (close == std::string_view::npos || close + 2 > to) {
            return Error{ErrorCode::ParseError, "unterminated block comment"};
        }
        return close + 2;
    }
    if (c == '"') {
        // C++ raw string R"delim( ... )delim"
        if (i > 0 && src_[i - 1] == 'R' && (i < 2 || !isIdentChar(src_[i - 2]) ||
                                           src_[i - 2] == '8' || src_[i - 2] == 'u' ||
                                           src_[i - 2] == 'U' || src_[i - 2] == 'L')) {
            auto paren = src_.find('(', i + 1);
            if (paren != std::string_view::npos && paren < to && paren - i <= 17) {
                std::string terminator = ")" + std::string(src_.substr(i + 1, paren - i - 1)) +
                                         "\"";
                auto close = src_.find(terminator, paren + 1);
                if (close == std::string_view::npos || close + terminator.size() > to) {
                    return Error{ErrorCode::ParseError, "unterminated raw string"};
                }
                return close + terminator.size();
            }
        }
        return skipQuoted(i, to, '"', false);
    }
    if (c == '`' && opts_.backtick_strings) {
        return skipQuoted(i, to, '`', true);
    }
    if (c == '\'') {
        if (opts_.single_quote_strings) {
            return skipQuoted(i, to, '\'', false);
        }
        // Character literal, or a lifetime / apostrophe that stays ordinary text
        if (next == '\\') {
            for (std::size_t j = i + 2; j < to && j <= i + 10; ++j) {
                if (src_[j] == '\'') {
                    return j + 1;
                }
                if (src_[j] == '\n') {
                    break;
                }
            }
        } else if (i + 2 < to && src_[i + 2] == '\'' && next != '\n') {
            return i + 3;
        }
        return i;
    }
    return i;
}

std::size_t BraceLexer::skipSpaceAndComments(std::size_t from, std::size_t to) const {
    std::size_t i = from;
    while (i < to) {
        unsigned char c = static_cast<unsigned char>(src_[i]);
        if (std::isspace(c)) {
            ++i;
            continue;
        }
        if (c == '/' && i + 1 < to && (src_[i + 1] == '/' || src_[i + 1] == '*')) {
            auto r = skipNoise(i, to);
            if (!r || r.value() == i) {
                return i;
            }
            i = r.value();
            continue;
        }
        return i;
    }
    return to;
}

void BraceLexer::pushSegment(std::vector<BraceItem>& items, BraceItem::Type type,
                             std::size_t seg, std::size_t end) const {
    BraceItem item;
    item.type = type;
    item.begin = seg;
    while (item.begin < end && std::isspace(static_cast<unsigned char>(src_[item.begin]))) {
        ++item.begin;
    }
    item.code_begin = skipSpaceAndComments(seg, end);
    item.end = end;
    if (item.code_begin < end) {
        items.push_back(item);
    }
}

Result<std::vector<BraceItem>> BraceLexer::scan(std::size_t from, std::size_t to) const {
    std::vector<BraceItem> items;
    int depth = 0;
    std::size_t seg = from;
    std::size_t brace = 0;
    bool at_line_start = from == 0 || src_[from - 1] == '\n';

    std::size_t i = from;
    while (i < to) {
        char c = src_[i];
        if (c == '\n') {
            at_line_start = true;
            ++i;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (c == '#' && at_line_start && i + 1 < to &&
            std::isalpha(static_cast<unsigned char>(src_[i + 1]))) {
            std::size_t end = directiveEnd(i, to);
            if (depth == 0) {
                if (hasCode(seg, i)) {
                    pushSegment(items, BraceItem::Type::Statement, seg, i);
                }
                pushSegment(items, BraceItem::Type::Directive, i, end);
                seg = end;
            }
            i = end;
            continue;
        }
        at_line_start = false;

        auto skipped = skipNoise(i, to);
        if (!skipped) {
            return skipped.error();
        }
        if (skipped.value() != i) {
            i = skipped.value();
            continue;
        }

        if (c == '{') {
            if (depth == 0) {
                brace = i;
            }
            ++depth;
        } else if (c == '}') {
            if (--depth < 0) {
                return Error{ErrorCode::ParseError, "unmatched closing brace"};
            }
            if (depth == 0) {
                std::size_t end = i + 1;
                std::size_t k = end;
                while (k < to && (src_[k] == ' ' || src_[k] == '\t')) {
                    ++k;
                }
                if (k < to && src_[k] == ';') {
                    end = k + 1;
                }
                BraceItem item;
                item.type = BraceItem::Type::Block;
                item.begin = seg;
                while (std::isspace(static_cast<unsigned char>(src_[item.begin]))) {
                    ++item.begin;
                }
                item.code_begin = skipSpaceAndComments(seg, brace);
                item.brace = brace;
                item.close = i;
                item.end = end;
                items.push_back(item);
                seg = end;
                i = end;
                continue;
            }
        } else if (c == ';' && depth == 0) {
            pushSegment(items, BraceItem::Type::Statement, seg, i + 1);
            seg = i + 1;
        }
        ++i;
    }

    if (depth != 0) {
        return Error{ErrorCode::ParseError, "unbalanced braces at end of region"};
    }
    if (hasCode(seg, to)) {
        pushSegment(items, BraceItem::Type::Statement, seg, to);
    }
    return items;
}

// Split statements glued onto a block signature by a blank line (languages without ';')
std::vector<BraceItem> splitLooseSignatures(std::string_view src, const BraceLexer& lexer,
                                            std::vector<BraceItem> items) {
    std::vector<BraceItem> out;
    out.reserve(items.size());
    for (auto& item : items) {
        if (item.type != BraceItem::Type::Block) {
            out.push_back(item);
            continue;
        }
        std::size_t split = std::string_view::npos;
        for (std::size_t p = item.code_begin; p < item.brace; ++p) {
            if (src[p] != '\n') {
                continue;
            }
            std::size_t q = p + 1;
            while (q < item.brace && (src[q] == ' ' || src[q] == '\t' || src[q] == '\r')) {
                ++q;
            }
            if (q < item.brace && src[q] == '\n') {
                split = q + 1;
            }
        }
        if (split != std::string_view::npos) {
            // Reject a split point that sits inside a block comment
            std::string_view tail = src.substr(split, item.brace - split);
            auto close_comment = tail.find("*/");
            auto open_comment = tail.find("/*");
            if (close_comment != std::string_view::npos &&
                (open_comment == std::string_view::npos || close_comment < open_comment)) {
                split = std::string_view::npos;
            }
        }
        if (split != std::string_view::npos && lexer.hasCode(split, item.brace)) {
            BraceItem loose;
            loose.type = BraceItem::Type::Statement;
            loose.begin = item.begin;
            loose.code_begin = item.code_begin;
            loose.end = split;
            out.push_back(loose);

            item.begin = split;
            while (std::isspace(static_cast<unsigned char>(src[item.begin]))) {
                ++item.begin;
            }
            item.code_begin = lexer.skipSpaceAndComments(split, item.brace);
        }
        out.push_back(item);
    }
    return out;
}

enum class GlobalClass { Import = 0, MacroType = 1, Other = 2 };

struct Token {
    std::string text;
    bool ident = false;
    bool call = false; // immediately followed by '('
};

// Identifiers and punctuation of a signature, with comments and literals already skipped
std::vector<Token> tokenize(std::string_view src, const BraceLexer& lexer, std::size_t from,
                            std::size_t to) {
    std::vector<Token> tokens;
    std::size_t i = from;
    while (i < to) {
        unsigned char c = static_cast<unsigned char>(src[i]);
        if (std::isspace(c)) {
            ++i;
            continue;
        }
        auto skipped = lexer.skipNoise(i, to);
        if (skipped && skipped.value() != i) {
            tokens.push_back({"\"", false, false});
            i = skipped.value();
            continue;
        }
        if (isIdentStart(c)) {
            std::size_t start = i;
            while (i < to && isIdentChar(static_cast<unsigned char>(src[i]))) {
                ++i;
            }
            Token tok;
            tok.text = std::string(src.substr(start, i - start));
            tok.ident = true;
            tok.call = i < to && src[i] == '(';
            tokens.push_back(std::move(tok));
            continue;
        }
        tokens.push_back({std::string(1, static_cast<char>(c)), false, false});
        ++i;
    }
    return tokens;
}

bool isOneOf(const std::string& word, std::initializer_list<const char*> set) {
    return std::any_of(set.begin(), set.end(), [&](const char* s) { return word == s; });
}

// Length of a C++ access label ("public:", "protected slots:") starting at i, 0 when none
std::size_t accessLabelLength(std::string_view src, std::size_t i, std::size_t to) {
    std::size_t j = i;
    bool labelled = false;
    while (j < to && isIdentStart(static_cast<unsigned char>(src[j]))) {
        std::size_t start = j;
        while (j < to && isIdentChar(static_cast<unsigned char>(src[j]))) {
            ++j;
        }
        std::string word(src.substr(start, j - start));
        if (!isOneOf(word, {"public", "private", "protected", "signals", "slots", "Q_SIGNALS",
                            "Q_SLOTS"})) {
            return 0;
        }
        labelled = true;
        while (j < to && (src[j] == ' ' || src[j] == '\t')) {
            ++j;
        }
    }
    if (!labelled || j >= to || src[j] != ':' || (j + 1 < to && src[j + 1] == ':')) {
        return 0;
    }
    return j + 1 - i;
}

// Move a member block past the access labels in front of its signature
BraceItem withoutAccessLabels(std::string_view src, const BraceLexer& lexer, BraceItem item) {
    while (std::size_t n = accessLabelLength(src, item.code_begin, item.brace)) {
        item.begin = item.code_begin + n;
        while (item.begin < item.brace &&
               std::isspace(static_cast<unsigned char>(src[item.begin]))) {
            ++item.begin;
        }
        item.code_begin = lexer.skipSpaceAndComments(item.begin, item.brace);
    }
    return item;
}

bool isTypeKeyword(const std::string& word) {
    return isOneOf(word, {"class", "struct", "interface", "enum", "record", "type"});
}

bool isControlKeyword(const std::string& word) {
    return isOneOf(word, {"if", "for", "while", "switch", "catch", "return", "sizeof", "function",
                          "func"});
}

bool isModifier(const std::string& word) {
    return isOneOf(word, {"public", "private", "protected", "internal", "static", "final",
                          "abstract", "sealed", "partial", "export", "default", "pub", "open",
                          "data", "inline", "virtual", "unsafe", "override", "readonly",
                          "declare", "async", "extern"});
}

struct Signature {
    ChunkKind kind = ChunkKind::TextBlock;
    std::string name;
    bool container = false; // class-like or namespace-like, worth splitting into members
};

Signature analyzeSignature(const std::vector<Token>& tokens) {
    Signature sig;

    // First significant token, skipping modifiers, annotations, attributes and templates
    std::size_t first = 0;
    while (first < tokens.size()) {
        const auto& tok = tokens[first];
        if (tok.ident && isModifier(tok.text)) {
            ++first;
        } else if (tok.text == "@" && first + 1 < tokens.size()) {
            first += 2;
            if (first < tokens.size() && tokens[first - 1].call) {
                int parens = 0;
                do {
                    if (tokens[first].text == "(") {
                        ++parens;
                    } else if (tokens[first].text == ")") {
                        --parens;
                    }
                    ++first;
                } while (first < tokens.size() && parens > 0);
            }
        } else if (tok.text == "#" && first + 1 < tokens.size() && tokens[first + 1].text == "[") {
            int brackets = 0;
            do {
                if (tokens[first].text == "[") {
                    ++brackets;
                } else if (tokens[first].text == "]") {
                    --brackets;
                }
                ++first;
            } while (first < tokens.size() && brackets > 0);
        } else if (tok.ident && tok.text == "template" && first + 1 < tokens.size() &&
                   tokens[first + 1].text == "<") {
            int angles = 0;
            ++first;
            do {
                if (tokens[first].text == "<") {
                    ++angles;
                } else if (tokens[first].text == ">") {
                    --angles;
                }
                ++first;
            } while (first < tokens.size() && angles > 0);
        } else {
            break;
        }
    }

    std::string call_name;
    for (const auto& tok : tokens) {
        if (tok.ident && tok.call && !isControlKeyword(tok.text)) {
            call_name = tok.text;
            break;
        }
    }

    if (first < tokens.size() && tokens[first].ident && isTypeKeyword(tokens[first].text)) {
        std::string type_name;
        for (std::size_t i = first + 1; i < tokens.size(); ++i) {
            if (tokens[i].ident && !isTypeKeyword(tokens[i].text) && !isModifier(tokens[i].text)) {
                type_name = tokens[i].text;
                break;
            }
        }
        bool returns_type = !call_name.empty() && call_name != type_name &&
                            tokens[first].text != "record";
        if (!returns_type && !type_name.empty()) {
            sig.kind = ChunkKind::Class;
            sig.name = type_name;
            sig.container = true;
            return sig;
        }
    }

    if (first < tokens.size() && tokens[first].ident &&
        (tokens[first].text == "impl" || tokens[first].text == "namespace" ||
         tokens[first].text == "module" || tokens[first].text == "object" ||
         tokens[first].text == "trait")) {
        const std::string& keyword = tokens[first].text;
        std::string name;
        bool after_for = false;
        for (std::size_t i = first + 1; i < tokens.size(); ++i) {
            if (!tokens[i].ident) {
                continue;
            }
            if (keyword == "impl" && tokens[i].text == "for") {
                after_for = true;
                continue;
            }
            if (name.empty() || after_for) {
                name = tokens[i].text;
                if (after_for) {
                    break;
                }
            }
        }
        sig.kind = (keyword == "namespace" || keyword == "module") ? ChunkKind::TextBlock
                                                                    : ChunkKind::Class;
        sig.name = name.empty() ? keyword : name;
        sig.container = true;
        return sig;
    }

    if (!call_name.empty()) {
        sig.kind = ChunkKind::Function;
        sig.name = call_name;
        return sig;
    }

    // const handler = (...) => { / let table = {
    for (std::size_t i = first; i + 1 < tokens.size(); ++i) {
        if (tokens[i].ident && isOneOf(tokens[i].text, {"const", "let", "var", "val"}) &&
            tokens[i + 1].ident) {
            sig.name = tokens[i + 1].text;
            bool arrow = false;
            for (std::size_t j = i + 2; j + 1 < tokens.size(); ++j) {
                if (tokens[j].text == "=" && tokens[j + 1].text == ">") {
                    arrow = true;
                }
            }
            sig.kind = arrow ? ChunkKind::Function : ChunkKind::TextBlock;
            return sig;
        }
    }

    sig.container = true;
    sig.name = "block";
    return sig;
}

GlobalClass classifyGlobal(const BraceItem& item, const std::vector<Token>& tokens) {
    if (tokens.empty()) {
        return GlobalClass::Other;
    }
    const std::string& head = tokens[0].text;
    if (item.type == BraceItem::Type::Directive) {
        std::string directive = tokens.size() > 1 ? tokens[1].text : std::string();
        if (isOneOf(directive, {"include", "import", "using"})) {
            return GlobalClass::Import;
        }
        return GlobalClass::MacroType;
    }
    if (head == "using") {
        bool alias = std::any_of(tokens.begin(), tokens.end(),
                                 [](const Token& t) { return t.text == "="; });
        return alias ? GlobalClass::MacroType : GlobalClass::Import;
    }
    if (isOneOf(head, {"import", "package", "use", "require", "from", "mod"})) {
        return GlobalClass::Import;
    }
    if (head == "extern" && tokens.size() > 1 && tokens[1].text == "crate") {
        return GlobalClass::Import;
    }
    for (const auto& tok : tokens) {
        if (tok.ident && tok.text == "require" && tok.call) {
            return GlobalClass::Import;
        }
    }
    if (isOneOf(head, {"typedef", "type", "template", "enum", "struct", "class", "interface",
                       "define"})) {
        return GlobalClass::MacroType;
    }
    return GlobalClass::Other;
}

std::string joinItems(std::string_view src, const std::vector<const BraceItem*>& items) {
    std::string out;
    for (const auto* item : items) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        auto text = src.substr(item->code_begin, item->end - item->code_begin);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        out.append(text);
    }
    return out;
}

class BraceOutline {
public:
    BraceOutline(std::string_view src, const std::string& path, const ChunkerConfig& config)
        : src_(src), path_(path), config_(config), lexer_(src, lexOptionsFor(path)),
          lines_(src) {}

    Result<std::vector<Chunk>> run();

private:
    LineSpan spanOf(const BraceItem& item) const {
        return {src_.substr(item.begin, item.end - item.begin), lines_.lineOf(item.begin)};
    }

    Result<void> emitBlock(const BraceItem& item, const std::string& header,
                           const std::optional<std::string>& enclosing, int nesting);

    std::string_view src_;
    const std::string& path_;
    const ChunkerConfig& config_;
    BraceLexer lexer_;
    LineIndex lines_;
    std::vector<Chunk> chunks_;
    std::vector<bool> small_;
};

Result<void> BraceOutline::emitBlock(const BraceItem& item, const std::string& header,
                                     const std::optional<std::string>& enclosing, int nesting) {
    auto sig = analyzeSignature(tokenize(src_, lexer_, item.code_begin, item.brace));

    Chunk proto;
    proto.file_path = path_;
    proto.kind = sig.kind;
    proto.symbol_name = sig.name;
    proto.start_line = lines_.lineOf(item.code_begin);
    if (enclosing) {
        proto.enclosing_type = enclosing;
        if (proto.kind == ChunkKind::Function) {
            proto.kind = ChunkKind::Method;
        }
    }

    auto body = spanOf(item);
    if (body.text.size() <= config_.max_chunk_size || !sig.container || nesting >= kMaxNesting) {
        emitBounded(chunks_, proto, header, body, config_);
        small_.resize(chunks_.size(), body.text.size() < config_.min_chunk_size);
        return Result<void>();
    }

    auto inner = lexer_.scan(item.brace + 1, item.close);
    if (!inner) {
        return inner.error();
    }
    auto members = splitLooseSignatures(src_, lexer_, std::move(inner).value());
    bool has_blocks = std::any_of(members.begin(), members.end(), [](const BraceItem& m) {
        return m.type == BraceItem::Type::Block;
    });
    if (!has_blocks) {
        emitBounded(chunks_, proto, header, body, config_);
        small_.resize(chunks_.size(), false);
        return Result<void>();
    }

    // Container stub: signature plus as many member declarations as the budget allows
    std::string stub(src_.substr(item.code_begin, item.brace + 1 - item.code_begin));
    bool elided = false;
    for (const auto& member : members) {
        if (member.type == BraceItem::Type::Block) {
            continue;
        }
        auto text = src_.substr(member.begin, member.end - member.begin);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        if (stub.size() + text.size() + 5 > config_.max_context_size) {
            elided = true;
            continue;
        }
        stub += "\n    ";
        stub.append(text);
    }
    if (elided) {
        stub += "\n    // ...";
    }

    std::optional<std::string> member_enclosing = enclosing;
    if (sig.kind == ChunkKind::Class) {
        member_enclosing = sig.name;
    }
    std::string member_header = header + stub + "\n\n";
    for (const auto& member : members) {
        if (member.type != BraceItem::Type::Block) {
            continue;
        }
        auto r = emitBlock(withoutAccessLabels(src_, lexer_, member), member_header,
                           member_enclosing, nesting + 1);
        if (!r) {
            return r;
        }
    }
    return Result<void>();
}

Result<std::vector<Chunk>> BraceOutline::run() {
    auto scanned = lexer_.scan(0, src_.size());
    if (!scanned) {
        return scanned.error();
    }
    auto items = splitLooseSignatures(src_, lexer_, std::move(scanned).value());

    std::array<std::vector<const BraceItem*>, 3> globals;
    std::size_t first_global_line = 0;
    bool has_blocks = false;
    for (const auto& item : items) {
        if (item.type == BraceItem::Type::Block) {
            has_blocks = true;
            continue;
        }
        auto cls = classifyGlobal(item, tokenize(src_, lexer_, item.code_begin, item.end));
        globals[static_cast<std::size_t>(cls)].push_back(&item);
        if (first_global_line == 0) {
            first_global_line = lines_.lineOf(item.code_begin);
        }
    }

    if (!has_blocks) {
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

    // Fixed priority: imports, then macros and types, then everything else
    std::vector<const BraceItem*> ordered;
    for (const auto& bucket : globals) {
        ordered.insert(ordered.end(), bucket.begin(), bucket.end());
    }
    std::string context = joinItems(src_, ordered);

    std::string header;
    if (!context.empty()) {
        if (context.size() <= config_.max_context_size) {
            header = context + "\n\n";
        } else {
            Chunk globals_chunk;
            globals_chunk.file_path = path_;
            globals_chunk.kind = ChunkKind::GlobalContext;
            globals_chunk.symbol_name = "globals";
            globals_chunk.start_line = first_global_line;
            emitBounded(chunks_, globals_chunk, "", {context, first_global_line}, config_);
            small_.resize(chunks_.size(), false);
        }
    }

    for (const auto& item : items) {
        if (item.type != BraceItem::Type::Block) {
            continue;
        }
        auto r = emitBlock(item, header, std::nullopt, 0);
        if (!r) {
            return r.error();
        }
    }

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

Result<std::vector<Chunk>> chunkBraceDelimited(std::string_view content, const std::string& path,
                                               const ChunkerConfig& config) {
    BraceOutline outline(content, path, config);
    return outline.run();
}

} // namespace coderag::chunking::detail
