#include <coderag/search/tokenizer.h>

#include <cctype>

namespace coderag::search {

Tokenizer::Tokenizer(TokenizerConfig config) : config_(std::move(config)) {}

bool Tokenizer::isWordChar(unsigned char c) const {
    if (c >= 0x80) {
        return config_.non_ascii_is_word;
    }
    if (std::isalnum(c) || c == '_') {
        return true;
    }
    return config_.extra_word_chars.find(static_cast<char>(c)) != std::string::npos;
}

std::vector<std::string> Tokenizer::tokenize(std::string_view text) const {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isWordChar(c)) {
            current.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : ch);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

} // namespace coderag::search
