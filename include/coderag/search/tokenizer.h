#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace coderag::search {

/**
 * Configuration for lexical tokenization
 */
struct TokenizerConfig {
    std::string extra_word_chars;  // Treated as word characters in addition to [A-Za-z0-9_]
    bool non_ascii_is_word = true; // Keep UTF-8 sequences (CJK, Cyrillic, ...) inside words
};

/**
 * @brief Case-folding splitter used for both documents and queries.
 *
 * Text is lowercased and split on every character outside the word class.
 */
class Tokenizer {
public:
    explicit Tokenizer(TokenizerConfig config = {});

    std::vector<std::string> tokenize(std::string_view text) const;

    const TokenizerConfig& config() const { return config_; }

private:
    bool isWordChar(unsigned char c) const;

    TokenizerConfig config_;
};

} // namespace coderag::search
