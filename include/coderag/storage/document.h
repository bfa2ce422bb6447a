#pragma once

#include <coderag/core/types.h>

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace coderag::storage {

// Metadata keys written for every indexed chunk
inline constexpr const char* kMetaFile = "file";
inline constexpr const char* kMetaKind = "kind";
inline constexpr const char* kMetaSymbol = "symbol";
inline constexpr const char* kMetaEnclosingType = "enclosing_type";
inline constexpr const char* kMetaStartLine = "start_line";

/**
 * @brief Persisted retrievable unit. Immutable once written.
 */
struct Document {
    std::string id;
    std::string content;
    std::map<std::string, std::string> metadata;
    std::optional<Embedding> embedding;

    std::string file() const {
        auto it = metadata.find(kMetaFile);
        return it != metadata.end() ? it->second : std::string();
    }

    std::size_t startLine() const {
        auto it = metadata.find(kMetaStartLine);
        if (it == metadata.end()) {
            return 0;
        }
        try {
            return static_cast<std::size_t>(std::stoull(it->second));
        } catch (const std::exception&) {
            return 0;
        }
    }
};

/**
 * @brief Document with its similarity to a query vector
 */
struct ScoredDocument {
    Document document;
    float score = 0.0f;
};

} // namespace coderag::storage
