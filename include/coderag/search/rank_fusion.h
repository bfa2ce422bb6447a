#pragma once

#include <coderag/storage/document.h>

#include <cstddef>
#include <vector>

namespace coderag::search {

/**
 * Which candidate lists a fused result came from
 */
enum class ResultSource { Vector, Lexical, Hybrid };

const char* resultSourceToString(ResultSource source);

/**
 * Reciprocal Rank Fusion parameters
 */
struct FusionConfig {
    double k = 60.0;            // Smoothing constant
    double vector_weight = 1.0; // Primary signal
    double lexical_weight = 0.3;
};

struct SearchResult {
    storage::Document document;
    float score = 0.0f;
    ResultSource source = ResultSource::Vector;
};

namespace fusion {

/**
 * @brief Contribution of one list entry: weight / (k + rank), rank 1-based
 */
double reciprocalRank(std::size_t rank, double weight, double k);

/**
 * @brief Merge two ranked lists by weighted Reciprocal Rank Fusion.
 *
 * Documents are identified by id. Scores are non-increasing in the output and ties keep
 * vector rank order (lexical-only entries follow in lexical rank order).
 */
std::vector<SearchResult> fuse(const std::vector<storage::Document>& vector_ranked,
                               const std::vector<storage::Document>& lexical_ranked,
                               std::size_t top_k, const FusionConfig& config = {});

} // namespace fusion

} // namespace coderag::search
