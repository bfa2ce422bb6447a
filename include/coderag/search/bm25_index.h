#pragma once

#include <coderag/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace coderag::search {

/**
 * Okapi BM25 parameters
 */
struct Bm25Params {
    double k1 = 1.5;
    double b = 0.75;
    double epsilon = 0.25; // Floor for negative idf, as a fraction of the average idf
};

/**
 * @brief Okapi BM25 over a fixed corpus of token lists.
 *
 * Built in one pass; there is no incremental update since idf depends on the whole corpus.
 * Terms occurring in more than half of the documents get epsilon * average idf instead of a
 * negative weight.
 */
class Bm25Index {
public:
    using TermFrequencies = std::unordered_map<std::string, std::uint32_t>;

    Bm25Index() = default;
    explicit Bm25Index(Bm25Params params) : params_(params) {}

    static Bm25Index build(const std::vector<std::vector<std::string>>& corpus,
                           Bm25Params params = {});

    /**
     * @brief Score of every document for the query tokens (repeated tokens count twice)
     */
    std::vector<double> scores(const std::vector<std::string>& query) const;

    /**
     * @brief Best k documents with a strictly positive score, as (document index, score)
     *
     * Ties keep corpus order.
     */
    std::vector<std::pair<std::size_t, double>> topK(const std::vector<std::string>& query,
                                                     std::size_t k) const;

    std::size_t size() const { return doc_lengths_.size(); }
    bool empty() const { return doc_lengths_.empty(); }
    double averageLength() const { return avgdl_; }
    double idf(const std::string& term) const;
    const Bm25Params& params() const { return params_; }

    nlohmann::json toJson() const;
    static Result<Bm25Index> fromJson(const nlohmann::json& j);

private:
    void finalize();

    Bm25Params params_;
    std::vector<std::uint32_t> doc_lengths_;
    std::vector<TermFrequencies> term_freqs_;
    std::unordered_map<std::string, std::vector<std::pair<std::size_t, std::uint32_t>>> postings_;
    std::unordered_map<std::string, double> idf_;
    double avgdl_ = 0.0;
};

} // namespace coderag::search
