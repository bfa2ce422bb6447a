#include <coderag/search/bm25_index.h>

#include <algorithm>
#include <cmath>

namespace coderag::search {

Bm25Index Bm25Index::build(const std::vector<std::vector<std::string>>& corpus,
                           Bm25Params params) {
    Bm25Index index(params);
    index.doc_lengths_.reserve(corpus.size());
    index.term_freqs_.reserve(corpus.size());
    for (const auto& tokens : corpus) {
        TermFrequencies tf;
        for (const auto& token : tokens) {
            ++tf[token];
        }
        index.doc_lengths_.push_back(static_cast<std::uint32_t>(tokens.size()));
        index.term_freqs_.push_back(std::move(tf));
    }
    index.finalize();
    return index;
}

void Bm25Index::finalize() {
    postings_.clear();
    idf_.clear();
    avgdl_ = 0.0;

    const std::size_t n = doc_lengths_.size();
    if (n == 0) {
        return;
    }

    double total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        total += doc_lengths_[i];
        for (const auto& [term, freq] : term_freqs_[i]) {
            postings_[term].emplace_back(i, freq);
        }
    }
    avgdl_ = total / static_cast<double>(n);

    double idf_sum = 0.0;
    std::vector<std::string> negative;
    for (const auto& [term, docs] : postings_) {
        double df = static_cast<double>(docs.size());
        double value = std::log(static_cast<double>(n) - df + 0.5) - std::log(df + 0.5);
        idf_[term] = value;
        idf_sum += value;
        if (value < 0.0) {
            negative.push_back(term);
        }
    }
    if (!idf_.empty()) {
        double floor = params_.epsilon * (idf_sum / static_cast<double>(idf_.size()));
        for (const auto& term : negative) {
            idf_[term] = floor;
        }
    }
}

double Bm25Index::idf(const std::string& term) const {
    auto it = idf_.find(term);
    return it != idf_.end() ? it->second : 0.0;
}

std::vector<double> Bm25Index::scores(const std::vector<std::string>& query) const {
    std::vector<double> out(doc_lengths_.size(), 0.0);
    if (out.empty() || avgdl_ <= 0.0) {
        return out;
    }
    const double k1 = params_.k1;
    const double b = params_.b;
    for (const auto& term : query) {
        auto posting = postings_.find(term);
        if (posting == postings_.end()) {
            continue;
        }
        const double weight = idf(term);
        for (const auto& [doc, freq] : posting->second) {
            double tf = static_cast<double>(freq);
            double norm = k1 * (1.0 - b + b * doc_lengths_[doc] / avgdl_);
            out[doc] += weight * (tf * (k1 + 1.0)) / (tf + norm);
        }
    }
    return out;
}

std::vector<std::pair<std::size_t, double>> Bm25Index::topK(const std::vector<std::string>& query,
                                                            std::size_t k) const {
    std::vector<std::pair<std::size_t, double>> ranked;
    if (k == 0) {
        return ranked;
    }
    auto all = scores(query);
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (all[i] > 0.0) {
            ranked.emplace_back(i, all[i]);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > k) {
        ranked.resize(k);
    }
    return ranked;
}

nlohmann::json Bm25Index::toJson() const {
    nlohmann::json j;
    j["k1"] = params_.k1;
    j["b"] = params_.b;
    j["epsilon"] = params_.epsilon;
    j["avgdl"] = avgdl_;
    j["doc_lengths"] = doc_lengths_;
    auto freqs = nlohmann::json::array();
    for (const auto& tf : term_freqs_) {
        nlohmann::json doc = nlohmann::json::object();
        for (const auto& [term, count] : tf) {
            doc[term] = count;
        }
        freqs.push_back(std::move(doc));
    }
    j["term_freqs"] = std::move(freqs);
    return j;
}

Result<Bm25Index> Bm25Index::fromJson(const nlohmann::json& j) {
    try {
        Bm25Params params;
        params.k1 = j.at("k1").get<double>();
        params.b = j.at("b").get<double>();
        params.epsilon = j.at("epsilon").get<double>();

        Bm25Index index(params);
        index.doc_lengths_ = j.at("doc_lengths").get<std::vector<std::uint32_t>>();
        const auto& freqs = j.at("term_freqs");
        if (!freqs.is_array() || freqs.size() != index.doc_lengths_.size()) {
            return Error{ErrorCode::CorruptedData, "BM25 term frequencies do not match corpus"};
        }
        for (const auto& doc : freqs) {
            TermFrequencies tf;
            for (auto it = doc.begin(); it != doc.end(); ++it) {
                tf[it.key()] = it->get<std::uint32_t>();
            }
            index.term_freqs_.push_back(std::move(tf));
        }
        index.finalize();
        return index;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::CorruptedData, std::string("Invalid BM25 structure: ") + e.what()};
    }
}

} // namespace coderag::search
