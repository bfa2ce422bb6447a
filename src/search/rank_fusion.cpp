#include <coderag/search/rank_fusion.h>

#include <algorithm>
#include <unordered_map>

namespace coderag::search {

const char* resultSourceToString(ResultSource source) {
    switch (source) {
        case ResultSource::Vector:
            return "vector";
        case ResultSource::Lexical:
            return "lexical";
        case ResultSource::Hybrid:
            return "hybrid";
    }
    return "unknown";
}

namespace fusion {

double reciprocalRank(std::size_t rank, double weight, double k) {
    return weight / (k + static_cast<double>(rank));
}

std::vector<SearchResult> fuse(const std::vector<storage::Document>& vector_ranked,
                               const std::vector<storage::Document>& lexical_ranked,
                               std::size_t top_k, const FusionConfig& config) {
    struct Entry {
        const storage::Document* document;
        double score;
        ResultSource source;
    };
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> position;
    entries.reserve(vector_ranked.size() + lexical_ranked.size());

    for (std::size_t i = 0; i < vector_ranked.size(); ++i) {
        const auto& doc = vector_ranked[i];
        double contribution = reciprocalRank(i + 1, config.vector_weight, config.k);
        auto [it, inserted] = position.try_emplace(doc.id, entries.size());
        if (inserted) {
            entries.push_back({&doc, contribution, ResultSource::Vector});
        } else {
            entries[it->second].score += contribution;
        }
    }

    for (std::size_t i = 0; i < lexical_ranked.size(); ++i) {
        const auto& doc = lexical_ranked[i];
        double contribution = reciprocalRank(i + 1, config.lexical_weight, config.k);
        auto [it, inserted] = position.try_emplace(doc.id, entries.size());
        if (inserted) {
            entries.push_back({&doc, contribution, ResultSource::Lexical});
        } else {
            auto& entry = entries[it->second];
            entry.score += contribution;
            if (entry.source == ResultSource::Vector) {
                entry.source = ResultSource::Hybrid;
            }
        }
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const Entry& a, const Entry& b) { return a.score > b.score; });
    if (entries.size() > top_k) {
        entries.resize(top_k);
    }

    std::vector<SearchResult> results;
    results.reserve(entries.size());
    for (const auto& entry : entries) {
        results.push_back({*entry.document, static_cast<float>(entry.score), entry.source});
    }
    return results;
}

} // namespace fusion

} // namespace coderag::search
