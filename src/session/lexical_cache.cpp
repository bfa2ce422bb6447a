#include <coderag/core/atomic_file.h>
#include <coderag/session/lexical_cache.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace coderag::session {

using json = nlohmann::json;

LexicalCache::LexicalCache(std::filesystem::path path, std::string format_version)
    : path_(std::move(path)), format_version_(std::move(format_version)) {}

Result<std::shared_ptr<const search::LexicalIndex>> LexicalCache::load() const {
    auto text = readFile(path_);
    if (!text) {
        return text.error();
    }
    try {
        auto j = json::parse(text.value());
        auto version = j.value("format_version", std::string());
        if (version != format_version_) {
            return Error{ErrorCode::CorruptedData,
                         "Cache format '" + version + "' != '" + format_version_ + "'"};
        }

        auto bm25 = search::Bm25Index::fromJson(j.at("bm25"));
        if (!bm25) {
            return bm25.error();
        }

        auto index = std::make_shared<search::LexicalIndex>();
        for (const auto& entry : j.at("documents")) {
            storage::Document doc;
            doc.id = entry.at("id").get<std::string>();
            doc.content = entry.at("content").get<std::string>();
            doc.metadata = entry.at("metadata").get<std::map<std::string, std::string>>();
            index->documents.push_back(std::move(doc));
        }
        if (index->documents.size() != bm25.value().size()) {
            return Error{ErrorCode::CorruptedData, "Cached documents do not match BM25 corpus"};
        }
        index->bm25 = std::move(bm25).value();
        index->indexed_files = j.at("indexed_files").get<std::set<std::string>>();

        std::shared_ptr<const search::LexicalIndex> snapshot = std::move(index);
        return snapshot;
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData, std::string("Malformed lexical cache: ") + e.what()};
    }
}

Result<void> LexicalCache::save(const search::LexicalIndex& index) const {
    if (index.documents.empty()) {
        return {};
    }
    json j;
    j["format_version"] = format_version_;
    j["bm25"] = index.bm25.toJson();
    auto documents = json::array();
    for (const auto& doc : index.documents) {
        documents.push_back(
            json{{"id", doc.id}, {"content", doc.content}, {"metadata", doc.metadata}});
    }
    j["documents"] = std::move(documents);
    j["indexed_files"] = index.indexed_files;

    auto written = atomicWrite(path_, j.dump(-1, ' ', false, json::error_handler_t::replace));
    if (!written) {
        spdlog::error("Failed to save lexical cache {}: {}", path_.string(),
                      written.error().message);
    }
    return written;
}

Result<void> LexicalCache::remove() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot remove " + path_.string() + ": " + ec.message()};
    }
    return {};
}

} // namespace coderag::session
