#include <coderag/storage/document_store.h>
#include <coderag/storage/memory_document_store.h>
#include <coderag/storage/sqlite_document_store.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace coderag::storage {

const char* documentStoreTypeToString(DocumentStoreType type) {
    switch (type) {
        case DocumentStoreType::Sqlite:
            return "sqlite";
        case DocumentStoreType::InMemory:
            return "memory";
    }
    return "unknown";
}

Result<DocumentStoreType> documentStoreTypeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "sqlite") {
        return DocumentStoreType::Sqlite;
    }
    if (lower == "memory" || lower == "in-memory" || lower == "inmemory") {
        return DocumentStoreType::InMemory;
    }
    return Error{ErrorCode::InvalidArgument, "Unknown document store backend: " + name};
}

Result<std::shared_ptr<DocumentStoreFactory>> createDocumentStoreFactory(const StorageConfig& config) {
    switch (config.backend) {
        case DocumentStoreType::InMemory: {
            std::shared_ptr<DocumentStoreFactory> factory =
                std::make_shared<InMemoryDocumentStoreFactory>(config.dimension);
            return factory;
        }
        case DocumentStoreType::Sqlite: {
            auto conn = SqliteConnection::open(config.data_dir / "documents.db");
            if (!conn) {
                return conn.error();
            }
            spdlog::info("Document store: sqlite at {}", conn.value()->path().string());
            std::shared_ptr<DocumentStoreFactory> factory =
                std::make_shared<SqliteDocumentStoreFactory>(conn.value(), config);
            return factory;
        }
    }
    return Error{ErrorCode::NotSupported, "Unsupported document store backend"};
}

float cosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0.0 || nb == 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

bool matchesFilter(const Document& document, const MetadataFilter& filter) {
    for (const auto& [key, value] : filter) {
        auto it = document.metadata.find(key);
        if (it == document.metadata.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

} // namespace coderag::storage
