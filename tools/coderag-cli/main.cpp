#include <coderag/chunking/code_chunker.h>
#include <coderag/config/config_helpers.h>
#include <coderag/config/engine_config.h>
#include <coderag/core/worker_pool.h>
#include <coderag/embedding/embedding_gateway.h>
#include <coderag/embedding/embedding_provider.h>
#include <coderag/indexing/repository_indexer.h>
#include <coderag/lock/repo_lock.h>
#include <coderag/session/session_context.h>
#include <coderag/session/session_id.h>
#include <coderag/session/session_manager.h>
#include <coderag/storage/document_store.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using json = nlohmann::json;
using namespace coderag;

namespace {

// Everything a command needs, wired from one EngineConfig
struct Engine {
    config::EngineConfig config;
    std::shared_ptr<WorkerPool> pool;
    std::shared_ptr<embedding::EmbeddingGateway> gateway;
    std::shared_ptr<session::SessionManager> sessions;
    std::shared_ptr<lock::RepoLock> locks;
};

Result<Engine> openEngine(config::EngineConfig cfg) {
    Engine engine;
    engine.pool = std::make_shared<WorkerPool>(cfg.session.worker_threads);

    auto provider = embedding::createHashingProvider(cfg.embedding.dimension);
    engine.gateway =
        std::make_shared<embedding::EmbeddingGateway>(provider, cfg.embedding, engine.pool);

    auto factory = storage::createDocumentStoreFactory(cfg.storage);
    if (!factory) {
        return factory.error();
    }

    session::SessionDependencies deps;
    deps.store_factory = factory.value();
    deps.gateway = engine.gateway;
    deps.pool = engine.pool;
    deps.storage = cfg.storage;
    deps.search = cfg.search;
    engine.sessions = std::make_shared<session::SessionManager>(deps, cfg.session.max_sessions);

    auto locks = lock::createRepoLock(cfg.lock);
    if (!locks) {
        return locks.error();
    }
    engine.locks = std::shared_ptr<lock::RepoLock>(std::move(locks).value());
    engine.config = std::move(cfg);
    return engine;
}

int fail(const Error& error) {
    spdlog::error("{}: {}", errorToString(error.code), error.message);
    return error.code == ErrorCode::LockTimeout ? 3 : 1;
}

std::string preview(const std::string& content, std::size_t max_lines) {
    std::istringstream in(content);
    std::ostringstream out;
    std::string line;
    for (std::size_t i = 0; i < max_lines && std::getline(in, line); ++i) {
        out << "    " << line << '\n';
    }
    return out.str();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Hybrid code retrieval engine", "coderag"};
        app.require_subcommand(1);

        std::string configPath;
        std::string dataDir;
        bool verbose = false;
        app.add_option("-c,--config", configPath, "Configuration file");
        app.add_option("--data-dir", dataDir, "Data directory for storage");
        app.add_flag("-v,--verbose", verbose, "Enable verbose output");

        // index
        auto* indexCmd = app.add_subcommand("index", "Chunk, embed and store a repository");
        std::string indexDir;
        std::string repoUrl;
        std::string indexSession;
        bool keepExisting = false;
        bool replaceFiles = false;
        indexCmd->add_option("dir", indexDir, "Repository checkout")
            ->required()
            ->check(CLI::ExistingDirectory);
        indexCmd->add_option("--repo-url", repoUrl, "Repository URL (derives the session id)");
        indexCmd->add_option("-s,--session", indexSession, "Session id");
        indexCmd->add_flag("--keep", keepExisting, "Add to the session instead of resetting it");
        indexCmd->add_flag("--replace-files", replaceFiles,
                           "Drop stored chunks of files being re-indexed");

        // search
        auto* searchCmd = app.add_subcommand("search", "Hybrid search in a session");
        std::string query;
        std::string searchSession;
        std::size_t topK = 0;
        bool asJson = false;
        searchCmd->add_option("query", query, "Search query")->required();
        searchCmd->add_option("-s,--session", searchSession, "Session id")->required();
        searchCmd->add_option("-k,--top-k", topK, "Maximum results (0 = configured default)");
        searchCmd->add_flag("--json", asJson, "Print results as JSON");

        // chunk
        auto* chunkCmd = app.add_subcommand("chunk", "Show how a file is chunked");
        std::string chunkFile;
        chunkCmd->add_option("file", chunkFile, "Source file")
            ->required()
            ->check(CLI::ExistingFile);

        // reset
        auto* resetCmd = app.add_subcommand("reset", "Delete everything indexed in a session");
        std::string resetSession;
        resetCmd->add_option("session", resetSession, "Session id")->required();

        // sessions
        auto* sessionsCmd = app.add_subcommand("sessions", "List sessions with a saved context");

        CLI11_PARSE(app, argc, argv);

        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
        }
        if (!dataDir.empty()) {
            ::setenv("CODERAG_DATA_DIR", dataDir.c_str(), 1);
        }

        auto cfg = config::loadEngineConfig(config::get_config_path(configPath));
        if (!cfg) {
            return fail(cfg.error());
        }

        if (*chunkCmd) {
            std::ifstream in(chunkFile, std::ios::binary);
            std::ostringstream buffer;
            buffer << in.rdbuf();
            chunking::CodeChunker chunker(cfg.value().chunking);
            auto chunks = chunker.chunk(buffer.str(), chunkFile);
            std::cout << chunkFile << ": " << chunks.size() << " chunks ("
                      << chunking::strategyToString(chunking::strategyForPath(chunkFile)) << ")\n";
            for (const auto& chunk : chunks) {
                std::cout << "  [" << chunking::chunkKindToString(chunk.kind) << "] "
                          << (chunk.symbol_name.empty() ? "-" : chunk.symbol_name)
                          << (chunk.enclosing_type ? " in " + *chunk.enclosing_type : "")
                          << " line " << chunk.start_line << ", " << chunk.content.size()
                          << " bytes\n";
            }
            return 0;
        }

        if (*sessionsCmd) {
            const auto& dir = cfg.value().storage.context_dir;
            json out = json::array();
            std::error_code ec;
            for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
                auto name = entry.path().filename().string();
                if (entry.path().extension() != ".json" ||
                    name.find("_bm25.json") != std::string::npos) {
                    continue;
                }
                session::SessionContext context(entry.path());
                auto data = context.load();
                if (!data) {
                    continue;
                }
                out.push_back(json{{"session_id", entry.path().stem().string()},
                                   {"repo_url", data.value().value("repo_url", "")},
                                   {"languages", context.availableLanguages()}});
            }
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        auto engine = openEngine(std::move(cfg).value());
        if (!engine) {
            return fail(engine.error());
        }
        auto& e = engine.value();

        if (*indexCmd) {
            std::string sessionId = indexSession;
            if (sessionId.empty()) {
                sessionId = repoUrl.empty() ? session::chatSessionId()
                                            : session::repoSessionId(repoUrl);
            }

            auto files = indexing::collectSourceFiles(indexDir);
            if (!files) {
                return fail(files.error());
            }

            indexing::IndexingOptions options;
            options.reset_first = !keepExisting;
            options.replace_existing_files = replaceFiles;
            if (!repoUrl.empty()) {
                options.repo_url = session::normalizeRepoUrl(repoUrl);
            }

            indexing::RepositoryIndexer indexer(e.sessions, e.locks, e.gateway,
                                                e.config.chunking, e.pool);
            auto report = indexer.indexRepository(
                sessionId, files.value(), options,
                [](std::string_view stage, std::size_t done, std::size_t total) {
                    spdlog::debug("{}: {}/{}", stage, done, total);
                });
            if (!report) {
                return fail(report.error());
            }
            std::cout << report.value().toJson().dump(2) << std::endl;
            return 0;
        }

        if (*searchCmd) {
            auto store = e.sessions->getOrCreate(searchSession);
            if (!store) {
                return fail(store.error());
            }
            auto results = store.value()->search(query, topK);
            if (!results) {
                return fail(results.error());
            }

            if (asJson) {
                json out = json::array();
                for (const auto& r : results.value()) {
                    out.push_back(json{{"id", r.document.id},
                                       {"score", r.score},
                                       {"source", search::resultSourceToString(r.source)},
                                       {"metadata", r.document.metadata},
                                       {"content", r.document.content}});
                }
                std::cout << out.dump(2) << std::endl;
                return 0;
            }

            if (results.value().empty()) {
                std::cout << "No results" << std::endl;
                return 0;
            }
            for (const auto& r : results.value()) {
                std::cout << r.document.file() << ":" << r.document.startLine() << "  ("
                          << search::resultSourceToString(r.source) << ", " << r.score << ")\n"
                          << preview(r.document.content, 6) << '\n';
            }
            return 0;
        }

        if (*resetCmd) {
            auto guard = e.locks->acquire(resetSession);
            if (!guard) {
                return fail(guard.error());
            }
            auto store = e.sessions->getOrCreate(resetSession);
            if (!store) {
                return fail(store.error());
            }
            if (auto r = store.value()->reset(); !r) {
                return fail(r.error());
            }
            std::cout << "Session " << store.value()->sessionId() << " reset" << std::endl;
            return 0;
        }

        return 0;
    } catch (const std::exception& ex) {
        spdlog::error("Fatal error: {}", ex.what());
        return 1;
    }
}
