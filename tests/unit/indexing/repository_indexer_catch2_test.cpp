// Tests for repository discovery and the locked chunk-embed-store pipeline.

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "../../common/test_helpers_catch2.h"
#include <coderag/core/worker_pool.h>
#include <coderag/embedding/embedding_gateway.h>
#include <coderag/embedding/embedding_provider.h>
#include <coderag/indexing/repository_indexer.h>
#include <coderag/lock/repo_lock.h>
#include <coderag/session/session_manager.h>
#include <coderag/storage/memory_document_store.h>

using namespace std::chrono_literals;
using coderag::ErrorCode;
using coderag::WorkerPool;
using coderag::test::TempDir;
using namespace coderag::indexing;

namespace {

constexpr std::size_t kDim = 64;

const char* kPythonSource = R"(import os


def load_settings(path):
    """Read key=value pairs from a settings file."""
    settings = {}
    with open(path) as handle:
        for line in handle:
            key, _, value = line.partition("=")
            settings[key.strip()] = value.strip()
    return settings


def save_settings(path, settings):
    with open(path, "w") as handle:
        for key, value in settings.items():
            handle.write(key + "=" + value + "\n")
)";

struct Fixture {
    TempDir dir{"coderag_indexer_"};
    std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>(2);
    std::shared_ptr<coderag::session::SessionManager> sessions;
    std::shared_ptr<coderag::lock::RepoLock> locks;
    std::unique_ptr<RepositoryIndexer> indexer;

    Fixture() {
        coderag::embedding::EmbeddingConfig config;
        config.dimension = kDim;
        auto gateway = std::make_shared<coderag::embedding::EmbeddingGateway>(
            std::make_shared<coderag::embedding::HashingEmbeddingProvider>(kDim), config, pool);

        coderag::session::SessionDependencies deps;
        deps.gateway = gateway;
        deps.store_factory = std::make_shared<coderag::storage::InMemoryDocumentStoreFactory>(kDim);
        deps.pool = pool;
        deps.storage.context_dir = dir.path() / "context";
        deps.storage.dimension = kDim;
        sessions = std::make_shared<coderag::session::SessionManager>(deps, 8);

        coderag::lock::LockConfig lock_config;
        lock_config.backend = coderag::lock::LockBackendType::Memory;
        auto created = coderag::lock::createRepoLock(lock_config);
        REQUIRE(created);
        locks = std::move(created).value();

        indexer = std::make_unique<RepositoryIndexer>(sessions, locks, gateway,
                                                      coderag::chunking::ChunkerConfig{}, pool);
    }

    std::vector<SourceFile> files() const {
        return {{"src/settings.py", kPythonSource},
                {"README.md", "# Settings\n\nLoads and saves key value settings files.\n"}};
    }
};

} // namespace

TEST_CASE("binary content is detected by NUL bytes", "[indexing][catch2]") {
    CHECK(looksLikeText("plain text\n"));
    CHECK(looksLikeText(""));
    CHECK_FALSE(looksLikeText(std::string("ab\0cd", 5)));
    // Only the first 8 KiB are inspected
    std::string late_nul(9000, 'x');
    late_nul[8500] = '\0';
    CHECK(looksLikeText(late_nul));
}

TEST_CASE("source discovery skips excluded, binary and empty files", "[indexing][catch2]") {
    TempDir repo("coderag_walk_");
    coderag::test::write_file(repo / "src/main.py", "print('hi')\n");
    coderag::test::write_file(repo / "README.md", "# readme\n");
    coderag::test::write_file(repo / ".git/config", "[core]\n");
    coderag::test::write_file(repo / "node_modules/pkg/index.js", "module.exports = 1;\n");
    coderag::test::write_file(repo / "nested/build/out.txt", "generated\n");
    coderag::test::write_file(repo / "logo.png", std::string("\x89PNG\0\0", 6));
    coderag::test::write_file(repo / "empty.txt", "");

    auto found = collectSourceFiles(repo.path());
    REQUIRE(found);
    std::vector<std::string> paths;
    for (const auto& f : found.value()) {
        paths.push_back(f.path);
    }
    CHECK(paths == std::vector<std::string>{"README.md", "src/main.py"});
    CHECK(found.value()[1].content == "print('hi')\n");

    FileWalkerConfig small;
    small.max_file_size = 10;
    auto limited = collectSourceFiles(repo.path(), small);
    REQUIRE(limited);
    REQUIRE(limited.value().size() == 1);
    CHECK(limited.value()[0].path == "README.md");

    auto missing = collectSourceFiles(repo / "nope");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);
}

TEST_CASE("indexing chunks, embeds and stores a repository", "[indexing][catch2]") {
    Fixture f;
    std::mutex progress_mutex;
    std::set<std::string> stages;
    IndexingOptions options;
    options.repo_url = "https://github.com/octocat/settings";

    auto report = f.indexer->indexRepository(
        "repo_settings", f.files(), options,
        [&](std::string_view stage, std::size_t, std::size_t) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            stages.insert(std::string(stage));
        });
    REQUIRE(report);
    const auto& r = report.value();
    CHECK(r.session_id == "repo_settings");
    CHECK(r.files == 2);
    CHECK(r.chunks >= 2);
    CHECK(r.embedded == r.chunks);
    CHECK(r.added == r.chunks);
    CHECK(r.dropped == 0);
    CHECK(stages == std::set<std::string>{"chunk", "embed", "store"});

    auto j = r.toJson();
    CHECK(j["session_id"] == "repo_settings");
    CHECK(j["added"] == r.added);
    CHECK(j.contains("duration_ms"));

    auto store = f.sessions->getOrCreate("repo_settings");
    REQUIRE(store);
    CHECK(store.value()->documentCount() == r.added);
    CHECK(store.value()->indexedFiles() ==
          std::set<std::string>{"README.md", "src/settings.py"});
    CHECK(store.value()->repoUrl().value() == "https://github.com/octocat/settings");
    auto context = store.value()->globalContext();
    CHECK(context["file_count"] == 2);
    CHECK(context["file_tree"][0] == "src/settings.py");

    auto results = store.value()->search("save_settings", 3);
    REQUIRE(results);
    bool from_source = false;
    for (const auto& hit : results.value()) {
        from_source = from_source || hit.document.file() == "src/settings.py";
    }
    CHECK(from_source);

    SECTION("re-indexing starts from an empty session") {
        auto again = f.indexer->indexRepository("repo_settings", f.files(), options);
        REQUIRE(again);
        CHECK(store.value()->documentCount() == again.value().added);
        CHECK(again.value().added == r.added);
    }

    SECTION("keeping the session accumulates documents") {
        IndexingOptions keep;
        keep.reset_first = false;
        auto again = f.indexer->indexRepository("repo_settings", {f.files()[1]}, keep);
        REQUIRE(again);
        CHECK(store.value()->documentCount() == r.added + again.value().added);
        // Context untouched without a repo URL
        CHECK(store.value()->repoUrl().has_value());
    }
}

TEST_CASE("indexing a busy repository times out", "[indexing][lock][catch2]") {
    Fixture f;
    auto held = f.locks->acquire("repo_busy");
    REQUIRE(held);

    IndexingOptions options;
    options.lock_timeout = 50ms;
    auto report = f.indexer->indexRepository("repo_busy", f.files(), options);
    REQUIRE_FALSE(report);
    CHECK(report.error().code == ErrorCode::LockTimeout);

    REQUIRE(held.value().release());
    auto retried = f.indexer->indexRepository("repo_busy", f.files(), options);
    REQUIRE(retried);
    CHECK(retried.value().added > 0);
}

TEST_CASE("indexing without files records an empty run", "[indexing][catch2]") {
    Fixture f;
    auto report = f.indexer->indexRepository("repo_empty", {});
    REQUIRE(report);
    CHECK(report.value().files == 0);
    CHECK(report.value().chunks == 0);
    CHECK(report.value().added == 0);
}
