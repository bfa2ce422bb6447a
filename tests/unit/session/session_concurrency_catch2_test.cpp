// Tests for concurrent writers and readers on one session.

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../common/test_helpers_catch2.h"
#include <coderag/core/worker_pool.h>
#include <coderag/embedding/embedding_gateway.h>
#include <coderag/lock/repo_lock.h>
#include <coderag/search/tokenizer.h>
#include <coderag/session/session_store.h>
#include <coderag/storage/memory_document_store.h>

using namespace std::chrono_literals;
using coderag::Embedding;
using coderag::WorkerPool;
using coderag::chunking::Chunk;
using coderag::lock::LockBackendType;
using coderag::lock::LockConfig;
using coderag::lock::RepoLock;
using coderag::session::SessionDependencies;
using coderag::session::SessionStore;
using coderag::test::DelayedDocumentStoreFactory;
using coderag::test::ScriptedEmbeddingProvider;
using coderag::test::TempDir;

namespace {

constexpr std::size_t kDim = 4;

Chunk chunk(const std::string& file, const std::string& content) {
    Chunk c;
    c.file_path = file;
    c.content = content;
    c.symbol_name = "fn";
    return c;
}

struct Fixture {
    TempDir dir{"coderag_concurrency_"};
    std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>(2);
    std::shared_ptr<coderag::storage::InMemoryDocumentStoreFactory> memory =
        std::make_shared<coderag::storage::InMemoryDocumentStoreFactory>(kDim);
    SessionDependencies deps;

    Fixture() {
        coderag::embedding::EmbeddingConfig config;
        config.dimension = kDim;
        config.retry.max_attempts = 1;
        deps.gateway = std::make_shared<coderag::embedding::EmbeddingGateway>(
            std::make_shared<ScriptedEmbeddingProvider>(kDim), config, pool);
        deps.store_factory = std::make_shared<DelayedDocumentStoreFactory>(memory, 200ms);
        deps.pool = pool;
        deps.storage.backend = coderag::storage::DocumentStoreType::InMemory;
        deps.storage.context_dir = dir.path() / "context";
        deps.storage.dimension = kDim;
    }

    std::shared_ptr<SessionStore> open(const std::string& id) {
        auto created = SessionStore::create(id, deps);
        REQUIRE(created);
        return created.value();
    }
};

LockConfig memoryLocks() {
    LockConfig config;
    config.backend = LockBackendType::Memory;
    config.acquire_timeout = std::chrono::seconds(5);
    return config;
}

} // namespace

TEST_CASE("reset and add on one repository run one after the other under the repo lock",
          "[session][concurrency][lock][catch2]") {
    Fixture f;
    auto store = f.open("shared_repo");
    const Embedding v{1.0f, 0.0f, 0.0f, 0.0f};
    REQUIRE(store->addDocuments({chunk("old.py", "previous index")}, {v}));

    RepoLock locks(coderag::lock::createMemoryLockBackend(), memoryLocks());
    std::mutex events_mutex;
    std::vector<std::string> events;
    auto record = [&](const std::string& event) {
        std::lock_guard<std::mutex> lock(events_mutex);
        events.push_back(event);
    };

    std::promise<void> writer_holds_lock;
    auto writer_ready = writer_holds_lock.get_future();

    auto writer = std::async(std::launch::async, [&]() -> bool {
        auto guard = locks.acquire(store->sessionId());
        if (!guard) {
            return false;
        }
        writer_holds_lock.set_value();
        record("add-begin");
        auto added = store->addDocuments({chunk("a.py", "alpha"), chunk("b.py", "beta")}, {v, v});
        record("add-end");
        return added && added.value() == 2;
    });

    auto resetter = std::async(std::launch::async, [&]() -> bool {
        writer_ready.wait();
        auto guard = locks.acquire(store->sessionId());
        if (!guard) {
            return false;
        }
        record("reset-begin");
        auto reset = store->reset();
        record("reset-end");
        return static_cast<bool>(reset);
    });

    REQUIRE(writer.wait_for(10s) == std::future_status::ready);
    REQUIRE(resetter.wait_for(10s) == std::future_status::ready);
    CHECK(writer.get());
    CHECK(resetter.get());

    CHECK(events ==
          std::vector<std::string>{"add-begin", "add-end", "reset-begin", "reset-end"});
    CHECK_FALSE(locks.isLocked(store->sessionId()));

    // The reset came last, so nothing of the write survives in either index
    CHECK(store->documentCount() == 0);
    auto durable = f.memory->open("repo_shared_repo");
    REQUIRE(durable);
    REQUIRE(durable.value()->initialize());
    CHECK(durable.value()->count().value() == 0);
}

TEST_CASE("readers see the old or the new lexical snapshot while a write is in flight",
          "[session][concurrency][catch2]") {
    Fixture f;
    auto store = f.open("readers");
    const Embedding v{0.0f, 1.0f, 0.0f, 0.0f};

    std::vector<Chunk> base;
    std::vector<Embedding> base_vectors;
    for (int i = 0; i < 6; ++i) {
        base.push_back(chunk("base" + std::to_string(i) + ".py", "base word" + std::to_string(i)));
        base_vectors.push_back(v);
    }
    REQUIRE(store->addDocuments(base, base_vectors));
    REQUIRE(store->documentCount() == 6);

    const coderag::search::Tokenizer tokenizer(f.deps.search.tokenizer);
    std::atomic<bool> write_done{false};
    std::atomic<int> reads{0};
    std::atomic<int> old_reads{0};
    std::atomic<int> torn_reads{0};
    std::atomic<int> failed_searches{0};

    auto reader = std::async(std::launch::async, [&]() {
        while (true) {
            const bool last_round = write_done.load();
            auto snapshot = store->lexicalSnapshot();
            const std::size_t size = snapshot ? snapshot->size() : 0;
            const auto hits = snapshot ? snapshot->search("marker", 10, tokenizer).size() : 0;
            const bool old_view = size == 6 && hits == 0;
            const bool new_view = size == 8 && hits == 2 &&
                                  snapshot->indexed_files.count("new.py") == 1;
            if (!old_view && !new_view) {
                ++torn_reads;
            }
            if (old_view) {
                ++old_reads;
            }
            const auto count = store->documentCount();
            if (count != 6 && count != 8) {
                ++torn_reads;
            }
            if (!store->search("marker", 3)) {
                ++failed_searches;
            }
            ++reads;
            if (last_round) {
                return;
            }
            std::this_thread::sleep_for(1ms);
        }
    });

    // Make sure the reader is running before the write starts
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (reads.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    auto added = store->addDocuments({chunk("new.py", "marker first"),
                                      chunk("new.py", "marker second")},
                                     {v, v});
    write_done = true;
    REQUIRE(reader.wait_for(10s) == std::future_status::ready);
    reader.get();

    REQUIRE(added);
    CHECK(added.value() == 2);
    CHECK(reads.load() > 1);
    CHECK(old_reads.load() > 0);
    CHECK(torn_reads.load() == 0);
    CHECK(failed_searches.load() == 0);
    CHECK(store->documentCount() == 8);
}
