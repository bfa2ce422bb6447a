// Tests for the document store backends (SQLite and in-memory).

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <memory>
#include <string>
#include <vector>

#include "../../common/test_helpers_catch2.h"
#include <coderag/storage/document_store.h>

using Catch::Approx;
using coderag::Embedding;
using coderag::ErrorCode;
using namespace coderag::storage;

namespace {

Document makeDoc(const std::string& id, const std::string& file, std::size_t line,
                 const std::string& content) {
    Document d;
    d.id = id;
    d.content = content;
    d.metadata[kMetaFile] = file;
    d.metadata[kMetaStartLine] = std::to_string(line);
    d.metadata[kMetaKind] = "function";
    return d;
}

std::shared_ptr<DocumentStoreFactory> makeFactory(DocumentStoreType type,
                                                  const std::filesystem::path& dir) {
    StorageConfig config;
    config.backend = type;
    config.data_dir = dir;
    config.context_dir = dir / "context";
    config.dimension = 3;
    config.write_batch_size = 2;
    auto factory = createDocumentStoreFactory(config);
    REQUIRE(factory);
    return factory.value();
}

} // namespace

TEST_CASE("cosineSimilarity handles degenerate vectors", "[storage][cosine][catch2]") {
    CHECK(cosineSimilarity({1.0f, 0.0f}, {1.0f, 0.0f}) == Approx(1.0f));
    CHECK(cosineSimilarity({1.0f, 0.0f}, {0.0f, 2.0f}) == Approx(0.0f));
    CHECK(cosineSimilarity({1.0f, 1.0f}, {-1.0f, -1.0f}) == Approx(-1.0f));
    CHECK(cosineSimilarity({1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}) == 0.0f);
    CHECK(cosineSimilarity({0.0f, 0.0f}, {1.0f, 0.0f}) == 0.0f);
    CHECK(cosineSimilarity({}, {}) == 0.0f);
}

TEST_CASE("backend names parse", "[storage][config][catch2]") {
    CHECK(documentStoreTypeFromString("SQLite").value() == DocumentStoreType::Sqlite);
    CHECK(documentStoreTypeFromString("in-memory").value() == DocumentStoreType::InMemory);
    auto bad = documentStoreTypeFromString("qdrant");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("document store contract", "[storage][catch2]") {
    auto type = GENERATE(DocumentStoreType::Sqlite, DocumentStoreType::InMemory);
    coderag::test::TempDir dir("coderag_store_");
    auto factory = makeFactory(type, dir.path());
    INFO("backend " << documentStoreTypeToString(type));

    auto opened = factory->open("repo_alpha");
    REQUIRE(opened);
    auto store = std::move(opened).value();

    SECTION("operations before initialize fail") {
        auto added = store->add({makeDoc("a_0", "a.py", 1, "x")}, {{1.0f, 0.0f, 0.0f}});
        REQUIRE_FALSE(added);
        CHECK(added.error().code == ErrorCode::NotInitialized);
    }

    REQUIRE(store->initialize());
    REQUIRE(store->initialize());
    CHECK(store->isInitialized());
    CHECK(store->collection() == "repo_alpha");

    std::vector<Document> docs = {makeDoc("a.py_0", "a.py", 10, "def later(): pass"),
                                  makeDoc("a.py_1", "a.py", 1, "import os"),
                                  makeDoc("b.py_2", "b.py", 1, "class B: pass"),
                                  makeDoc("c.py_3", "c.py", 1, "wrong dimension")};
    std::vector<Embedding> vectors = {
        {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.7f, 0.7f, 0.0f}, {1.0f, 0.0f}};

    auto added = store->add(docs, vectors);
    REQUIRE(added);
    CHECK(added.value() == 3);
    CHECK(store->count().value() == 3);

    SECTION("scrollAll returns insertion order with metadata") {
        auto all = store->scrollAll();
        REQUIRE(all);
        REQUIRE(all.value().size() == 3);
        CHECK(all.value()[0].id == "a.py_0");
        CHECK(all.value()[1].id == "a.py_1");
        CHECK(all.value()[2].id == "b.py_2");
        CHECK(all.value()[2].metadata.at(kMetaKind) == "function");
        CHECK(all.value()[2].content == "class B: pass");
    }

    SECTION("search ranks by cosine similarity") {
        auto hits = store->search({1.0f, 0.0f, 0.0f}, 2);
        REQUIRE(hits);
        REQUIRE(hits.value().size() == 2);
        CHECK(hits.value()[0].document.id == "a.py_0");
        CHECK(hits.value()[0].score == Approx(1.0f));
        CHECK(hits.value()[1].document.id == "b.py_2");

        auto filtered = store->search({1.0f, 0.0f, 0.0f}, 5, {{kMetaFile, "b.py"}});
        REQUIRE(filtered);
        REQUIRE(filtered.value().size() == 1);
        CHECK(filtered.value()[0].document.id == "b.py_2");
    }

    SECTION("getByFile orders by start line") {
        auto chunks = store->getByFile("a.py");
        REQUIRE(chunks);
        REQUIRE(chunks.value().size() == 2);
        CHECK(chunks.value()[0].id == "a.py_1");
        CHECK(chunks.value()[1].id == "a.py_0");
        CHECK(store->getByFile("missing.py").value().empty());
    }

    SECTION("deleteByFile removes one file only") {
        auto removed = store->deleteByFile("a.py");
        REQUIRE(removed);
        CHECK(removed.value() == 2);
        CHECK(store->count().value() == 1);
        CHECK(store->deleteByFile("a.py").value() == 0);
    }

    SECTION("a duplicate id fails the write and keeps the stored row") {
        auto again = store->add({makeDoc("d.py_4", "d.py", 1, "fresh"),
                                 makeDoc("b.py_2", "b.py", 1, "replacement")},
                                {{0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 1.0f}});
        REQUIRE_FALSE(again);
        CHECK(again.error().code == ErrorCode::StorageWriteError);
        CHECK(store->count().value() == 3);
        auto all = store->scrollAll();
        REQUIRE(all);
        REQUIRE(all.value().size() == 3);
        CHECK(all.value()[2].id == "b.py_2");
        CHECK(all.value()[2].content == "class B: pass");
    }

    SECTION("collections are isolated") {
        auto other = factory->open("repo_beta");
        REQUIRE(other);
        REQUIRE(other.value()->initialize());
        CHECK(other.value()->count().value() == 0);
        REQUIRE(other.value()->add({makeDoc("z_0", "z.py", 1, "z")}, {{0.0f, 0.0f, 1.0f}}));
        CHECK(store->count().value() == 3);
        CHECK(other.value()->count().value() == 1);
    }

    SECTION("deleteCollection drops everything") {
        REQUIRE(store->deleteCollection());
        CHECK_FALSE(store->isInitialized());
        REQUIRE(store->initialize());
        CHECK(store->count().value() == 0);
        CHECK(store->scrollAll().value().empty());
    }
}

TEST_CASE("SQLite documents persist across connections", "[storage][sqlite][catch2]") {
    coderag::test::TempDir dir("coderag_sqlite_");
    {
        auto factory = makeFactory(DocumentStoreType::Sqlite, dir.path());
        auto store = factory->open("repo_persist").value();
        REQUIRE(store->initialize());
        REQUIRE(store->add({makeDoc("f.py_0", "f.py", 3, "def f(): return 1")},
                           {{0.0f, 1.0f, 0.0f}}));
        factory->close();
    }
    CHECK(std::filesystem::exists(dir.path() / "documents.db"));

    auto factory = makeFactory(DocumentStoreType::Sqlite, dir.path());
    auto store = factory->open("repo_persist").value();
    REQUIRE(store->initialize());
    auto all = store->scrollAll();
    REQUIRE(all);
    REQUIRE(all.value().size() == 1);
    CHECK(all.value()[0].content == "def f(): return 1");
    CHECK(all.value()[0].startLine() == 3);

    auto hits = store->search({0.0f, 1.0f, 0.0f}, 1);
    REQUIRE(hits);
    REQUIRE(hits.value().size() == 1);
    CHECK(hits.value()[0].score == Approx(1.0f));
}
