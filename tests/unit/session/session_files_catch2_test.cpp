// Tests for the per-session context file and lexical cache.

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "../../common/test_helpers_catch2.h"
#include <coderag/session/lexical_cache.h>
#include <coderag/session/session_context.h>

using coderag::ErrorCode;
using coderag::search::LexicalIndex;
using coderag::search::Tokenizer;
using coderag::session::LexicalCache;
using coderag::session::SessionContext;
using coderag::test::TempDir;
using coderag::test::write_file;
namespace storage = coderag::storage;

namespace {

std::shared_ptr<const LexicalIndex> sampleIndex() {
    std::vector<storage::Document> docs;
    for (int i = 0; i < 3; ++i) {
        storage::Document d;
        d.id = "m.py_" + std::to_string(i);
        d.content = "def handler_" + std::to_string(i) + "(request): return request";
        d.metadata[storage::kMetaFile] = i < 2 ? "m.py" : "n.py";
        d.metadata[storage::kMetaStartLine] = std::to_string(i * 10 + 1);
        docs.push_back(std::move(d));
    }
    return LexicalIndex::build(std::move(docs), Tokenizer());
}

} // namespace

TEST_CASE("SessionContext saves and merges", "[session][context][catch2]") {
    TempDir dir("coderag_ctx_");
    SessionContext context(dir / "repo_x.json");

    auto missing = context.load();
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);
    CHECK_FALSE(context.hasIndex());
    CHECK_FALSE(context.report().has_value());
    CHECK(context.availableLanguages().empty());

    REQUIRE(context.save("https://github.com/o/r", {{"file_count", 3}}));
    CHECK(context.hasIndex());
    REQUIRE(context.saveReport("English overview"));
    REQUIRE(context.saveReport("Resume en francais", "fr"));

    CHECK(context.report().value() == "English overview");
    CHECK(context.report("fr").value() == "Resume en francais");
    CHECK_FALSE(context.report("de").has_value());
    CHECK(context.availableLanguages() == std::vector<std::string>{"en", "fr"});

    // A later context save keeps the reports
    REQUIRE(context.save("https://github.com/o/r", {{"file_count", 4}}));
    auto data = context.load();
    REQUIRE(data);
    CHECK(data.value()["global_context"]["file_count"] == 4);
    CHECK(data.value()["reports"]["fr"] == "Resume en francais");
    CHECK(data.value()["report"] == "Resume en francais");
    CHECK(data.value()["report_language"] == "fr");

    REQUIRE(context.remove());
    CHECK_FALSE(context.hasIndex());
    REQUIRE(context.remove());
}

TEST_CASE("SessionContext reads the single-report layout", "[session][context][catch2]") {
    TempDir dir("coderag_ctx_");
    auto path = write_file(dir / "legacy.json",
                           R"({"repo_url": "https://github.com/o/r", "report": "Alter Bericht",)"
                           R"( "report_language": "de"})");
    SessionContext context(path);
    CHECK(context.report("de").value() == "Alter Bericht");
    CHECK_FALSE(context.report("en").has_value());
    CHECK(context.availableLanguages().empty());
}

TEST_CASE("SessionContext reports unreadable files", "[session][context][catch2]") {
    TempDir dir("coderag_ctx_");
    auto path = write_file(dir / "broken.json", "{not json");
    SessionContext context(path);
    auto data = context.load();
    REQUIRE_FALSE(data);
    CHECK(data.error().code == ErrorCode::CorruptedData);
    CHECK_FALSE(context.hasIndex());

    // Saving replaces the unreadable content
    REQUIRE(context.save("https://github.com/o/r", nlohmann::json::object()));
    CHECK(context.load());
}

TEST_CASE("LexicalCache round trip", "[session][cache][catch2]") {
    TempDir dir("coderag_cache_");
    LexicalCache cache(dir / "s_bm25.json", "v1");

    auto absent = cache.load();
    REQUIRE_FALSE(absent);
    CHECK(absent.error().code == ErrorCode::FileNotFound);

    auto original = sampleIndex();
    REQUIRE(cache.save(*original));
    auto loaded = cache.load();
    REQUIRE(loaded);
    const auto& restored = *loaded.value();
    REQUIRE(restored.size() == 3);
    CHECK(restored.documents[1].id == "m.py_1");
    CHECK(restored.documents[2].file() == "n.py");
    CHECK(restored.indexed_files == original->indexed_files);

    Tokenizer tokenizer;
    auto hits = restored.search("handler_2", 3, tokenizer);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == "m.py_2");

    REQUIRE(cache.remove());
    CHECK_FALSE(std::filesystem::exists(cache.path()));
}

TEST_CASE("LexicalCache skips empty indexes", "[session][cache][catch2]") {
    TempDir dir("coderag_cache_");
    LexicalCache cache(dir / "s_bm25.json", "v1");
    REQUIRE(cache.save(*LexicalIndex::build({}, Tokenizer())));
    CHECK_FALSE(std::filesystem::exists(cache.path()));
}

TEST_CASE("LexicalCache rejects stale or damaged files", "[session][cache][catch2]") {
    TempDir dir("coderag_cache_");
    auto path = dir / "s_bm25.json";

    SECTION("other format version") {
        REQUIRE(LexicalCache(path, "v1").save(*sampleIndex()));
        auto loaded = LexicalCache(path, "v2").load();
        REQUIRE_FALSE(loaded);
        CHECK(loaded.error().code == ErrorCode::CorruptedData);
    }

    SECTION("malformed JSON") {
        write_file(path, "{\"format_version\": \"v1\", \"bm25\": ");
        auto loaded = LexicalCache(path, "v1").load();
        REQUIRE_FALSE(loaded);
        CHECK(loaded.error().code == ErrorCode::CorruptedData);
    }

    SECTION("documents out of step with the BM25 corpus") {
        REQUIRE(LexicalCache(path, "v1").save(*sampleIndex()));
        auto j = nlohmann::json::parse(coderag::test::read_file(path));
        j["documents"].erase(0);
        write_file(path, j.dump());
        auto loaded = LexicalCache(path, "v1").load();
        REQUIRE_FALSE(loaded);
        CHECK(loaded.error().code == ErrorCode::CorruptedData);
    }
}
