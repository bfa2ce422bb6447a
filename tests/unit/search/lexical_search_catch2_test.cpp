// Tests for tokenization, BM25 scoring and lexical snapshots.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>
#include <vector>

#include <coderag/search/bm25_index.h>
#include <coderag/search/lexical_index.h>
#include <coderag/search/tokenizer.h>

using Catch::Approx;
using coderag::search::Bm25Index;
using coderag::search::Bm25Params;
using coderag::search::LexicalIndex;
using coderag::search::Tokenizer;
using coderag::search::TokenizerConfig;
namespace storage = coderag::storage;

namespace {

storage::Document doc(const std::string& id, const std::string& file, const std::string& content) {
    storage::Document d;
    d.id = id;
    d.content = content;
    d.metadata[storage::kMetaFile] = file;
    d.metadata[storage::kMetaStartLine] = "1";
    d.embedding = coderag::Embedding{1.0f, 0.0f};
    return d;
}

std::vector<std::vector<std::string>> sampleCorpus() {
    Tokenizer tokenizer;
    return {tokenizer.tokenize("parse config file"), tokenizer.tokenize("render html page"),
            tokenizer.tokenize("parse html template")};
}

} // namespace

TEST_CASE("Tokenizer lowercases and splits on punctuation", "[search][tokenizer][catch2]") {
    Tokenizer tokenizer;
    auto tokens = tokenizer.tokenize("def parseConfig(file_path): return CONFIG[\"x\"]");
    std::vector<std::string> expected = {"def", "parseconfig", "file_path", "return", "config",
                                         "x"};
    CHECK(tokens == expected);
    CHECK(tokenizer.tokenize("").empty());
    CHECK(tokenizer.tokenize("  ;;  ").empty());
}

TEST_CASE("Tokenizer honours configured word characters", "[search][tokenizer][catch2]") {
    TokenizerConfig config;
    config.extra_word_chars = "-";
    Tokenizer dashed(config);
    CHECK(dashed.tokenize("foo-bar baz") == std::vector<std::string>{"foo-bar", "baz"});

    // "é" is two bytes outside ASCII
    TokenizerConfig ascii;
    ascii.non_ascii_is_word = false;
    CHECK(Tokenizer(ascii).tokenize("h\xC3\xA9llo") == std::vector<std::string>{"h", "llo"});
    CHECK(Tokenizer().tokenize("h\xC3\xA9llo") == std::vector<std::string>{"h\xC3\xA9llo"});
}

TEST_CASE("BM25 floors idf of common terms", "[search][bm25][catch2]") {
    auto index = Bm25Index::build(sampleCorpus());
    REQUIRE(index.size() == 3);
    CHECK(index.averageLength() == Approx(3.0));

    const double rare = std::log(2.5 / 1.5);
    CHECK(index.idf("config") == Approx(rare));
    // 5 rare terms at +rare and 2 common ones at -rare: average idf is 3 * rare / 7
    CHECK(index.idf("parse") == Approx(0.25 * 3.0 * rare / 7.0));
    CHECK(index.idf("html") == Approx(index.idf("parse")));
    CHECK(index.idf("missing") == 0.0);
}

TEST_CASE("BM25 topK keeps positive scores in rank order", "[search][bm25][catch2]") {
    auto index = Bm25Index::build(sampleCorpus());

    auto hits = index.topK({"config"}, 5);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].first == 0);
    CHECK(hits[0].second > 0.0);

    auto both = index.topK({"parse", "template"}, 5);
    REQUIRE(both.size() == 2);
    CHECK(both[0].first == 2);
    CHECK(both[1].first == 0);
    CHECK(both[0].second > both[1].second);

    CHECK(index.topK({"nothing"}, 5).empty());
    CHECK(index.topK({"parse"}, 1).size() == 1);
    CHECK(Bm25Index::build({}).topK({"parse"}, 3).empty());
}

TEST_CASE("BM25 index survives serialization", "[search][bm25][catch2]") {
    Bm25Params params;
    params.k1 = 1.2;
    auto index = Bm25Index::build(sampleCorpus(), params);
    auto restored = Bm25Index::fromJson(index.toJson());
    REQUIRE(restored);
    CHECK(restored.value().params().k1 == Approx(1.2));
    auto expected = index.scores({"parse", "html"});
    auto actual = restored.value().scores({"parse", "html"});
    REQUIRE(actual.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        CHECK(actual[i] == Approx(expected[i]));
    }

    auto broken = Bm25Index::fromJson(nlohmann::json{{"k1", "not a number"}});
    REQUIRE_FALSE(broken);
    CHECK(broken.error().code == coderag::ErrorCode::CorruptedData);
}

TEST_CASE("LexicalIndex strips embeddings and tracks files", "[search][lexical][catch2]") {
    Tokenizer tokenizer;
    auto snapshot = LexicalIndex::build({doc("a.py_0", "a.py", "def parse_config(): pass"),
                                         doc("b.py_1", "b.py", "def render(): pass"),
                                         doc("a.py_2", "a.py", "CONFIG = {}")},
                                        tokenizer);
    REQUIRE(snapshot->size() == 3);
    for (const auto& d : snapshot->documents) {
        CHECK_FALSE(d.embedding.has_value());
    }
    CHECK(snapshot->indexed_files == std::set<std::string>{"a.py", "b.py"});

    auto hits = snapshot->search("render", 5, tokenizer);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == "b.py_1");
    CHECK(snapshot->search("render", 0, tokenizer).empty());

    auto empty = LexicalIndex::build({}, tokenizer);
    CHECK(empty->size() == 0);
    CHECK(empty->search("anything", 5, tokenizer).empty());
}
