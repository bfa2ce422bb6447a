// Tests for Reciprocal Rank Fusion.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>
#include <vector>

#include <coderag/search/rank_fusion.h>

using Catch::Approx;
using coderag::search::FusionConfig;
using coderag::search::ResultSource;
namespace fusion = coderag::search::fusion;
namespace storage = coderag::storage;

namespace {

std::vector<storage::Document> docs(std::initializer_list<const char*> ids) {
    std::vector<storage::Document> out;
    for (const char* id : ids) {
        storage::Document d;
        d.id = id;
        d.content = std::string("content of ") + id;
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace

TEST_CASE("reciprocalRank is weight over k plus rank", "[search][fusion][catch2]") {
    CHECK(fusion::reciprocalRank(1, 1.0, 60.0) == Approx(1.0 / 61.0));
    CHECK(fusion::reciprocalRank(3, 0.3, 60.0) == Approx(0.3 / 63.0));
}

TEST_CASE("lexical agreement lifts a document above vector-only hits",
          "[search][fusion][catch2]") {
    auto results = fusion::fuse(docs({"A", "B", "C"}), docs({"C", "D"}), 3);
    REQUIRE(results.size() == 3);

    CHECK(results[0].document.id == "C");
    CHECK(results[0].source == ResultSource::Hybrid);
    CHECK(results[0].score == Approx(1.0 / 63.0 + 0.3 / 61.0));

    CHECK(results[1].document.id == "A");
    CHECK(results[1].source == ResultSource::Vector);
    CHECK(results[1].score == Approx(1.0 / 61.0));

    CHECK(results[2].document.id == "B");
    CHECK(results[2].source == ResultSource::Vector);
}

TEST_CASE("fused scores are non-increasing and ids unique", "[search][fusion][catch2]") {
    auto results = fusion::fuse(docs({"A", "B", "C", "D"}), docs({"D", "E", "A", "F"}), 10);
    REQUIRE(results.size() == 6);
    std::set<std::string> seen;
    for (std::size_t i = 0; i < results.size(); ++i) {
        CHECK(seen.insert(results[i].document.id).second);
        if (i > 0) {
            CHECK(results[i - 1].score >= results[i].score);
        }
    }
    CHECK(results.back().document.id == "F");
    CHECK(results.back().source == ResultSource::Lexical);
}

TEST_CASE("fusion degrades to a single list", "[search][fusion][catch2]") {
    auto lexical_only = fusion::fuse({}, docs({"X", "Y"}), 5);
    REQUIRE(lexical_only.size() == 2);
    CHECK(lexical_only[0].document.id == "X");
    CHECK(lexical_only[1].document.id == "Y");
    CHECK(lexical_only[0].source == ResultSource::Lexical);

    auto vector_only = fusion::fuse(docs({"P", "Q"}), {}, 1);
    REQUIRE(vector_only.size() == 1);
    CHECK(vector_only[0].document.id == "P");

    CHECK(fusion::fuse({}, {}, 5).empty());
}

TEST_CASE("equal scores keep vector order first", "[search][fusion][catch2]") {
    FusionConfig config;
    config.lexical_weight = 1.0;
    // A is first in the vector list and B first in the lexical list: identical scores
    auto results = fusion::fuse(docs({"A"}), docs({"B"}), 2, config);
    REQUIRE(results.size() == 2);
    CHECK(results[0].score == results[1].score);
    CHECK(results[0].document.id == "A");
    CHECK(results[1].document.id == "B");
}
