// Tests for session identifiers and repository URL handling.

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

#include <coderag/session/session_id.h>

using namespace coderag::session;

TEST_CASE("normalizeRepoUrl canonicalises GitHub spellings", "[session][id][catch2]") {
    const std::string canonical = "https://github.com/octocat/Hello-World";
    CHECK(normalizeRepoUrl("https://github.com/octocat/Hello-World") == canonical);
    CHECK(normalizeRepoUrl("https://github.com/octocat/Hello-World.git") == canonical);
    CHECK(normalizeRepoUrl("https://github.com/octocat/Hello-World/") == canonical);
    CHECK(normalizeRepoUrl("https://github.com/octocat/Hello-World/tree/main/src") == canonical);
    CHECK(normalizeRepoUrl("git@github.com:octocat/Hello-World.git") == canonical);
    CHECK(normalizeRepoUrl("  https://github.com/octocat/Hello-World  ") == canonical);
}

TEST_CASE("extractRepoInfo returns owner and repository", "[session][id][catch2]") {
    auto [owner, repo] = extractRepoInfo("https://github.com/octocat/Hello-World.git");
    CHECK(owner == "octocat");
    CHECK(repo == "Hello-World");

    auto missing = extractRepoInfo("https://github.com/octocat");
    CHECK(missing.first.empty());
    CHECK(missing.second.empty());
}

TEST_CASE("repoSessionId is stable across URL spellings", "[session][id][catch2]") {
    auto id = repoSessionId("https://github.com/octocat/Hello-World");
    CHECK(id == repoSessionId("git@github.com:octocat/Hello-World.git"));
    CHECK(id == repoSessionId("https://github.com/octocat/Hello-World/tree/dev"));
    CHECK(id != repoSessionId("https://github.com/octocat/Spoon-Knife"));

    const std::string hash = sha256Hex("https://github.com/octocat/Hello-World").substr(0, 8);
    CHECK(id == "repo_" + hash + "_octocat_HelloWorld");
    CHECK(isRepoSessionId(id));
    CHECK(sanitizeSessionId(id).value() == id);
}

TEST_CASE("chatSessionId is random and well formed", "[session][id][catch2]") {
    std::set<std::string> ids;
    for (int i = 0; i < 20; ++i) {
        auto id = chatSessionId();
        CHECK(id.size() == 21);
        CHECK(id.rfind("chat_", 0) == 0);
        CHECK_FALSE(isRepoSessionId(id));
        ids.insert(id);
    }
    CHECK(ids.size() == 20);
}

TEST_CASE("sanitizeSessionId keeps safe characters only", "[session][id][catch2]") {
    CHECK(sanitizeSessionId("repo_ab12-x").value() == "repo_ab12-x");
    CHECK(sanitizeSessionId("../../etc/passwd").value() == "etcpasswd");
    CHECK(sanitizeSessionId("a b\tc").value() == "abc");

    auto empty = sanitizeSessionId("../..");
    REQUIRE_FALSE(empty);
    CHECK(empty.error().code == coderag::ErrorCode::InvalidArgument);
}

TEST_CASE("sha256Hex matches known digests", "[session][id][catch2]") {
    CHECK(sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
