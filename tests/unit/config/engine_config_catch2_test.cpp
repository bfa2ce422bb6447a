// Tests for TOML-style config parsing and environment overrides.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../common/test_helpers_catch2.h"
#include <coderag/config/config_helpers.h>
#include <coderag/config/engine_config.h>

using Catch::Approx;
using coderag::ErrorCode;
using coderag::test::ScopedEnvVar;
using coderag::test::TempDir;
using namespace coderag::config;

TEST_CASE("config values parse sections, comments and quotes", "[config][catch2]") {
    TempDir dir("coderag_config_");
    auto path = coderag::test::write_file(dir / "config.toml", R"(# engine settings
top = level
search.default_top_k = 7

[storage]
backend = "memory"   # quoted value
context_dir = '/tmp/ctx # not a comment'
dimension = 3 # trailing comment

[ lock ]
backend=file
)");

    auto values = load_config_values(path);
    CHECK(values[""]["top"] == "level");
    CHECK(values["search"]["default_top_k"] == "7");
    CHECK(values["storage"]["backend"] == "memory");
    CHECK(values["storage"]["context_dir"] == "/tmp/ctx # not a comment");
    CHECK(values["storage"]["dimension"] == "3");
    CHECK(values["lock"]["backend"] == "file");

    CHECK(parse_config_value(path, "storage", "backend") == "memory");
    CHECK(parse_config_value(path, "storage", "missing").empty());
    CHECK(parse_config_value(path, "nope", "backend").empty());
    CHECK(load_config_values(dir / "absent.toml").empty());
}

TEST_CASE("config path and data dir follow the environment", "[config][catch2]") {
    ScopedEnvVar config_env("CODERAG_CONFIG", std::nullopt);
    ScopedEnvVar xdg_config("XDG_CONFIG_HOME", std::string("/xdg/config"));
    ScopedEnvVar xdg_data("XDG_DATA_HOME", std::string("/xdg/data"));

    CHECK(get_config_path("/explicit.toml") == std::filesystem::path("/explicit.toml"));
    CHECK(get_config_path() == std::filesystem::path("/xdg/config/coderag/config.toml"));
    CHECK(get_data_dir() == std::filesystem::path("/xdg/data/coderag"));

    ScopedEnvVar config_override("CODERAG_CONFIG", std::string("/etc/coderag.toml"));
    CHECK(get_config_path() == std::filesystem::path("/etc/coderag.toml"));
}

TEST_CASE("defaults hang off the data directory", "[config][catch2]") {
    auto config = EngineConfig::defaults("/var/coderag");
    CHECK(config.storage.data_dir == std::filesystem::path("/var/coderag"));
    CHECK(config.storage.context_dir == std::filesystem::path("/var/coderag/context"));
    CHECK(config.lock.lock_dir == std::filesystem::path("/var/coderag/locks"));
    CHECK(config.storage.dimension == config.embedding.dimension);
    CHECK(config.session.max_sessions == 100);
    CHECK(config.search.fusion.k == Approx(60.0));
    CHECK(config.search.fusion.vector_weight == Approx(1.0));
    CHECK(config.search.fusion.lexical_weight == Approx(0.3));
}

TEST_CASE("settings apply by section and key", "[config][catch2]") {
    auto config = EngineConfig::defaults("/data");

    REQUIRE(applySetting(config, "search", "lexical_weight", "0.5"));
    CHECK(config.search.fusion.lexical_weight == Approx(0.5));
    REQUIRE(applySetting(config, "search", "non_ascii_is_word", "false"));
    CHECK_FALSE(config.search.tokenizer.non_ascii_is_word);
    REQUIRE(applySetting(config, "embedding", "dimension", "384"));
    CHECK(config.embedding.dimension == 384);
    CHECK(config.storage.dimension == 384);
    REQUIRE(applySetting(config, "embedding", "retry_initial_ms", "250"));
    CHECK(config.embedding.retry.initial_delay == std::chrono::milliseconds(250));
    REQUIRE(applySetting(config, "lock", "acquire_timeout_seconds", "5"));
    CHECK(config.lock.acquire_timeout == std::chrono::seconds(5));
    REQUIRE(applySetting(config, "chunking", "max_chunk_size", "1200"));
    CHECK(config.chunking.max_chunk_size == 1200);

    // Unknown keys are ignored
    CHECK(applySetting(config, "search", "colour", "blue"));
    CHECK(applySetting(config, "unknown", "key", "value"));

    auto bad_number = applySetting(config, "session", "max_sessions", "-3");
    REQUIRE_FALSE(bad_number);
    CHECK(bad_number.error().code == ErrorCode::InvalidArgument);
    CHECK(bad_number.error().message.find("session.max_sessions") != std::string::npos);

    CHECK(applySetting(config, "search", "rrf_k", "sixty").error().code ==
          ErrorCode::InvalidArgument);
    CHECK(applySetting(config, "search", "non_ascii_is_word", "maybe").error().code ==
          ErrorCode::InvalidArgument);
    CHECK(applySetting(config, "lock", "backend", "zookeeper").error().code ==
          ErrorCode::InvalidArgument);
}

TEST_CASE("loadEngineConfig layers file then environment", "[config][catch2]") {
    TempDir dir("coderag_config_");
    ScopedEnvVar data_env("CODERAG_DATA_DIR", std::nullopt);
    ScopedEnvVar sessions_env("CODERAG_MAX_SESSIONS", std::nullopt);
    ScopedEnvVar lock_env("CODERAG_LOCK_BACKEND", std::nullopt);

    auto path = coderag::test::write_file(dir / "config.toml", "[storage]\n"
                                                               "data_dir = \"" +
                                                                   (dir / "data").string() +
                                                                   "\"\n"
                                                                   "backend = memory\n"
                                                                   "[session]\n"
                                                                   "max_sessions = 12\n");

    SECTION("file values") {
        auto config = loadEngineConfig(path);
        REQUIRE(config);
        CHECK(config.value().storage.data_dir == dir / "data");
        CHECK(config.value().storage.context_dir == dir / "data" / "context");
        CHECK(config.value().storage.backend == coderag::storage::DocumentStoreType::InMemory);
        CHECK(config.value().session.max_sessions == 12);
    }

    SECTION("environment wins") {
        ScopedEnvVar data_dir("CODERAG_DATA_DIR", (dir / "env").string());
        ScopedEnvVar sessions("CODERAG_MAX_SESSIONS", std::string("3"));
        ScopedEnvVar lock_backend("CODERAG_LOCK_BACKEND", std::string("memory"));
        auto config = loadEngineConfig(path);
        REQUIRE(config);
        CHECK(config.value().storage.data_dir == dir / "env");
        CHECK(config.value().lock.lock_dir == dir / "env" / "locks");
        CHECK(config.value().session.max_sessions == 3);
        CHECK(config.value().lock.backend == coderag::lock::LockBackendType::Memory);
    }

    SECTION("bad environment value names the variable") {
        ScopedEnvVar sessions("CODERAG_MAX_SESSIONS", std::string("many"));
        auto config = loadEngineConfig(path);
        REQUIRE_FALSE(config);
        CHECK(config.error().code == ErrorCode::InvalidArgument);
        CHECK(config.error().message.find("CODERAG_MAX_SESSIONS") != std::string::npos);
    }

    SECTION("bad file value fails the load") {
        coderag::test::write_file(path, "[search]\ndefault_top_k = lots\n");
        auto config = loadEngineConfig(path);
        REQUIRE_FALSE(config);
        CHECK(config.error().message.find("search.default_top_k") != std::string::npos);
    }
}
