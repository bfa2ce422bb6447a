// Tests for atomic file writes, retry policy helpers and the worker pool.

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../common/test_helpers_catch2.h"
#include <coderag/core/atomic_file.h>
#include <coderag/core/retry.h>
#include <coderag/core/worker_pool.h>

using coderag::Error;
using coderag::ErrorCode;
using coderag::Result;

TEST_CASE("atomicWrite replaces content and leaves no temp files", "[core][atomic_file][catch2]") {
    coderag::test::TempDir dir("coderag_core_");
    const auto path = dir / "nested/dir/state.json";

    REQUIRE(coderag::atomicWrite(path, "first"));
    REQUIRE(coderag::atomicWrite(path, "second version"));

    auto content = coderag::readFile(path);
    REQUIRE(content);
    CHECK(content.value() == "second version");

    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(path.parent_path())) {
        (void)entry;
        ++entries;
    }
    CHECK(entries == 1);

    auto missing = coderag::readFile(dir / "absent.json");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);
}

TEST_CASE("only network-class errors are transient", "[core][retry][catch2]") {
    CHECK(coderag::isTransient(ErrorCode::NetworkError));
    CHECK(coderag::isTransient(ErrorCode::Timeout));
    CHECK(coderag::isTransient(ErrorCode::RateLimited));
    CHECK(coderag::isTransient(ErrorCode::ServerError));
    CHECK_FALSE(coderag::isTransient(ErrorCode::InvalidArgument));
    CHECK_FALSE(coderag::isTransient(ErrorCode::CorruptedData));
}

TEST_CASE("retryWithBackoff stops at the first permanent failure", "[core][retry][catch2]") {
    coderag::RetryPolicy policy;
    policy.max_attempts = 4;
    policy.initial_delay = std::chrono::milliseconds(1);

    int calls = 0;
    auto permanent = coderag::retryWithBackoff(
        policy,
        [&]() -> Result<int> {
            ++calls;
            return Error{ErrorCode::InvalidArgument, "bad input"};
        },
        "permanent");
    CHECK_FALSE(permanent);
    CHECK(calls == 1);

    calls = 0;
    auto eventually = coderag::retryWithBackoff(
        policy,
        [&]() -> Result<int> {
            if (++calls < 3) {
                return Error{ErrorCode::Timeout, "slow"};
            }
            return 7;
        },
        "eventually");
    REQUIRE(eventually);
    CHECK(eventually.value() == 7);
    CHECK(calls == 3);
}

TEST_CASE("worker pool runs submitted tasks", "[core][worker_pool][catch2]") {
    coderag::WorkerPool pool(3);
    CHECK(pool.threadCount() == 3);

    std::atomic<int> sum{0};
    std::vector<std::future<int>> results;
    for (int i = 1; i <= 10; ++i) {
        results.push_back(pool.submit([i, &sum]() {
            sum += i;
            return i * i;
        }));
    }
    int squares = 0;
    for (auto& f : results) {
        squares += f.get();
    }
    CHECK(squares == 385);
    CHECK(sum.load() == 55);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    CHECK_THROWS_AS(failing.get(), std::runtime_error);

    coderag::WorkerPool defaulted;
    CHECK(defaulted.threadCount() >= 2);
}
