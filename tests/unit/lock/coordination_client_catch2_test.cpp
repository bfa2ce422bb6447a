// Tests for the RESP codec and coordination URL parsing.

#include <catch2/catch_test_macros.hpp>

#include <string>

#include <coderag/lock/coordination_client.h>

using coderag::ErrorCode;
using namespace coderag::lock;

TEST_CASE("commands encode as RESP arrays", "[lock][resp][catch2]") {
    CHECK(encodeCommand({"EXISTS", "repo_lock:a"}) ==
          "*2\r\n$6\r\nEXISTS\r\n$11\r\nrepo_lock:a\r\n");
    CHECK(encodeCommand({}) == "*0\r\n");
    CHECK(encodeCommand({""}) == "*1\r\n$0\r\n\r\n");
}

TEST_CASE("scalar replies parse", "[lock][resp][catch2]") {
    RespReply reply;

    auto ok = parseReply("+OK\r\n", reply);
    REQUIRE(ok);
    CHECK(ok.value() == 5);
    CHECK(reply.type == RespReply::Type::SimpleString);
    CHECK(reply.text == "OK");

    REQUIRE(parseReply("-ERR wrong type\r\n", reply));
    CHECK(reply.type == RespReply::Type::Error);
    CHECK(reply.text == "ERR wrong type");

    REQUIRE(parseReply(":42\r\n", reply));
    CHECK(reply.type == RespReply::Type::Integer);
    CHECK(reply.integer == 42);

    auto bulk = parseReply("$5\r\nhello\r\n:1\r\n", reply);
    REQUIRE(bulk);
    CHECK(bulk.value() == 11);
    CHECK(reply.type == RespReply::Type::BulkString);
    CHECK(reply.text == "hello");

    REQUIRE(parseReply("$-1\r\n", reply));
    CHECK(reply.type == RespReply::Type::Nil);
}

TEST_CASE("arrays parse recursively", "[lock][resp][catch2]") {
    RespReply reply;
    const std::string wire = "*3\r\n$3\r\nfoo\r\n:7\r\n*1\r\n+x\r\n";
    auto used = parseReply(wire, reply);
    REQUIRE(used);
    CHECK(used.value() == wire.size());
    REQUIRE(reply.type == RespReply::Type::Array);
    REQUIRE(reply.elements.size() == 3);
    CHECK(reply.elements[0].text == "foo");
    CHECK(reply.elements[1].integer == 7);
    REQUIRE(reply.elements[2].elements.size() == 1);
    CHECK(reply.elements[2].elements[0].text == "x");

    REQUIRE(parseReply("*-1\r\n", reply));
    CHECK(reply.type == RespReply::Type::Nil);
}

TEST_CASE("incomplete replies consume nothing", "[lock][resp][catch2]") {
    RespReply reply;
    CHECK(parseReply("", reply).value() == 0);
    CHECK(parseReply("+OK", reply).value() == 0);
    CHECK(parseReply("$5\r\nhel", reply).value() == 0);
    CHECK(parseReply("*2\r\n:1\r\n", reply).value() == 0);
}

TEST_CASE("malformed replies are invalid data", "[lock][resp][catch2]") {
    RespReply reply;
    auto unknown = parseReply("?what\r\n", reply);
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == ErrorCode::InvalidData);
    CHECK(parseReply(":abc\r\n", reply).error().code == ErrorCode::InvalidData);
    CHECK(parseReply("$x\r\n", reply).error().code == ErrorCode::InvalidData);
    CHECK(parseReply("\r\n", reply).error().code == ErrorCode::InvalidData);
}

TEST_CASE("coordination URLs parse", "[lock][resp][catch2]") {
    auto plain = RedisEndpoint::parse("redis://localhost:6379/0");
    REQUIRE(plain);
    CHECK(plain.value().host == "localhost");
    CHECK(plain.value().port == 6379);
    CHECK(plain.value().database == 0);
    CHECK(plain.value().password.empty());

    auto full = RedisEndpoint::parse("redis://:s3cret@cache.internal:6380/2");
    REQUIRE(full);
    CHECK(full.value().host == "cache.internal");
    CHECK(full.value().port == 6380);
    CHECK(full.value().database == 2);
    CHECK(full.value().password == "s3cret");

    auto host_only = RedisEndpoint::parse("redis://redis-host");
    REQUIRE(host_only);
    CHECK(host_only.value().host == "redis-host");
    CHECK(host_only.value().port == 6379);

    CHECK(RedisEndpoint::parse("http://localhost").error().code == ErrorCode::InvalidArgument);
    CHECK_FALSE(RedisEndpoint::parse("redis://host:notaport"));
    CHECK_FALSE(RedisEndpoint::parse("redis://host:6379/db"));
}
