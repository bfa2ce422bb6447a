#pragma once

#include <coderag/core/types.h>
#include <coderag/lock/repo_lock.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace coderag::lock {

/**
 * @brief Minimal key/value operations a distributed lock needs from its coordination store.
 */
class ICoordinationClient {
public:
    virtual ~ICoordinationClient() = default;

    /**
     * @brief Set key to value with an expiry, only if key does not exist
     * @return true when the key was set
     */
    virtual Result<bool> setIfAbsent(const std::string& key, const std::string& value,
                                      std::chrono::milliseconds ttl) = 0;

    /**
     * @brief Delete key only while it still holds value
     * @return true when the key was deleted
     */
    virtual Result<bool> compareAndDelete(const std::string& key, const std::string& value) = 0;

    virtual Result<bool> exists(const std::string& key) = 0;
};

/**
 * Connection parameters parsed from redis://[:password@]host[:port][/db]
 */
struct RedisEndpoint {
    std::string host = "localhost";
    std::uint16_t port = 6379;
    std::string password;
    int database = 0;

    static Result<RedisEndpoint> parse(const std::string& url);
};

/**
 * One RESP reply
 */
struct RespReply {
    enum class Type { SimpleString, Error, Integer, BulkString, Nil, Array };

    Type type = Type::Nil;
    std::string text;
    long long integer = 0;
    std::vector<RespReply> elements;
};

// Encode a command as a RESP array of bulk strings
std::string encodeCommand(const std::vector<std::string>& args);

/**
 * @brief Parse one reply from the front of buffer
 *
 * Returns the number of bytes consumed, 0 when the buffer holds an incomplete reply.
 * Malformed input is InvalidData.
 */
Result<std::size_t> parseReply(std::string_view buffer, RespReply& out);

/**
 * @brief Blocking Redis client over Boost.Asio TCP. Reconnects after a failed command.
 */
class RedisCoordinationClient : public ICoordinationClient {
public:
    explicit RedisCoordinationClient(RedisEndpoint endpoint,
                                     std::chrono::milliseconds io_timeout = std::chrono::seconds(5));
    ~RedisCoordinationClient() override;

    Result<bool> setIfAbsent(const std::string& key, const std::string& value,
                             std::chrono::milliseconds ttl) override;
    Result<bool> compareAndDelete(const std::string& key, const std::string& value) override;
    Result<bool> exists(const std::string& key) override;

    Result<RespReply> command(const std::vector<std::string>& args);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Lock backend keeping "repo_lock:<key>" entries in a coordination store.
 *
 * Each acquisition writes a random token with an expiry so a crashed holder cannot block a
 * repository forever; release only deletes the entry while it still carries our token.
 */
class DistributedLockBackend : public ILockBackend {
public:
    DistributedLockBackend(std::shared_ptr<ICoordinationClient> client,
                           std::chrono::milliseconds lock_ttl,
                           std::chrono::milliseconds poll_interval);

    Result<void> acquire(const std::string& key, std::chrono::milliseconds timeout) override;
    Result<void> release(const std::string& key) override;
    Result<bool> isLocked(const std::string& key) override;
    const char* name() const override { return "distributed"; }

    static std::string storeKey(const std::string& key) { return "repo_lock:" + key; }

private:
    std::shared_ptr<ICoordinationClient> client_;
    std::chrono::milliseconds lock_ttl_;
    std::chrono::milliseconds poll_interval_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::string> tokens_;
};

} // namespace coderag::lock
