#include <coderag/lock/coordination_client.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>

namespace coderag::lock {

namespace {

using Clock = std::chrono::steady_clock;

// Deletes the key only while it still holds our token
constexpr const char* kCompareAndDeleteScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then return redis.call('del', KEYS[1]) "
    "else return 0 end";

// 128-bit lock ownership token, hex encoded
Result<std::string> randomToken() {
    std::array<unsigned char, 16> buf{};
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return Error{ErrorCode::InternalError, "OpenSSL RNG failed to produce a lock token"};
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string token;
    token.reserve(buf.size() * 2);
    for (unsigned char byte : buf) {
        token.push_back(kHex[(byte >> 4) & 0xF]);
        token.push_back(kHex[byte & 0xF]);
    }
    return token;
}

template <typename Int> bool parseInt(std::string_view text, Int& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

// ===== RESP encoding =====

Result<RedisEndpoint> RedisEndpoint::parse(const std::string& url) {
    constexpr std::string_view kScheme = "redis://";
    std::string_view rest = url;
    if (rest.substr(0, kScheme.size()) != kScheme) {
        return Error{ErrorCode::InvalidArgument, "Unsupported coordination URL: " + url};
    }
    rest.remove_prefix(kScheme.size());

    RedisEndpoint endpoint;
    if (auto at = rest.rfind('@'); at != std::string_view::npos) {
        auto credentials = rest.substr(0, at);
        auto colon = credentials.find(':');
        endpoint.password = std::string(colon == std::string_view::npos
                                            ? credentials
                                            : credentials.substr(colon + 1));
        rest.remove_prefix(at + 1);
    }
    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        auto db = rest.substr(slash + 1);
        if (!db.empty() && !parseInt(db, endpoint.database)) {
            return Error{ErrorCode::InvalidArgument, "Invalid database in " + url};
        }
        rest = rest.substr(0, slash);
    }
    if (auto colon = rest.rfind(':'); colon != std::string_view::npos) {
        if (!parseInt(rest.substr(colon + 1), endpoint.port)) {
            return Error{ErrorCode::InvalidArgument, "Invalid port in " + url};
        }
        rest = rest.substr(0, colon);
    }
    if (!rest.empty()) {
        endpoint.host = std::string(rest);
    }
    return endpoint;
}

std::string encodeCommand(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

Result<std::size_t> parseReply(std::string_view buffer, RespReply& out) {
    auto eol = buffer.find("\r\n");
    if (eol == std::string_view::npos) {
        return std::size_t{0};
    }
    if (eol == 0) {
        return Error{ErrorCode::InvalidData, "Empty RESP line"};
    }
    const char marker = buffer[0];
    std::string_view line = buffer.substr(1, eol - 1);
    std::size_t consumed = eol + 2;

    out = RespReply{};
    switch (marker) {
        case '+':
            out.type = RespReply::Type::SimpleString;
            out.text = std::string(line);
            return consumed;
        case '-':
            out.type = RespReply::Type::Error;
            out.text = std::string(line);
            return consumed;
        case ':':
            out.type = RespReply::Type::Integer;
            if (!parseInt(line, out.integer)) {
                return Error{ErrorCode::InvalidData, "Bad RESP integer"};
            }
            return consumed;
        case '$': {
            long long length = 0;
            if (!parseInt(line, length)) {
                return Error{ErrorCode::InvalidData, "Bad RESP bulk length"};
            }
            if (length < 0) {
                out.type = RespReply::Type::Nil;
                return consumed;
            }
            auto needed = consumed + static_cast<std::size_t>(length) + 2;
            if (buffer.size() < needed) {
                return std::size_t{0};
            }
            out.type = RespReply::Type::BulkString;
            out.text = std::string(buffer.substr(consumed, static_cast<std::size_t>(length)));
            return needed;
        }
        case '*': {
            long long count = 0;
            if (!parseInt(line, count)) {
                return Error{ErrorCode::InvalidData, "Bad RESP array length"};
            }
            if (count < 0) {
                out.type = RespReply::Type::Nil;
                return consumed;
            }
            out.type = RespReply::Type::Array;
            for (long long i = 0; i < count; ++i) {
                RespReply element;
                auto used = parseReply(buffer.substr(consumed), element);
                if (!used) {
                    return used.error();
                }
                if (used.value() == 0) {
                    return std::size_t{0};
                }
                consumed += used.value();
                out.elements.push_back(std::move(element));
            }
            return consumed;
        }
        default:
            return Error{ErrorCode::InvalidData, std::string("Unknown RESP marker '") + marker + "'"};
    }
}

// ===== RedisCoordinationClient =====

class RedisCoordinationClient::Impl {
public:
    Impl(RedisEndpoint endpoint, std::chrono::milliseconds io_timeout)
        : endpoint_(std::move(endpoint)), io_timeout_(io_timeout), socket_(io_) {}

    Result<RespReply> command(const std::vector<std::string>& args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!socket_.is_open()) {
            if (auto r = connect(); !r) {
                return r.error();
            }
        }
        auto reply = roundTrip(args);
        if (!reply) {
            disconnect();
        }
        return reply;
    }

private:
    Result<void> connect() {
        using boost::asio::ip::tcp;
        boost::system::error_code ec;
        tcp::resolver resolver(io_);
        auto endpoints = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port), ec);
        if (ec) {
            return Error{ErrorCode::NetworkError,
                         "Cannot resolve " + endpoint_.host + ": " + ec.message()};
        }
        boost::asio::connect(socket_, endpoints, ec);
        if (ec) {
            return Error{ErrorCode::NetworkError, "Cannot connect to " + endpoint_.host + ":" +
                                                      std::to_string(endpoint_.port) + ": " +
                                                      ec.message()};
        }
        applyTimeouts();
        buffer_.clear();

        if (!endpoint_.password.empty()) {
            auto auth = roundTrip({"AUTH", endpoint_.password});
            if (!auth) {
                disconnect();
                return auth.error();
            }
        }
        if (endpoint_.database != 0) {
            auto select = roundTrip({"SELECT", std::to_string(endpoint_.database)});
            if (!select) {
                disconnect();
                return select.error();
            }
        }
        spdlog::debug("Connected to coordination store {}:{}", endpoint_.host, endpoint_.port);
        return {};
    }

    void applyTimeouts() {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(io_timeout_.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((io_timeout_.count() % 1000) * 1000);
        auto fd = socket_.native_handle();
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    void disconnect() {
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        buffer_.clear();
    }

    Result<RespReply> roundTrip(const std::vector<std::string>& args) {
        boost::system::error_code ec;
        auto payload = encodeCommand(args);
        boost::asio::write(socket_, boost::asio::buffer(payload), ec);
        if (ec) {
            return Error{ErrorCode::NetworkError, "Write failed: " + ec.message()};
        }

        std::array<char, 4096> chunk{};
        while (true) {
            RespReply reply;
            auto used = parseReply(buffer_, reply);
            if (!used) {
                return used.error();
            }
            if (used.value() > 0) {
                buffer_.erase(0, used.value());
                if (reply.type == RespReply::Type::Error) {
                    return Error{ErrorCode::ServerError, reply.text};
                }
                return reply;
            }
            auto n = socket_.read_some(boost::asio::buffer(chunk), ec);
            if (ec) {
                auto code = (ec == boost::asio::error::would_block ||
                             ec == boost::asio::error::try_again || ec == boost::asio::error::timed_out)
                                ? ErrorCode::Timeout
                                : ErrorCode::NetworkError;
                return Error{code, "Read failed: " + ec.message()};
            }
            buffer_.append(chunk.data(), n);
        }
    }

    RedisEndpoint endpoint_;
    std::chrono::milliseconds io_timeout_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::socket socket_;
    std::string buffer_;
    std::mutex mutex_;
};

RedisCoordinationClient::RedisCoordinationClient(RedisEndpoint endpoint,
                                                 std::chrono::milliseconds io_timeout)
    : pImpl(std::make_unique<Impl>(std::move(endpoint), io_timeout)) {}

RedisCoordinationClient::~RedisCoordinationClient() = default;

Result<RespReply> RedisCoordinationClient::command(const std::vector<std::string>& args) {
    return pImpl->command(args);
}

Result<bool> RedisCoordinationClient::setIfAbsent(const std::string& key, const std::string& value,
                                                  std::chrono::milliseconds ttl) {
    auto reply = command({"SET", key, value, "NX", "PX", std::to_string(ttl.count())});
    if (!reply) {
        return reply.error();
    }
    return reply.value().type == RespReply::Type::SimpleString;
}

Result<bool> RedisCoordinationClient::compareAndDelete(const std::string& key,
                                                       const std::string& value) {
    auto reply = command({"EVAL", kCompareAndDeleteScript, "1", key, value});
    if (!reply) {
        return reply.error();
    }
    return reply.value().type == RespReply::Type::Integer && reply.value().integer > 0;
}

Result<bool> RedisCoordinationClient::exists(const std::string& key) {
    auto reply = command({"EXISTS", key});
    if (!reply) {
        return reply.error();
    }
    return reply.value().type == RespReply::Type::Integer && reply.value().integer > 0;
}

// ===== DistributedLockBackend =====

DistributedLockBackend::DistributedLockBackend(std::shared_ptr<ICoordinationClient> client,
                                               std::chrono::milliseconds lock_ttl,
                                               std::chrono::milliseconds poll_interval)
    : client_(std::move(client)), lock_ttl_(lock_ttl), poll_interval_(poll_interval) {}

Result<void> DistributedLockBackend::acquire(const std::string& key,
                                             std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    auto generated = randomToken();
    if (!generated) {
        return generated.error();
    }
    const std::string token = std::move(generated).value();
    auto store_key = storeKey(key);
    while (true) {
        auto set = client_->setIfAbsent(store_key, token, lock_ttl_);
        if (!set) {
            return set.error();
        }
        if (set.value()) {
            std::lock_guard<std::mutex> lock(mutex_);
            tokens_[key] = token;
            spdlog::debug("Distributed lock acquired: {}", key);
            return {};
        }
        if (Clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(poll_interval_);
    }
    spdlog::warn("Distributed lock timed out: {}", key);
    return Error{ErrorCode::LockTimeout, "Repository busy: " + key};
}

Result<void> DistributedLockBackend::release(const std::string& key) {
    std::string token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tokens_.find(key);
        if (it == tokens_.end()) {
            return {};
        }
        token = std::move(it->second);
        tokens_.erase(it);
    }
    auto deleted = client_->compareAndDelete(storeKey(key), token);
    if (!deleted) {
        return deleted.error();
    }
    if (!deleted.value()) {
        spdlog::warn("Distributed lock '{}' expired before release", key);
    }
    return {};
}

Result<bool> DistributedLockBackend::isLocked(const std::string& key) {
    return client_->exists(storeKey(key));
}

} // namespace coderag::lock
