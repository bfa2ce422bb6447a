#pragma once

#include <coderag/core/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace coderag::lock {

/**
 * Lock backend selection
 */
enum class LockBackendType {
    Memory,     // One process
    File,       // Several processes on one machine (flock)
    Distributed // Several machines, keys in a Redis-compatible store
};

const char* lockBackendToString(LockBackendType type);
Result<LockBackendType> lockBackendFromString(const std::string& name);

/**
 * Configuration for repository locks
 */
struct LockConfig {
    LockBackendType backend = LockBackendType::File;
    std::filesystem::path lock_dir = "data/locks";
    std::string redis_url = "redis://localhost:6379/0";
    std::chrono::seconds lock_ttl{300};         // Expiry of a distributed lock
    std::chrono::seconds acquire_timeout{60};   // Default wait in acquire()
    std::chrono::milliseconds poll_interval{100};
};

/**
 * @brief Mutual exclusion keyed by session id.
 *
 * acquire() waits at most timeout and reports LockTimeout otherwise. release() of a key
 * not held is a no-op.
 */
class ILockBackend {
public:
    virtual ~ILockBackend() = default;

    virtual Result<void> acquire(const std::string& key, std::chrono::milliseconds timeout) = 0;

    virtual Result<void> release(const std::string& key) = 0;

    /**
     * @brief Non-blocking probe: true while anyone holds key
     */
    virtual Result<bool> isLocked(const std::string& key) = 0;

    virtual const char* name() const = 0;
};

class RepoLock;

/**
 * @brief Scoped ownership of one key; released on destruction, error paths included.
 */
class RepoLockGuard {
public:
    RepoLockGuard() = default;
    RepoLockGuard(std::shared_ptr<ILockBackend> backend, std::string key);
    ~RepoLockGuard();

    RepoLockGuard(RepoLockGuard&& other) noexcept;
    RepoLockGuard& operator=(RepoLockGuard&& other) noexcept;
    RepoLockGuard(const RepoLockGuard&) = delete;
    RepoLockGuard& operator=(const RepoLockGuard&) = delete;

    // Release early; later calls and the destructor do nothing
    Result<void> release();

    bool ownsLock() const { return backend_ != nullptr; }
    const std::string& key() const { return key_; }

private:
    std::shared_ptr<ILockBackend> backend_;
    std::string key_;
};

/**
 * @brief Repository write lock over a configured backend.
 *
 * Every write sequence on a session (reset, then re-indexing) runs under one acquisition of
 * the session id; searches never take the lock.
 */
class RepoLock {
public:
    RepoLock(std::shared_ptr<ILockBackend> backend, LockConfig config);

    /**
     * @brief Block until key is held; LockTimeout after timeout (default: acquire_timeout)
     */
    Result<RepoLockGuard> acquire(const std::string& key,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Acquire only if free within a short wait (100 ms by default)
     */
    Result<RepoLockGuard> tryAcquire(const std::string& key,
                                     std::chrono::milliseconds timeout = std::chrono::milliseconds(100));

    bool isLocked(const std::string& key);

    const LockConfig& config() const { return config_; }
    const ILockBackend& backend() const { return *backend_; }

private:
    std::shared_ptr<ILockBackend> backend_;
    LockConfig config_;
};

std::shared_ptr<ILockBackend> createMemoryLockBackend();
Result<std::shared_ptr<ILockBackend>> createFileLockBackend(const std::filesystem::path& lock_dir,
                                                            std::chrono::milliseconds poll_interval);

/**
 * @brief Build the backend named by config.backend
 */
Result<std::unique_ptr<RepoLock>> createRepoLock(const LockConfig& config);

} // namespace coderag::lock
