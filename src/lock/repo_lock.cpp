#include <coderag/lock/coordination_client.h>
#include <coderag/lock/repo_lock.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/file.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>

namespace coderag::lock {

namespace {

using Clock = std::chrono::steady_clock;

// In-process key table; release may come from any thread
class KeyTable {
public:
    bool acquire(const std::string& key, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool free = cv_.wait_for(lock, timeout, [&] { return held_.count(key) == 0; });
        if (!free) {
            return false;
        }
        held_.insert(key);
        return true;
    }

    void release(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_.erase(key);
        }
        cv_.notify_all();
    }

    bool isHeld(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_.count(key) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_set<std::string> held_;
};

class MemoryLockBackend : public ILockBackend {
public:
    Result<void> acquire(const std::string& key, std::chrono::milliseconds timeout) override {
        if (!table_.acquire(key, timeout)) {
            return Error{ErrorCode::LockTimeout, "Repository busy: " + key};
        }
        return {};
    }

    Result<void> release(const std::string& key) override {
        table_.release(key);
        return {};
    }

    Result<bool> isLocked(const std::string& key) override { return table_.isHeld(key); }

    const char* name() const override { return "memory"; }

private:
    KeyTable table_;
};

std::string safeLockName(const std::string& key) {
    std::string safe = key;
    std::replace_if(
        safe.begin(), safe.end(),
        [](char c) { return !(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-'); },
        '_');
    return safe;
}

/**
 * flock() on <lock_dir>/<safe key>.lock, behind an in-process table so threads of one
 * process queue on the table instead of spinning on the file.
 */
class FileLockBackend : public ILockBackend {
public:
    FileLockBackend(std::filesystem::path lock_dir, std::chrono::milliseconds poll_interval)
        : lock_dir_(std::move(lock_dir)), poll_interval_(poll_interval) {}

    ~FileLockBackend() override {
        std::lock_guard<std::mutex> lock(fds_mutex_);
        for (auto& [key, fd] : fds_) {
            flock(fd, LOCK_UN);
            ::close(fd);
        }
    }

    std::filesystem::path lockPath(const std::string& key) const {
        return lock_dir_ / (safeLockName(key) + ".lock");
    }

    Result<void> acquire(const std::string& key, std::chrono::milliseconds timeout) override {
        auto deadline = Clock::now() + timeout;
        if (!table_.acquire(key, timeout)) {
            return Error{ErrorCode::LockTimeout, "Repository busy: " + key};
        }

        auto path = lockPath(key);
        while (true) {
            int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
            if (fd == -1) {
                table_.release(key);
                return Error{ErrorCode::PermissionDenied,
                             "Failed to open lock file " + path.string() + ": " +
                                 std::strerror(errno)};
            }
            if (flock(fd, LOCK_EX | LOCK_NB) == 0) {
                std::lock_guard<std::mutex> lock(fds_mutex_);
                fds_[key] = fd;
                spdlog::debug("File lock acquired: {}", key);
                return {};
            }
            int err = errno;
            ::close(fd);
            if (err != EWOULDBLOCK && err != EINTR) {
                table_.release(key);
                return Error{ErrorCode::InternalError,
                             "flock failed on " + path.string() + ": " + std::strerror(err)};
            }
            if (Clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(poll_interval_);
        }

        table_.release(key);
        spdlog::warn("File lock timed out: {}", key);
        return Error{ErrorCode::LockTimeout, "Repository busy: " + key};
    }

    Result<void> release(const std::string& key) override {
        int fd = -1;
        {
            std::lock_guard<std::mutex> lock(fds_mutex_);
            auto it = fds_.find(key);
            if (it != fds_.end()) {
                fd = it->second;
                fds_.erase(it);
            }
        }
        if (fd != -1) {
            flock(fd, LOCK_UN);
            ::close(fd);
            spdlog::debug("File lock released: {}", key);
            table_.release(key);
        }
        return {};
    }

    Result<bool> isLocked(const std::string& key) override {
        if (table_.isHeld(key)) {
            return true;
        }
        auto path = lockPath(key);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return false;
        }
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1) {
            return false;
        }
        bool locked = false;
        if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
            locked = (errno == EWOULDBLOCK);
        } else {
            flock(fd, LOCK_UN);
        }
        ::close(fd);
        return locked;
    }

    const char* name() const override { return "file"; }

private:
    std::filesystem::path lock_dir_;
    std::chrono::milliseconds poll_interval_;
    KeyTable table_;
    std::mutex fds_mutex_;
    std::unordered_map<std::string, int> fds_;
};

} // namespace

const char* lockBackendToString(LockBackendType type) {
    switch (type) {
        case LockBackendType::Memory:
            return "memory";
        case LockBackendType::File:
            return "file";
        case LockBackendType::Distributed:
            return "redis";
    }
    return "unknown";
}

Result<LockBackendType> lockBackendFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "memory") {
        return LockBackendType::Memory;
    }
    if (lower == "file") {
        return LockBackendType::File;
    }
    if (lower == "redis" || lower == "distributed") {
        return LockBackendType::Distributed;
    }
    return Error{ErrorCode::InvalidArgument, "Unknown lock backend: " + name};
}

// ===== RepoLockGuard =====

RepoLockGuard::RepoLockGuard(std::shared_ptr<ILockBackend> backend, std::string key)
    : backend_(std::move(backend)), key_(std::move(key)) {}

RepoLockGuard::~RepoLockGuard() {
    if (auto r = release(); !r) {
        spdlog::error("Failed to release lock '{}': {}", key_, r.error().message);
    }
}

RepoLockGuard::RepoLockGuard(RepoLockGuard&& other) noexcept
    : backend_(std::move(other.backend_)), key_(std::move(other.key_)) {
    other.backend_.reset();
}

RepoLockGuard& RepoLockGuard::operator=(RepoLockGuard&& other) noexcept {
    if (this != &other) {
        if (auto r = release(); !r) {
            spdlog::error("Failed to release lock '{}': {}", key_, r.error().message);
        }
        backend_ = std::move(other.backend_);
        key_ = std::move(other.key_);
        other.backend_.reset();
    }
    return *this;
}

Result<void> RepoLockGuard::release() {
    if (!backend_) {
        return {};
    }
    auto backend = std::move(backend_);
    backend_.reset();
    return backend->release(key_);
}

// ===== RepoLock =====

RepoLock::RepoLock(std::shared_ptr<ILockBackend> backend, LockConfig config)
    : backend_(std::move(backend)), config_(std::move(config)) {}

Result<RepoLockGuard> RepoLock::acquire(const std::string& key,
                                        std::optional<std::chrono::milliseconds> timeout) {
    auto wait = timeout.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.acquire_timeout));
    auto acquired = backend_->acquire(key, wait);
    if (!acquired) {
        if (acquired.error().code == ErrorCode::LockTimeout) {
            spdlog::warn("Lock '{}' not acquired within {} ms ({})", key, wait.count(),
                         backend_->name());
        }
        return acquired.error();
    }
    spdlog::debug("Lock '{}' acquired ({})", key, backend_->name());
    return RepoLockGuard(backend_, key);
}

Result<RepoLockGuard> RepoLock::tryAcquire(const std::string& key,
                                           std::chrono::milliseconds timeout) {
    auto acquired = backend_->acquire(key, timeout);
    if (!acquired) {
        return acquired.error();
    }
    return RepoLockGuard(backend_, key);
}

bool RepoLock::isLocked(const std::string& key) {
    auto locked = backend_->isLocked(key);
    if (!locked) {
        spdlog::warn("Lock probe for '{}' failed: {}", key, locked.error().message);
        return false;
    }
    return locked.value();
}

// ===== Factories =====

std::shared_ptr<ILockBackend> createMemoryLockBackend() {
    return std::make_shared<MemoryLockBackend>();
}

Result<std::shared_ptr<ILockBackend>> createFileLockBackend(const std::filesystem::path& lock_dir,
                                                            std::chrono::milliseconds poll_interval) {
    std::error_code ec;
    std::filesystem::create_directories(lock_dir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot create lock directory " + lock_dir.string() + ": " + ec.message()};
    }
    std::shared_ptr<ILockBackend> backend =
        std::make_shared<FileLockBackend>(lock_dir, poll_interval);
    return backend;
}

Result<std::unique_ptr<RepoLock>> createRepoLock(const LockConfig& config) {
    std::shared_ptr<ILockBackend> backend;
    switch (config.backend) {
        case LockBackendType::Memory:
            backend = createMemoryLockBackend();
            spdlog::info("Repository locks: in-process");
            break;
        case LockBackendType::File: {
            auto file = createFileLockBackend(config.lock_dir, config.poll_interval);
            if (!file) {
                return file.error();
            }
            backend = std::move(file).value();
            spdlog::info("Repository locks: files in {}", config.lock_dir.string());
            break;
        }
        case LockBackendType::Distributed: {
            auto endpoint = RedisEndpoint::parse(config.redis_url);
            if (!endpoint) {
                return endpoint.error();
            }
            auto client = std::make_shared<RedisCoordinationClient>(endpoint.value());
            backend = std::make_shared<DistributedLockBackend>(
                client, std::chrono::duration_cast<std::chrono::milliseconds>(config.lock_ttl),
                config.poll_interval);
            spdlog::info("Repository locks: distributed at {}:{}", endpoint.value().host,
                         endpoint.value().port);
            break;
        }
    }
    return std::make_unique<RepoLock>(backend, config);
}

} // namespace coderag::lock
