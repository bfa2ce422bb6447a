#pragma once

#include <coderag/core/types.h>
#include <coderag/session/session_store.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coderag::session {

struct SessionInfo {
    std::string session_id;
    double age_hours = 0.0;    // Since creation, 2 decimals
    double idle_minutes = 0.0; // Since last access, 2 decimals
};

struct SessionStats {
    std::size_t total_sessions = 0;
    std::size_t max_sessions = 0;
    std::vector<SessionInfo> sessions; // Most idle first

    nlohmann::json toJson() const;
};

/**
 * @brief Bounded LRU cache of open session stores.
 *
 * Going over capacity schedules eviction of the least recently used entries on a thread of
 * its own. Eviction must not occupy the worker pool, since closing a store waits for a writer
 * that may be waiting on pool work. Eviction only releases the in-process handle; persisted
 * collections, caches and reports stay on disk.
 */
class SessionManager {
public:
    explicit SessionManager(SessionDependencies deps, std::size_t max_sessions = 100);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Existing store (marked most recently used) or a new one
     */
    Result<std::shared_ptr<SessionStore>> getOrCreate(const std::string& session_id);

    bool contains(const std::string& session_id) const;

    void closeSession(const std::string& session_id);

    void closeAll();

    // Block until scheduled evictions have finished
    void waitForEvictions();

    // Evictions scheduled and not yet collected
    std::size_t pendingEvictions() const;

    SessionStats stats() const;

    std::size_t size() const;
    std::size_t capacity() const { return max_sessions_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string session_id;
        std::shared_ptr<SessionStore> store;
        Clock::time_point created_at;
        Clock::time_point last_access;
    };
    using EntryList = std::list<Entry>; // Front is most recently used

    void evictLeastRecentlyUsed();

    SessionDependencies deps_;
    std::size_t max_sessions_;

    mutable std::mutex mutex_;
    EntryList lru_;
    std::unordered_map<std::string, EntryList::iterator> index_;

    mutable std::mutex eviction_mutex_;
    std::vector<std::future<void>> evictions_; // Finished ones are dropped on the next schedule
};

} // namespace coderag::session
