#include <coderag/core/worker_pool.h>
#include <coderag/session/session_id.h>
#include <coderag/session/session_manager.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>

namespace coderag::session {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

nlohmann::json SessionStats::toJson() const {
    nlohmann::json j;
    j["total_sessions"] = total_sessions;
    j["max_sessions"] = max_sessions;
    j["sessions"] = nlohmann::json::array();
    for (const auto& info : sessions) {
        j["sessions"].push_back(nlohmann::json{{"session_id", info.session_id},
                                               {"age_hours", info.age_hours},
                                               {"idle_minutes", info.idle_minutes}});
    }
    return j;
}

SessionManager::SessionManager(SessionDependencies deps, std::size_t max_sessions)
    : deps_(std::move(deps)), max_sessions_(std::max<std::size_t>(max_sessions, 1)) {
    if (!deps_.pool) {
        deps_.pool = std::make_shared<WorkerPool>();
    }
}

SessionManager::~SessionManager() {
    waitForEvictions();
    closeAll();
}

Result<std::shared_ptr<SessionStore>> SessionManager::getOrCreate(const std::string& session_id) {
    auto clean = sanitizeSessionId(session_id);
    if (!clean) {
        return clean.error();
    }
    const auto& key = clean.value();

    std::size_t total = 0;
    std::shared_ptr<SessionStore> store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = index_.find(key); it != index_.end()) {
            it->second->last_access = Clock::now();
            lru_.splice(lru_.begin(), lru_, it->second);
            return it->second->store;
        }

        auto created = SessionStore::create(key, deps_);
        if (!created) {
            return created.error();
        }
        store = std::move(created).value();
        auto now = Clock::now();
        lru_.push_front(Entry{key, store, now, now});
        index_[key] = lru_.begin();
        total = lru_.size();
    }

    spdlog::info("Session created: {} (total: {})", key, total);
    if (total > max_sessions_) {
        std::lock_guard<std::mutex> lock(eviction_mutex_);
        evictions_.erase(std::remove_if(evictions_.begin(), evictions_.end(),
                                        [](std::future<void>& f) {
                                            if (f.wait_for(std::chrono::seconds(0)) !=
                                                std::future_status::ready) {
                                                return false;
                                            }
                                            f.get();
                                            return true;
                                        }),
                         evictions_.end());
        evictions_.push_back(
            std::async(std::launch::async, [this]() { evictLeastRecentlyUsed(); }));
    }
    return store;
}

void SessionManager::evictLeastRecentlyUsed() {
    std::vector<Entry> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (lru_.size() > max_sessions_) {
            evicted.push_back(std::move(lru_.back()));
            index_.erase(evicted.back().session_id);
            lru_.pop_back();
        }
    }
    for (auto& entry : evicted) {
        entry.store->close();
        spdlog::info("LRU eviction: {}", entry.session_id);
    }
}

bool SessionManager::contains(const std::string& session_id) const {
    auto clean = sanitizeSessionId(session_id);
    if (!clean) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(clean.value()) > 0;
}

void SessionManager::closeSession(const std::string& session_id) {
    auto clean = sanitizeSessionId(session_id);
    if (!clean) {
        return;
    }
    std::shared_ptr<SessionStore> store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(clean.value());
        if (it == index_.end()) {
            return;
        }
        store = std::move(it->second->store);
        lru_.erase(it->second);
        index_.erase(it);
    }
    store->close();
    spdlog::info("Session closed: {}", clean.value());
}

void SessionManager::closeAll() {
    EntryList entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(lru_);
        index_.clear();
    }
    for (auto& entry : entries) {
        entry.store->close();
    }
    if (!entries.empty()) {
        spdlog::info("All sessions closed ({})", entries.size());
    }
}

void SessionManager::waitForEvictions() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(eviction_mutex_);
        pending.swap(evictions_);
    }
    for (auto& f : pending) {
        f.get();
    }
}

std::size_t SessionManager::pendingEvictions() const {
    std::lock_guard<std::mutex> lock(eviction_mutex_);
    return evictions_.size();
}

SessionStats SessionManager::stats() const {
    SessionStats out;
    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.total_sessions = lru_.size();
        out.max_sessions = max_sessions_;
        for (const auto& entry : lru_) {
            std::chrono::duration<double> age = now - entry.created_at;
            std::chrono::duration<double> idle = now - entry.last_access;
            out.sessions.push_back(
                {entry.session_id, round2(age.count() / 3600.0), round2(idle.count() / 60.0)});
        }
    }
    std::stable_sort(out.sessions.begin(), out.sessions.end(),
                     [](const SessionInfo& a, const SessionInfo& b) {
                         return a.idle_minutes > b.idle_minutes;
                     });
    return out;
}

std::size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

} // namespace coderag::session
