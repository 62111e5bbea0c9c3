#include "lock_manager.hpp"
#include "errors.hpp"
#include <iostream>

static std::optional<Clock::time_point> earliest(std::optional<Clock::time_point> a,
                                                 std::optional<Clock::time_point> b) {
    if (!a) return b;
    if (!b) return a;
    return *a < *b ? a : b;
}

// Empty when the deadline lies beyond what the clock can represent.
static std::optional<Clock::time_point> deadlineAfter(Clock::time_point now, Duration d) {
    if (d > Duration::zero() && d > Clock::time_point::max() - now) return std::nullopt;
    return now + d;
}

LockManager::LockManager(const StoreConfig& cfg, Metrics& metrics)
    : defaultHoldTimeout_(cfg.defaultHoldTimeout), verbose_(cfg.verbose), metrics_(metrics) {
    std::size_t count = cfg.shardCount == 0 ? 1 : cfg.shardCount;
    shards_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) shards_.push_back(std::make_unique<Shard>());
}

LockManager::Shard& LockManager::shardFor(const std::string& key) const {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

// Caller holds shard.mutex.
LockManager::Entry* LockManager::liveEntry(Shard& shard, const std::string& key,
                                           Clock::time_point now) const {
    auto it = shard.map.find(key);
    if (it == shard.map.end()) return nullptr;
    if (!it->second.expired(now)) return &it->second;

    if (verbose_) std::cout << "[lock-expired] key=" << key << " holder=" << it->second.holder << '\n';
    metrics_.incLockExpiredReclaimed();
    shard.map.erase(it);
    return nullptr;
}

bool LockManager::acquire(const std::string& key, const std::string& holder,
                          std::optional<Duration> holdTimeout,
                          std::optional<Duration> acquireTimeout) {
    if (!holdTimeout) holdTimeout = defaultHoldTimeout_;

    Shard& shard = shardFor(key);
    std::unique_lock<std::mutex> guard(shard.mutex);

    std::optional<Clock::time_point> giveUpAt;
    if (acquireTimeout) giveUpAt = deadlineAfter(Clock::now(), *acquireTimeout);

    bool waited = false;
    for (;;) {
        const auto now = Clock::now();
        Entry* entry = liveEntry(shard, key, now);
        if (!entry) {
            Entry fresh{holder, now, std::nullopt, shard.nextGeneration++};
            if (holdTimeout) fresh.deadline = deadlineAfter(now, *holdTimeout);
            shard.map.insert_or_assign(key, std::move(fresh));
            if (waited) metrics_.incLockAcquiredAfterWait();
            else metrics_.incLockAcquired();
            if (verbose_) std::cout << "[lock-acquired] key=" << key << " holder=" << holder << '\n';
            return true;
        }
        // Re-entrant: the original deadline is kept.
        if (entry->holder == holder) {
            metrics_.incLockReentrant();
            return true;
        }
        if (giveUpAt && now >= *giveUpAt) {
            metrics_.incLockAcquireTimeouts();
            if (verbose_) {
                std::cout << "[lock-timeout] key=" << key << " holder=" << holder
                          << " held_by=" << entry->holder << '\n';
            }
            return false;
        }

        waited = true;
        if (auto wakeAt = earliest(giveUpAt, entry->deadline)) {
            shard.released.wait_until(guard, *wakeAt);
        } else {
            shard.released.wait(guard);
        }
    }
}

void LockManager::release(const std::string& key, const std::string& holder) {
    Shard& shard = shardFor(key);
    {
        std::lock_guard<std::mutex> guard(shard.mutex);
        Entry* entry = liveEntry(shard, key, Clock::now());
        if (!entry || entry->holder != holder) {
            metrics_.incLockReleaseErrors();
            throw NotHolderError(key, holder);
        }
        shard.map.erase(key);
        metrics_.incLockReleases();
    }
    if (verbose_) std::cout << "[lock-released] key=" << key << " holder=" << holder << '\n';
    shard.released.notify_all();
}

bool LockManager::isLocked(const std::string& key) const {
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> guard(shard.mutex);
    return liveEntry(shard, key, Clock::now()) != nullptr;
}

bool LockManager::isHolder(const std::string& key, const std::string& holder) const {
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> guard(shard.mutex);
    const Entry* entry = liveEntry(shard, key, Clock::now());
    return entry && entry->holder == holder;
}

bool LockManager::waitForRelease(const std::string& key, std::optional<Duration> timeout) {
    metrics_.incLockWaits();

    Shard& shard = shardFor(key);
    std::unique_lock<std::mutex> guard(shard.mutex);

    const Entry* entry = liveEntry(shard, key, Clock::now());
    if (!entry) return true;
    // A later holder taking the key in between still means this hold ended.
    const std::uint64_t awaited = entry->generation;

    std::optional<Clock::time_point> giveUpAt;
    if (timeout) giveUpAt = deadlineAfter(Clock::now(), *timeout);

    for (;;) {
        const auto now = Clock::now();
        entry = liveEntry(shard, key, now);
        if (!entry || entry->generation != awaited) return true;
        if (giveUpAt && now >= *giveUpAt) {
            metrics_.incLockWaitTimeouts();
            return false;
        }
        if (auto wakeAt = earliest(giveUpAt, entry->deadline)) {
            shard.released.wait_until(guard, *wakeAt);
        } else {
            shard.released.wait(guard);
        }
    }
}

TransactionLock LockManager::scoped(const std::string& key, const std::string& holder,
                                    std::optional<Duration> holdTimeout) {
    acquire(key, holder, holdTimeout);
    return TransactionLock(*this, key, holder);
}

bool LockManager::guardedWrite(const std::string& key, const std::string& holder,
                               const std::function<void()>& mutation) {
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> guard(shard.mutex);
    const Entry* entry = liveEntry(shard, key, Clock::now());
    if (entry && entry->holder != holder) return false;
    mutation();
    return true;
}

std::optional<LockInfo> LockManager::lockInfo(const std::string& key) const {
    Shard& shard = shardFor(key);
    std::lock_guard<std::mutex> guard(shard.mutex);
    const Entry* entry = liveEntry(shard, key, Clock::now());
    if (!entry) return std::nullopt;
    return LockInfo{entry->holder, entry->acquiredAt, entry->deadline};
}

std::size_t LockManager::lockedCount() const {
    const auto now = Clock::now();
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> guard(shard->mutex);
        for (const auto& [key, entry] : shard->map) {
            if (!entry.expired(now)) ++total;
        }
    }
    return total;
}

std::size_t LockManager::reapExpired() {
    const auto now = Clock::now();
    std::size_t reaped = 0;
    for (auto& shard : shards_) {
        std::size_t before = reaped;
        {
            std::lock_guard<std::mutex> guard(shard->mutex);
            for (auto it = shard->map.begin(); it != shard->map.end();) {
                if (it->second.expired(now)) {
                    metrics_.incLockExpiredReclaimed();
                    it = shard->map.erase(it);
                    ++reaped;
                } else {
                    ++it;
                }
            }
        }
        if (reaped != before) shard->released.notify_all();
    }
    return reaped;
}

void LockManager::clear() {
    for (auto& shard : shards_) {
        {
            std::lock_guard<std::mutex> guard(shard->mutex);
            shard->map.clear();
        }
        shard->released.notify_all();
    }
}
