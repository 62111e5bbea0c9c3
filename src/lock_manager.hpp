#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "metrics.hpp"
#include "transaction_lock.hpp"

// Holder substituted when the caller does not name one. It is a fixed value so
// that unlabeled acquire/write/release calls compose as the same owner.
inline const std::string kDefaultHolder = "__default_holder__";

struct LockInfo {
    std::string holder;
    Clock::time_point acquiredAt;
    std::optional<Clock::time_point> holdDeadline; // empty: held until released
};

// Advisory per-key locks with optional self-expiry.
//
// Expiry is lazy: an entry whose hold deadline has passed is dropped the next
// time its key is consulted, and counts as unlocked everywhere. Blocked
// acquirers and waiters sleep on their shard's condition variable until a
// release, their own timeout or the holder's deadline, whichever comes first.
class LockManager {
public:
    LockManager(const StoreConfig& cfg, Metrics& metrics);

    bool acquire(const std::string& key, const std::string& holder = kDefaultHolder,
                 std::optional<Duration> holdTimeout = std::nullopt,
                 std::optional<Duration> acquireTimeout = std::nullopt);
    void release(const std::string& key, const std::string& holder = kDefaultHolder);
    bool isLocked(const std::string& key) const;
    bool isHolder(const std::string& key, const std::string& holder) const;
    bool waitForRelease(const std::string& key, std::optional<Duration> timeout = std::nullopt);
    TransactionLock scoped(const std::string& key, const std::string& holder = kDefaultHolder,
                           std::optional<Duration> holdTimeout = std::nullopt);

    // Runs mutation with the key's shard locked, unless another holder owns a
    // live lock on the key. Returns whether mutation ran.
    bool guardedWrite(const std::string& key, const std::string& holder,
                      const std::function<void()>& mutation);

    std::optional<LockInfo> lockInfo(const std::string& key) const;
    std::size_t lockedCount() const;
    std::size_t reapExpired();
    void clear();

private:
    struct Entry {
        std::string holder;
        Clock::time_point acquiredAt;
        std::optional<Clock::time_point> deadline;
        std::uint64_t generation = 0;

        bool expired(Clock::time_point now) const { return deadline && now > *deadline; }
    };

    struct Shard {
        std::mutex mutex;
        std::condition_variable released;
        std::unordered_map<std::string, Entry> map;
        std::uint64_t nextGeneration = 0;
    };

    Shard& shardFor(const std::string& key) const;
    Entry* liveEntry(Shard& shard, const std::string& key, Clock::time_point now) const;

    std::vector<std::unique_ptr<Shard>> shards_;
    std::optional<Duration> defaultHoldTimeout_;
    bool verbose_;
    Metrics& metrics_;
};
