#pragma once
#include <memory>
#include <optional>
#include <string>
#include "config.hpp"
#include "lock_manager.hpp"
#include "metrics.hpp"
#include "record_table.hpp"
#include "transaction_lock.hpp"

// Cache of transaction results guarded by per-key advisory locks.
//
// Callers that produce a result take the key's lock, read to see whether a
// previous attempt already stored it, compute and write otherwise, then
// release. Callers that only consume a result use read/exists without locking.
class RecordStore {
public:
    explicit RecordStore(const StoreConfig& cfg = StoreConfig{});

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    // The process-wide instance, built from the environment on first use.
    static std::shared_ptr<RecordStore> shared();
    // Test hook: the next shared() call builds a fresh instance.
    static void resetShared();

    std::optional<Record> read(const std::string& key);
    // Throws HolderConflictError if another holder has the key locked.
    void write(const std::string& key, const StoredResult& value,
               const std::string& holder = kDefaultHolder);
    bool exists(const std::string& key);

    bool acquireLock(const std::string& key, const std::string& holder = kDefaultHolder,
                     std::optional<Duration> holdTimeout = std::nullopt,
                     std::optional<Duration> acquireTimeout = std::nullopt);
    // Throws NotHolderError if holder does not own a live lock on key.
    void releaseLock(const std::string& key, const std::string& holder = kDefaultHolder);
    bool isLocked(const std::string& key) const;
    bool isLockHolder(const std::string& key, const std::string& holder = kDefaultHolder) const;
    bool waitForLock(const std::string& key, std::optional<Duration> timeout = std::nullopt);
    TransactionLock lock(const std::string& key, const std::string& holder = kDefaultHolder,
                         std::optional<Duration> holdTimeout = std::nullopt);

    std::optional<LockInfo> lockInfo(const std::string& key) const { return locks_.lockInfo(key); }
    std::size_t recordCount() const { return table_.size(); }
    std::size_t lockedCount() const { return locks_.lockedCount(); }

    const StoreConfig& config() const { return cfg_; }
    Metrics& metrics() { return metrics_; }

private:
    StoreConfig cfg_;
    Metrics metrics_;
    RecordTable table_;
    LockManager locks_;
};
