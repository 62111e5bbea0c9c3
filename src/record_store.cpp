#include "record_store.hpp"
#include "errors.hpp"
#include <iostream>
#include <mutex>

namespace {
struct SharedSlot {
    std::mutex mutex;
    std::shared_ptr<RecordStore> store;
};

SharedSlot& sharedSlot() {
    static SharedSlot slot;
    return slot;
}
}

RecordStore::RecordStore(const StoreConfig& cfg)
    : cfg_(cfg), table_(cfg.shardCount), locks_(cfg, metrics_) {}

std::shared_ptr<RecordStore> RecordStore::shared() {
    SharedSlot& slot = sharedSlot();
    std::lock_guard<std::mutex> guard(slot.mutex);
    if (!slot.store) {
        slot.store = std::make_shared<RecordStore>(StoreConfig::fromEnvironment());
        std::cout << "[record-store] created shards=" << slot.store->config().shardCount << '\n';
    }
    return slot.store;
}

void RecordStore::resetShared() {
    SharedSlot& slot = sharedSlot();
    std::lock_guard<std::mutex> guard(slot.mutex);
    slot.store.reset();
}

std::optional<Record> RecordStore::read(const std::string& key) {
    metrics_.incRecordReads();
    auto record = table_.tryGet(key);
    if (record) metrics_.incRecordHits();
    else metrics_.incRecordMisses();
    return record;
}

void RecordStore::write(const std::string& key, const StoredResult& value, const std::string& holder) {
    bool written = locks_.guardedWrite(key, holder, [&] { table_.upsert(key, value); });
    if (!written) {
        metrics_.incWriteConflicts();
        throw HolderConflictError(key, holder);
    }
    metrics_.incRecordWrites();
}

bool RecordStore::exists(const std::string& key) {
    return table_.contains(key);
}

bool RecordStore::acquireLock(const std::string& key, const std::string& holder,
                              std::optional<Duration> holdTimeout,
                              std::optional<Duration> acquireTimeout) {
    return locks_.acquire(key, holder, holdTimeout, acquireTimeout);
}

void RecordStore::releaseLock(const std::string& key, const std::string& holder) {
    locks_.release(key, holder);
}

bool RecordStore::isLocked(const std::string& key) const {
    return locks_.isLocked(key);
}

bool RecordStore::isLockHolder(const std::string& key, const std::string& holder) const {
    return locks_.isHolder(key, holder);
}

bool RecordStore::waitForLock(const std::string& key, std::optional<Duration> timeout) {
    return locks_.waitForRelease(key, timeout);
}

TransactionLock RecordStore::lock(const std::string& key, const std::string& holder,
                                  std::optional<Duration> holdTimeout) {
    return locks_.scoped(key, holder, holdTimeout);
}
