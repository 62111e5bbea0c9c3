#include "record_table.hpp"
#include <functional>
#include <mutex>

RecordTable::RecordTable(std::size_t shardCount) {
    if (shardCount == 0) shardCount = 1;
    shards_.reserve(shardCount);
    for (std::size_t i = 0; i < shardCount; ++i) shards_.push_back(std::make_unique<Shard>());
}

RecordTable::Shard& RecordTable::shardFor(const std::string& key) const {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

std::optional<Record> RecordTable::tryGet(const std::string& key) const {
    Shard& shard = shardFor(key);
    std::shared_lock<std::shared_mutex> guard(shard.mutex);
    auto it = shard.map.find(key);
    if (it == shard.map.end()) return std::nullopt;
    return Record{key, it->second};
}

bool RecordTable::contains(const std::string& key) const {
    Shard& shard = shardFor(key);
    std::shared_lock<std::shared_mutex> guard(shard.mutex);
    return shard.map.find(key) != shard.map.end();
}

void RecordTable::upsert(const std::string& key, const StoredResult& result) {
    Shard& shard = shardFor(key);
    std::unique_lock<std::shared_mutex> guard(shard.mutex);
    shard.map[key] = result;
}

std::size_t RecordTable::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> guard(shard->mutex);
        total += shard->map.size();
    }
    return total;
}

void RecordTable::clear() {
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> guard(shard->mutex);
        shard->map.clear();
    }
}
