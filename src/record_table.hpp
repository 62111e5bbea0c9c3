#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Opaque result produced outside the store. Stored and returned as given.
struct StoredResult {
    std::string metadata;
    std::string payload;

    bool operator==(const StoredResult&) const = default;
};

struct Record {
    std::string key;
    StoredResult result;
};

class RecordTable {
public:
    explicit RecordTable(std::size_t shardCount);

    std::optional<Record> tryGet(const std::string& key) const;
    bool contains(const std::string& key) const;
    void upsert(const std::string& key, const StoredResult& result);
    std::size_t size() const;
    void clear();

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, StoredResult> map;
    };

    Shard& shardFor(const std::string& key) const;

    std::vector<std::unique_ptr<Shard>> shards_;
};
