#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "record_table.hpp"

namespace {

TEST(RecordTableTest, MissingKeyIsAbsent) {
    RecordTable table(4);
    EXPECT_FALSE(table.tryGet("missing").has_value());
    EXPECT_FALSE(table.contains("missing"));
    EXPECT_EQ(table.size(), 0u);
}

TEST(RecordTableTest, KeysAreNotNormalized) {
    RecordTable table(4);
    table.upsert("Key", StoredResult{"m", "upper"});
    EXPECT_FALSE(table.contains("key"));
    EXPECT_FALSE(table.contains("Key "));
    EXPECT_EQ(table.tryGet("Key")->result.payload, "upper");
}

TEST(RecordTableTest, UpsertReplacesWholeResult) {
    RecordTable table(1);
    table.upsert("k", StoredResult{"first-meta", "first"});
    table.upsert("k", StoredResult{"", "second"});
    auto record = table.tryGet("k");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->result, (StoredResult{"", "second"}));
    EXPECT_EQ(table.size(), 1u);
}

TEST(RecordTableTest, ZeroShardsFallsBackToOne) {
    RecordTable table(0);
    table.upsert("k", StoredResult{"m", "p"});
    EXPECT_TRUE(table.contains("k"));
}

TEST(RecordTableTest, ClearDropsAllRecords) {
    RecordTable table(8);
    for (int i = 0; i < 100; ++i) table.upsert("k" + std::to_string(i), StoredResult{"m", "p"});
    EXPECT_EQ(table.size(), 100u);
    table.clear();
    EXPECT_EQ(table.size(), 0u);
}

TEST(RecordTableTest, ConcurrentWritersOnDistinctKeys) {
    RecordTable table(8);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 250; ++i) {
                table.upsert(std::to_string(t) + ":" + std::to_string(i), StoredResult{"m", std::to_string(i)});
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(table.size(), 1000u);
    EXPECT_EQ(table.tryGet("3:249")->result.payload, "249");
}

}  // namespace
