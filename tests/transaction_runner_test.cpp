#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "transaction_runner.hpp"

using namespace std::chrono_literals;

namespace {

TEST(TransactionRunnerTest, ComputesOnceThenServesFromCache) {
    RecordStore store;
    TransactionRunner runner(store);
    int calls = 0;
    auto compute = [&] {
        ++calls;
        return StoredResult{"json", "42"};
    };

    auto first = runner.run("txn", "a", compute);
    EXPECT_FALSE(first.fromCache);
    EXPECT_EQ(first.result.payload, "42");

    auto second = runner.run("txn", "b", compute);
    EXPECT_TRUE(second.fromCache);
    EXPECT_EQ(second.result.payload, "42");
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(store.isLocked("txn"));
}

TEST(TransactionRunnerTest, FailedComputationReleasesLockAndStoresNothing) {
    RecordStore store;
    TransactionRunner runner(store);
    EXPECT_THROW(runner.run("txn", "a", []() -> StoredResult { throw std::runtime_error("boom"); }),
                 std::runtime_error);
    EXPECT_FALSE(store.isLocked("txn"));
    EXPECT_FALSE(store.exists("txn"));

    auto retry = runner.run("txn", "a", [] { return StoredResult{"json", "ok"}; });
    EXPECT_FALSE(retry.fromCache);
    EXPECT_EQ(retry.result.payload, "ok");
}

TEST(TransactionRunnerTest, ComputeOutlivingHoldTimeoutStillCommits) {
    RecordStore store;
    TransactionRunner runner(store);
    RunOutcome outcome;
    EXPECT_NO_THROW(outcome = runner.run("txn", "a", [] {
        std::this_thread::sleep_for(50ms);
        return StoredResult{"json", "late"};
    }, 20ms));
    EXPECT_FALSE(outcome.fromCache);
    EXPECT_EQ(outcome.result.payload, "late");
    EXPECT_EQ(store.read("txn")->result.payload, "late");
    EXPECT_FALSE(store.isLocked("txn"));
    EXPECT_EQ(store.metrics().lockReleaseErrors(), 1u);
}

TEST(TransactionRunnerTest, ConcurrentCallersComputeOnce) {
    RecordStore store;
    std::atomic<int> calls{0};
    std::atomic<int> cached{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            TransactionRunner runner(store);
            auto outcome = runner.run("shared-txn", "worker-" + std::to_string(t), [&] {
                ++calls;
                std::this_thread::sleep_for(20ms);
                return StoredResult{"json", "computed"};
            });
            if (outcome.fromCache) ++cached;
            EXPECT_EQ(outcome.result.payload, "computed");
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cached, 7);
    EXPECT_EQ(store.metrics().recordWrites(), 1u);
}

}  // namespace
