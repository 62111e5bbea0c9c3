#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

using Clock = std::chrono::steady_clock;
using Duration = Clock::duration;

struct StoreConfig {
    std::size_t shardCount = 16;
    std::optional<Duration> defaultHoldTimeout; // applied when acquire passes none
    bool verbose = false;

    // RECORD_STORE_SHARDS, RECORD_STORE_DEFAULT_HOLD_TIMEOUT_MS, RECORD_STORE_VERBOSE
    static StoreConfig fromEnvironment();
};

struct ServiceConfig {
    std::string bindHost = "0.0.0.0";
    unsigned short port = 8001;
    unsigned workers = 4;
    unsigned demoKeys = 8;

    // BIND_HOST, PORT (argv[1] when PORT is unset), DEMO_WORKERS, DEMO_KEYS
    static ServiceConfig fromEnvironment(int argc, char** argv);
};
