#include "config.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>

static unsigned long parseUnsigned(const char* name, const std::string& raw, unsigned long max) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(raw, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + ": not a number: '" + raw + "'");
    }
    if (used != raw.size() || raw.front() == '-') {
        throw std::invalid_argument(std::string(name) + ": not a number: '" + raw + "'");
    }
    if (value > max) {
        throw std::invalid_argument(std::string(name) + ": out of range: " + raw);
    }
    return value;
}

static bool parseFlag(const char* name, const std::string& raw) {
    if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") return true;
    if (raw == "0" || raw == "false" || raw == "no" || raw == "off" || raw.empty()) return false;
    throw std::invalid_argument(std::string(name) + ": expected a boolean, got '" + raw + "'");
}

StoreConfig StoreConfig::fromEnvironment() {
    StoreConfig cfg;
    if (const char* shards = std::getenv("RECORD_STORE_SHARDS")) {
        cfg.shardCount = parseUnsigned("RECORD_STORE_SHARDS", shards, 4096);
        if (cfg.shardCount == 0) {
            throw std::invalid_argument("RECORD_STORE_SHARDS: must be at least 1");
        }
    }
    if (const char* hold = std::getenv("RECORD_STORE_DEFAULT_HOLD_TIMEOUT_MS")) {
        auto ms = parseUnsigned("RECORD_STORE_DEFAULT_HOLD_TIMEOUT_MS", hold,
                                std::numeric_limits<unsigned>::max());
        if (ms > 0) cfg.defaultHoldTimeout = std::chrono::milliseconds(ms);
    }
    if (const char* verbose = std::getenv("RECORD_STORE_VERBOSE")) {
        cfg.verbose = parseFlag("RECORD_STORE_VERBOSE", verbose);
    }
    return cfg;
}

ServiceConfig ServiceConfig::fromEnvironment(int argc, char** argv) {
    ServiceConfig cfg;
    if (const char* host = std::getenv("BIND_HOST")) cfg.bindHost = host;
    if (const char* envPort = std::getenv("PORT")) {
        cfg.port = static_cast<unsigned short>(parseUnsigned("PORT", envPort, 65535));
    } else if (argc > 1) {
        cfg.port = static_cast<unsigned short>(parseUnsigned("port", argv[1], 65535));
    }
    if (const char* workers = std::getenv("DEMO_WORKERS")) {
        cfg.workers = static_cast<unsigned>(parseUnsigned("DEMO_WORKERS", workers, 1024));
    }
    if (const char* keys = std::getenv("DEMO_KEYS")) {
        cfg.demoKeys = static_cast<unsigned>(parseUnsigned("DEMO_KEYS", keys, 1u << 20));
    }
    return cfg;
}
