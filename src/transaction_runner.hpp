#pragma once
#include <functional>
#include <optional>
#include <string>
#include "record_store.hpp"

struct RunOutcome {
    StoredResult result;
    bool fromCache = false;
};

// Executes a unit of work at most once per key: the key's lock is held while
// the store is checked for an earlier result and, if none, while the work runs
// and its result is written.
class TransactionRunner {
public:
    using Compute = std::function<StoredResult()>;

    explicit TransactionRunner(RecordStore& store);

    RunOutcome run(const std::string& key, const std::string& holder, const Compute& compute,
                   std::optional<Duration> holdTimeout = std::nullopt);

private:
    RecordStore& store_;
};
