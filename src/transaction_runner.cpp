#include "transaction_runner.hpp"
#include "errors.hpp"
#include <iostream>
#include <utility>

TransactionRunner::TransactionRunner(RecordStore& store) : store_(store) {}

RunOutcome TransactionRunner::run(const std::string& key, const std::string& holder,
                                  const Compute& compute, std::optional<Duration> holdTimeout) {
    auto lock = store_.lock(key, holder, holdTimeout);

    if (auto record = store_.read(key)) {
        if (store_.config().verbose) {
            std::cout << "[txn-cached] key=" << key << " holder=" << holder << '\n';
        }
        return RunOutcome{record->result, true};
    }

    StoredResult result = compute();
    store_.write(key, result, holder);
    try {
        lock.release();
    } catch (const NotHolderError& e) {
        // The hold timeout elapsed during compute; the result is already stored.
        std::cerr << "[lock-release-error] " << e.what() << '\n';
    }
    std::cout << "[txn-committed] key=" << key << " holder=" << holder
              << " bytes=" << result.payload.size() << '\n';
    return RunOutcome{std::move(result), false};
}
