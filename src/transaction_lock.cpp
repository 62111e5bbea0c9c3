#include "transaction_lock.hpp"
#include "errors.hpp"
#include "lock_manager.hpp"
#include <iostream>
#include <utility>

TransactionLock::TransactionLock(LockManager& manager, std::string key, std::string holder)
    : manager_(&manager), key_(std::move(key)), holder_(std::move(holder)) {}

TransactionLock::~TransactionLock() {
    releaseQuietly();
}

TransactionLock::TransactionLock(TransactionLock&& other) noexcept
    : manager_(other.manager_), key_(std::move(other.key_)), holder_(std::move(other.holder_)),
      owned_(std::exchange(other.owned_, false)) {}

TransactionLock& TransactionLock::operator=(TransactionLock&& other) noexcept {
    if (this != &other) {
        releaseQuietly();
        manager_ = other.manager_;
        key_ = std::move(other.key_);
        holder_ = std::move(other.holder_);
        owned_ = std::exchange(other.owned_, false);
    }
    return *this;
}

void TransactionLock::release() {
    if (!owned_) return;
    owned_ = false;
    manager_->release(key_, holder_);
}

void TransactionLock::releaseQuietly() noexcept {
    if (!owned_) return;
    owned_ = false;
    try {
        manager_->release(key_, holder_);
    } catch (const NotHolderError& e) {
        // The hold timeout elapsed before the scope ended.
        std::cerr << "[lock-release-error] " << e.what() << '\n';
    }
}
