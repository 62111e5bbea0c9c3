#pragma once
#include <string>

class LockManager;

// Move-only handle for a lock taken by LockManager::scoped. The lock is
// released when the handle is destroyed unless release() was called first.
class TransactionLock {
public:
    TransactionLock(LockManager& manager, std::string key, std::string holder);
    ~TransactionLock();

    TransactionLock(TransactionLock&& other) noexcept;
    TransactionLock& operator=(TransactionLock&& other) noexcept;
    TransactionLock(const TransactionLock&) = delete;
    TransactionLock& operator=(const TransactionLock&) = delete;

    // Throws NotHolderError if the lock expired and was lost in the meantime.
    void release();

    const std::string& key() const { return key_; }
    const std::string& holder() const { return holder_; }
    bool ownsLock() const { return owned_; }

private:
    void releaseQuietly() noexcept;

    LockManager* manager_;
    std::string key_;
    std::string holder_;
    bool owned_ = true;
};
