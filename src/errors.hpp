#pragma once
#include <stdexcept>
#include <string>

// Raised by RecordStore::write when another holder owns the key's lock.
class HolderConflictError : public std::runtime_error {
public:
    HolderConflictError(const std::string& key, const std::string& holder)
        : std::runtime_error("Cannot write to transaction with key " + key +
                             " because it is locked by another holder."),
          key_(key), holder_(holder) {}

    const std::string& key() const { return key_; }
    const std::string& holder() const { return holder_; }

private:
    std::string key_;
    std::string holder_;
};

// Raised by release when the caller does not own a live lock on the key.
class NotHolderError : public std::runtime_error {
public:
    NotHolderError(const std::string& key, const std::string& holder)
        : std::runtime_error("No lock held by " + holder + " for transaction with key " + key),
          key_(key), holder_(holder) {}

    const std::string& key() const { return key_; }
    const std::string& holder() const { return holder_; }

private:
    std::string key_;
    std::string holder_;
};
