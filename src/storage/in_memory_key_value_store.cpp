#include "tether/storage/in_memory_key_value_store.hpp"

namespace tether::storage {

Result<std::optional<std::string>, TetherFailure> InMemoryKeyValueStore::Get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Result<std::optional<std::string>, TetherFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::string>, TetherFailure>::Ok(it->second);
}

Result<bool, TetherFailure> InMemoryKeyValueStore::Has(std::string_view key) const {
    return Result<bool, TetherFailure>::Ok(Contains(key));
}

Result<Unit, TetherFailure> InMemoryKeyValueStore::Set(std::string_view key, std::string value) {
    if (key.empty()) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::InvalidInput("Storage key cannot be empty"));
    }
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(std::string(key), std::move(value));
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> InMemoryKeyValueStore::Delete(std::string_view key) {
    std::lock_guard lock(mutex_);
    if (const auto it = entries_.find(key); it != entries_.end()) {
        entries_.erase(it);
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

size_t InMemoryKeyValueStore::Size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool InMemoryKeyValueStore::Contains(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.find(key) != entries_.end();
}

}
