#pragma once
#include "tether/interfaces/i_key_value_store.hpp"
#include <functional>
#include <map>
#include <mutex>

namespace tether::storage {

class InMemoryKeyValueStore final : public interfaces::IKeyValueStore {
public:
    InMemoryKeyValueStore() = default;

    [[nodiscard]] Result<std::optional<std::string>, TetherFailure> Get(std::string_view key) const override;
    [[nodiscard]] Result<bool, TetherFailure> Has(std::string_view key) const override;
    [[nodiscard]] Result<Unit, TetherFailure> Set(std::string_view key, std::string value) override;
    [[nodiscard]] Result<Unit, TetherFailure> Delete(std::string_view key) override;

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] bool Contains(std::string_view key) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> entries_;
};

}
