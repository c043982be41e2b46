#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace tether::interfaces {

/**
 * Durable records keyed by string. Identity, invites, the contact ledger
 * and attachment payloads all persist through this seam.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    /// nullopt when the key is absent.
    [[nodiscard]] virtual Result<std::optional<std::string>, TetherFailure> Get(std::string_view key) const = 0;

    [[nodiscard]] virtual Result<bool, TetherFailure> Has(std::string_view key) const = 0;

    [[nodiscard]] virtual Result<Unit, TetherFailure> Set(std::string_view key, std::string value) = 0;

    /// Deleting an absent key succeeds.
    [[nodiscard]] virtual Result<Unit, TetherFailure> Delete(std::string_view key) = 0;
};

}
