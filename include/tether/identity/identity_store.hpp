#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/interfaces/i_key_value_store.hpp"
#include <mutex>
#include <string>
#include <string_view>

namespace tether::identity {

/**
 * Symmetric key material. Both halves carry the same 32-byte secret under a
 * different role tag and are equally secret.
 */
struct KeyPair {
    std::string public_key;
    std::string private_key;
};

struct DeviceIdentity {
    std::string device_id;
    std::string user_id;
    KeyPair key_pair;
};

/**
 * Durable identity of this device.
 *
 * Every GetOrCreate call is idempotent: a stored value is returned as is,
 * otherwise a fresh one is drawn from the CSPRNG and persisted before it is
 * returned. Nothing here rotates automatically.
 */
class IdentityStore {
public:
    explicit IdentityStore(interfaces::IKeyValueStore& store);

    /// "dev_" + 32 lowercase hex characters.
    [[nodiscard]] Result<std::string, TetherFailure> GetOrCreateDeviceId();

    /// "TU-" + 8 symbols from the unambiguous alphabet.
    [[nodiscard]] Result<std::string, TetherFailure> GetOrCreateUserId();

    [[nodiscard]] Result<KeyPair, TetherFailure> GetOrCreateKeyPair();

    [[nodiscard]] Result<DeviceIdentity, TetherFailure> GetOrCreateIdentity();

    /**
     * Associate the device with a login. The first binding keeps the current
     * device id; a different email later mints a new one.
     *
     * @return the device id in effect after binding
     */
    [[nodiscard]] Result<std::string, TetherFailure> BindLoginEmail(std::string_view email);

    [[nodiscard]] static std::string GenerateDeviceId();
    [[nodiscard]] static std::string GenerateUserId();

private:
    [[nodiscard]] Result<std::string, TetherFailure> LoadOrCreateLocked(
        std::string_view key,
        std::string (*generate)());

    interfaces::IKeyValueStore& store_;
    std::mutex mutex_;
};

}
