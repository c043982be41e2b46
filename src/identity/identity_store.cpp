#include "tether/identity/identity_store.hpp"
#include "tether/core/constants.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/debug/event_logger.hpp"

#include <fmt/core.h>

namespace tether::identity {

using crypto::SodiumInterop;

IdentityStore::IdentityStore(interfaces::IKeyValueStore& store)
    : store_(store)
{
}

std::string IdentityStore::GenerateDeviceId() {
    auto bytes = SodiumInterop::GetRandomBytes(Constants::DEVICE_ID_RANDOM_BYTES);
    std::string id(IdentityConstants::DEVICE_ID_PREFIX);
    id += SodiumInterop::ToHex(bytes);
    return id;
}

std::string IdentityStore::GenerateUserId() {
    auto bytes = SodiumInterop::GetRandomBytes(Constants::USER_ID_RANDOM_BYTES);
    constexpr auto alphabet = IdentityConstants::USER_ID_ALPHABET;
    std::string id(IdentityConstants::USER_ID_PREFIX);
    id.reserve(id.size() + bytes.size());
    for (const uint8_t b : bytes) {
        id.push_back(alphabet[b % alphabet.size()]);
    }
    return id;
}

Result<std::string, TetherFailure> IdentityStore::LoadOrCreateLocked(
    std::string_view key,
    std::string (*generate)()) {

    auto existing = store_.Get(key);
    if (existing.IsErr()) {
        return Result<std::string, TetherFailure>::Err(existing.UnwrapErr());
    }
    if (auto value = std::move(existing).Unwrap(); value.has_value() && !value->empty()) {
        return Result<std::string, TetherFailure>::Ok(std::move(*value));
    }

    std::string fresh = generate();
    auto stored = store_.Set(key, fresh);
    if (stored.IsErr()) {
        return Result<std::string, TetherFailure>::Err(stored.UnwrapErr());
    }
    TETHER_LOG_ID("identity", std::string(key).c_str(), fresh);
    return Result<std::string, TetherFailure>::Ok(std::move(fresh));
}

Result<std::string, TetherFailure> IdentityStore::GetOrCreateDeviceId() {
    std::lock_guard lock(mutex_);
    return LoadOrCreateLocked(IdentityConstants::KEY_DEVICE_ID, &IdentityStore::GenerateDeviceId);
}

Result<std::string, TetherFailure> IdentityStore::GetOrCreateUserId() {
    std::lock_guard lock(mutex_);
    return LoadOrCreateLocked(IdentityConstants::KEY_USER_ID, &IdentityStore::GenerateUserId);
}

Result<KeyPair, TetherFailure> IdentityStore::GetOrCreateKeyPair() {
    std::lock_guard lock(mutex_);

    auto public_key = store_.Get(IdentityConstants::KEY_PUBLIC_KEY);
    if (public_key.IsErr()) {
        return Result<KeyPair, TetherFailure>::Err(public_key.UnwrapErr());
    }
    auto private_key = store_.Get(IdentityConstants::KEY_PRIVATE_KEY);
    if (private_key.IsErr()) {
        return Result<KeyPair, TetherFailure>::Err(private_key.UnwrapErr());
    }

    auto stored_public = std::move(public_key).Unwrap();
    auto stored_private = std::move(private_key).Unwrap();
    if (stored_public.has_value() && stored_private.has_value()) {
        return Result<KeyPair, TetherFailure>::Ok(
            KeyPair{std::move(*stored_public), std::move(*stored_private)});
    }

    auto secret = SodiumInterop::GetRandomBytes(Constants::RAW_KEY_SIZE);
    std::string hex = SodiumInterop::ToHex(secret);
    auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
    (void)wiped;

    KeyPair pair{
        fmt::format("{}{}", IdentityConstants::PUBLIC_KEY_PREFIX, hex),
        fmt::format("{}{}", IdentityConstants::PRIVATE_KEY_PREFIX, hex)};
    auto hex_wiped = SodiumInterop::SecureWipe(hex);
    (void)hex_wiped;

    if (auto stored = store_.Set(IdentityConstants::KEY_PUBLIC_KEY, pair.public_key); stored.IsErr()) {
        return Result<KeyPair, TetherFailure>::Err(stored.UnwrapErr());
    }
    if (auto stored = store_.Set(IdentityConstants::KEY_PRIVATE_KEY, pair.private_key); stored.IsErr()) {
        return Result<KeyPair, TetherFailure>::Err(stored.UnwrapErr());
    }
    TETHER_LOG_MSG("identity", "generated key material");
    return Result<KeyPair, TetherFailure>::Ok(std::move(pair));
}

Result<DeviceIdentity, TetherFailure> IdentityStore::GetOrCreateIdentity() {
    auto device_id = GetOrCreateDeviceId();
    if (device_id.IsErr()) {
        return Result<DeviceIdentity, TetherFailure>::Err(device_id.UnwrapErr());
    }
    auto user_id = GetOrCreateUserId();
    if (user_id.IsErr()) {
        return Result<DeviceIdentity, TetherFailure>::Err(user_id.UnwrapErr());
    }
    auto key_pair = GetOrCreateKeyPair();
    if (key_pair.IsErr()) {
        return Result<DeviceIdentity, TetherFailure>::Err(key_pair.UnwrapErr());
    }
    return Result<DeviceIdentity, TetherFailure>::Ok(DeviceIdentity{
        std::move(device_id).Unwrap(),
        std::move(user_id).Unwrap(),
        std::move(key_pair).Unwrap()});
}

Result<std::string, TetherFailure> IdentityStore::BindLoginEmail(std::string_view email) {
    if (email.empty()) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::InvalidInput("Login email cannot be empty"));
    }

    std::lock_guard lock(mutex_);
    auto bound = store_.Get(IdentityConstants::KEY_LOGIN_EMAIL);
    if (bound.IsErr()) {
        return Result<std::string, TetherFailure>::Err(bound.UnwrapErr());
    }
    const auto previous = std::move(bound).Unwrap();

    if (previous.has_value() && *previous != email) {
        std::string rotated = GenerateDeviceId();
        if (auto stored = store_.Set(IdentityConstants::KEY_DEVICE_ID, rotated); stored.IsErr()) {
            return Result<std::string, TetherFailure>::Err(stored.UnwrapErr());
        }
        TETHER_LOG_ID("identity", "device id rotated", rotated);
    }
    if (!previous.has_value() || *previous != email) {
        if (auto stored = store_.Set(IdentityConstants::KEY_LOGIN_EMAIL, std::string(email)); stored.IsErr()) {
            return Result<std::string, TetherFailure>::Err(stored.UnwrapErr());
        }
    }
    return LoadOrCreateLocked(IdentityConstants::KEY_DEVICE_ID, &IdentityStore::GenerateDeviceId);
}

}
