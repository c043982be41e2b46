#include "tether/crypto/shared_secret_deriver.hpp"
#include "tether/crypto/pbkdf2.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include "tether/debug/event_logger.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

namespace tether::crypto {

namespace {
    bool IsHexString(std::string_view value) {
        return std::all_of(value.begin(), value.end(), [](const char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        });
    }
}

Result<std::string, TetherFailure> SharedSecretDeriver::StripKeyRole(std::string_view key) {
    std::string_view raw = key;
    if (raw.starts_with(IdentityConstants::PUBLIC_KEY_PREFIX)) {
        raw.remove_prefix(IdentityConstants::PUBLIC_KEY_PREFIX.size());
    } else if (raw.starts_with(IdentityConstants::PRIVATE_KEY_PREFIX)) {
        raw.remove_prefix(IdentityConstants::PRIVATE_KEY_PREFIX.size());
    }

    if (raw.size() != Constants::RAW_KEY_HEX_LENGTH) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::InvalidKeyFormat(
                fmt::format("Key material must be {} hex characters, got {}",
                            Constants::RAW_KEY_HEX_LENGTH, raw.size())));
    }
    if (!IsHexString(raw)) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::InvalidKeyFormat("Key material contains non-hex characters"));
    }
    return Result<std::string, TetherFailure>::Ok(std::string(raw));
}

Result<SecureMemoryHandle, TetherFailure> SharedSecretDeriver::DeriveFromSortedPair(
    std::string_view a,
    std::string_view b,
    std::string_view salt) {

    if (a.empty() || b.empty()) {
        return Result<SecureMemoryHandle, TetherFailure>::Err(
            TetherFailure::InvalidInput("Key derivation inputs cannot be empty"));
    }

    const auto [low, high] = std::minmax(a, b);
    std::string joined;
    joined.reserve(low.size() + high.size() + 1);
    joined.append(low);
    joined.push_back(KeyDerivationConstants::KEY_SEPARATOR);
    joined.append(high);

    std::vector<uint8_t> key(Constants::AES_KEY_SIZE);
    auto derived = Pbkdf2::DeriveKey(
        std::span(reinterpret_cast<const uint8_t*>(joined.data()), joined.size()),
        std::span(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
        KeyDerivationConstants::PBKDF2_ITERATIONS,
        key);
    auto wiped_joined = SodiumInterop::SecureWipe(joined);
    (void)wiped_joined;

    if (derived.IsErr()) {
        return Result<SecureMemoryHandle, TetherFailure>::Err(std::move(derived).UnwrapErr());
    }

    auto handle = SecureMemoryHandle::FromBytes(key);
    auto wiped_key = SodiumInterop::SecureWipe(std::span<uint8_t>(key));
    (void)wiped_key;
    if (handle.IsErr()) {
        return Result<SecureMemoryHandle, TetherFailure>::Err(
            TetherFailure::FromSodiumFailure(handle.UnwrapErr()));
    }

    TETHER_LOG_MSG("KDF", "derived 32-byte key from sorted pair");
    return Result<SecureMemoryHandle, TetherFailure>::Ok(std::move(handle).Unwrap());
}

Result<SecureMemoryHandle, TetherFailure> SharedSecretDeriver::DeriveSharedKey(
    std::string_view my_private,
    std::string_view their_public) {

    auto mine = StripKeyRole(my_private);
    if (mine.IsErr()) {
        return Result<SecureMemoryHandle, TetherFailure>::Err(std::move(mine).UnwrapErr());
    }
    auto theirs = StripKeyRole(their_public);
    if (theirs.IsErr()) {
        return Result<SecureMemoryHandle, TetherFailure>::Err(std::move(theirs).UnwrapErr());
    }

    auto result = DeriveFromSortedPair(mine.Unwrap(), theirs.Unwrap(),
                                       KeyDerivationConstants::CONVERSATION_SALT);
    auto wiped = SodiumInterop::SecureWipe(mine.Unwrap());
    (void)wiped;
    return result;
}

}
