#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/crypto/sodium_secure_memory_handle.hpp"
#include <string>
#include <string_view>

namespace tether::crypto {

/**
 * Turns two parties' key material into one AES-256-GCM key.
 *
 * Role prefixes are stripped, the two raw hex strings are sorted, joined with
 * '|' and fed through PBKDF2-HMAC-SHA256 (100,000 iterations, fixed salt).
 * Sorting makes the result symmetric:
 *
 *   DeriveSharedKey(A.private, B.public) == DeriveSharedKey(B.private, A.public)
 *
 * Both sides end up holding the same single key; there is no asymmetric
 * step. Changing the sort, separator, salt or iteration count breaks every
 * existing conversation.
 */
class SharedSecretDeriver {
public:
    [[nodiscard]] static Result<SecureMemoryHandle, TetherFailure> DeriveSharedKey(
        std::string_view my_private,
        std::string_view their_public);

    /// Sort a and b, join with '|' and stretch with the given salt.
    [[nodiscard]] static Result<SecureMemoryHandle, TetherFailure> DeriveFromSortedPair(
        std::string_view a,
        std::string_view b,
        std::string_view salt);

    /// "tpub_<hex>" / "tpriv_<hex>" / "<hex>" -> "<hex>"; 64 hex characters required.
    [[nodiscard]] static Result<std::string, TetherFailure> StripKeyRole(std::string_view key);

    SharedSecretDeriver() = delete;
};

}
