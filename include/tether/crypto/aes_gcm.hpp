#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>

namespace tether::crypto {

/**
 * AES-256-GCM over OpenSSL EVP.
 *
 * Stateless: callers supply a fresh 12-byte nonce for every encryption under
 * a given key. MessageCipher and AttachmentCipher draw it from the CSPRNG.
 *
 * Output of Encrypt is ciphertext || tag(16). Decrypt reports a tag mismatch
 * as DecryptionFailed(AuthenticationFailed) and never returns partial
 * plaintext.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, TetherFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, TetherFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

    AesGcm() = delete;
};

}
