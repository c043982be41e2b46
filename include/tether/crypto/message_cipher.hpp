#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/crypto/sodium_secure_memory_handle.hpp"
#include <string>
#include <string_view>

namespace tether::crypto {

struct DecryptedText {
    std::string text;
    // false for the legacy ENC_ path, which carries no integrity protection.
    bool authenticated = false;
};

/**
 * Text envelope codec.
 *
 *   current: "ENC2_" + base64url_nopad(iv(12) || ciphertext || tag(16))
 *   legacy:  "ENC_"  + base64(plaintext ":" junk)      read-only
 *
 * Every Encrypt draws a fresh random IV. Decrypt never throws; any problem
 * with one envelope comes back as DecryptionFailed and the caller carries on
 * with the rest of the conversation.
 */
class MessageCipher {
public:
    [[nodiscard]] static Result<std::string, TetherFailure> Encrypt(
        std::string_view plaintext,
        const SecureMemoryHandle& key);

    [[nodiscard]] static Result<DecryptedText, TetherFailure> Decrypt(
        std::string_view envelope,
        const SecureMemoryHandle& key);

    /// True when text carries the current or legacy envelope tag.
    [[nodiscard]] static bool IsEnvelope(std::string_view text) noexcept;

    MessageCipher() = delete;
};

}
