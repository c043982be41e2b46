#include "tether/crypto/message_cipher.hpp"
#include "tether/crypto/aes_gcm.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"

#include <fmt/core.h>

namespace tether::crypto {

namespace {
    using Wire = WireFormatConstants;

    Result<DecryptedText, TetherFailure> DecryptCurrent(
        std::string_view body,
        const SecureMemoryHandle& key) {

        auto decoded = SodiumInterop::FromBase64(body, Base64Variant::UrlSafeNoPadding);
        if (decoded.IsErr()) {
            return Result<DecryptedText, TetherFailure>::Err(
                TetherFailure::DecryptionFailed(DecryptionFailureReason::Malformed,
                                                "Envelope body is not valid base64url"));
        }
        const auto& bytes = decoded.Unwrap();
        if (bytes.size() < Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE) {
            return Result<DecryptedText, TetherFailure>::Err(
                TetherFailure::DecryptionFailed(DecryptionFailureReason::Malformed,
                                                std::string(ErrorMessages::ENVELOPE_TOO_SMALL)));
        }

        const std::span<const uint8_t> all(bytes);
        const auto nonce = all.subspan(0, Constants::AES_GCM_NONCE_SIZE);
        const auto sealed = all.subspan(Constants::AES_GCM_NONCE_SIZE);

        auto opened = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
            return AesGcm::Decrypt(key_bytes, nonce, sealed);
        });
        if (opened.IsErr()) {
            return Result<DecryptedText, TetherFailure>::Err(
                TetherFailure::FromSodiumFailure(opened.UnwrapErr()));
        }
        auto plaintext = std::move(opened).Unwrap();
        if (plaintext.IsErr()) {
            auto failure = std::move(plaintext).UnwrapErr();
            if (failure.Is(TetherFailureType::DecryptionFailed)) {
                return Result<DecryptedText, TetherFailure>::Err(std::move(failure));
            }
            return Result<DecryptedText, TetherFailure>::Err(
                TetherFailure::DecryptionFailed(DecryptionFailureReason::AuthenticationFailed,
                                                failure.message));
        }

        auto& plain_bytes = plaintext.Unwrap();
        DecryptedText result{std::string(plain_bytes.begin(), plain_bytes.end()), true};
        auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(plain_bytes));
        (void)wiped;
        return Result<DecryptedText, TetherFailure>::Ok(std::move(result));
    }

    Result<DecryptedText, TetherFailure> DecodeLegacy(std::string_view body) {
        auto decoded = SodiumInterop::FromBase64(body, Base64Variant::Standard);
        if (decoded.IsErr()) {
            return Result<DecryptedText, TetherFailure>::Err(
                TetherFailure::DecryptionFailed(DecryptionFailureReason::Malformed,
                                                "Legacy envelope body is not valid base64"));
        }
        const auto& bytes = decoded.Unwrap();
        std::string joined(bytes.begin(), bytes.end());
        if (const auto split = joined.rfind(Wire::LEGACY_JUNK_SEPARATOR); split != std::string::npos) {
            joined.resize(split);
        }
        return Result<DecryptedText, TetherFailure>::Ok(DecryptedText{std::move(joined), false});
    }
}

Result<std::string, TetherFailure> MessageCipher::Encrypt(
    std::string_view plaintext,
    const SecureMemoryHandle& key) {

    auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    const std::span<const uint8_t> plain(reinterpret_cast<const uint8_t*>(plaintext.data()),
                                         plaintext.size());

    auto sealed = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Encrypt(key_bytes, nonce, plain);
    });
    if (sealed.IsErr()) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto ciphertext = std::move(sealed).Unwrap();
    if (ciphertext.IsErr()) {
        return Result<std::string, TetherFailure>::Err(std::move(ciphertext).UnwrapErr());
    }

    std::vector<uint8_t> framed;
    framed.reserve(nonce.size() + ciphertext.Unwrap().size());
    framed.insert(framed.end(), nonce.begin(), nonce.end());
    framed.insert(framed.end(), ciphertext.Unwrap().begin(), ciphertext.Unwrap().end());

    return Result<std::string, TetherFailure>::Ok(
        fmt::format("{}{}", Wire::MESSAGE_PREFIX,
                    SodiumInterop::ToBase64(framed, Base64Variant::UrlSafeNoPadding)));
}

Result<DecryptedText, TetherFailure> MessageCipher::Decrypt(
    std::string_view envelope,
    const SecureMemoryHandle& key) {

    if (envelope.starts_with(Wire::MESSAGE_PREFIX)) {
        return DecryptCurrent(envelope.substr(Wire::MESSAGE_PREFIX.size()), key);
    }
    if (envelope.starts_with(Wire::LEGACY_MESSAGE_PREFIX)) {
        return DecodeLegacy(envelope.substr(Wire::LEGACY_MESSAGE_PREFIX.size()));
    }
    return Result<DecryptedText, TetherFailure>::Err(
        TetherFailure::DecryptionFailed(DecryptionFailureReason::UnsupportedFormat,
                                        std::string(ErrorMessages::UNKNOWN_ENVELOPE_TAG)));
}

bool MessageCipher::IsEnvelope(std::string_view text) noexcept {
    return text.starts_with(Wire::MESSAGE_PREFIX) || text.starts_with(Wire::LEGACY_MESSAGE_PREFIX);
}

}
