#include "tether/crypto/attachment_cipher.hpp"
#include "tether/crypto/aes_gcm.hpp"
#include "tether/crypto/shared_secret_deriver.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include "tether/debug/event_logger.hpp"

#include <fmt/core.h>

namespace tether::crypto {

namespace {
    constexpr size_t ATTACHMENT_ID_RANDOM_BYTES = 12;
    constexpr std::string_view ATTACHMENT_ID_PREFIX = "att_";
    // BLAKE2b minimum; truncated to KEY_CHECK_SIZE.
    constexpr size_t KEY_CHECK_DIGEST_SIZE = 16;

    Result<std::vector<uint8_t>, TetherFailure> ComputeKeyCheck(const SecureMemoryHandle& key) {
        auto digest = key.WithReadAccess([](std::span<const uint8_t> key_bytes) {
            return SodiumInterop::GenericHash(key_bytes, KEY_CHECK_DIGEST_SIZE);
        });
        if (digest.IsErr()) {
            return Result<std::vector<uint8_t>, TetherFailure>::Err(
                TetherFailure::FromSodiumFailure(digest.UnwrapErr()));
        }
        auto inner = std::move(digest).Unwrap();
        if (inner.IsErr()) {
            return Result<std::vector<uint8_t>, TetherFailure>::Err(
                TetherFailure::FromSodiumFailure(inner.UnwrapErr()));
        }
        auto check = std::move(inner).Unwrap();
        check.resize(Constants::KEY_CHECK_SIZE);
        return Result<std::vector<uint8_t>, TetherFailure>::Ok(std::move(check));
    }

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

Result<SecureMemoryHandle, TetherFailure> AttachmentCipher::DeriveAttachmentKey(
    std::string_view device_id_a,
    std::string_view device_id_b) {
    return SharedSecretDeriver::DeriveFromSortedPair(
        device_id_a, device_id_b, KeyDerivationConstants::ATTACHMENT_SALT);
}

Result<EncryptedAttachment, TetherFailure> AttachmentCipher::Encrypt(
    std::span<const uint8_t> blob,
    const AttachmentDescriptor& descriptor,
    const SecureMemoryHandle& key,
    const models::TimePoint now) {

    if (blob.size() > Constants::MAX_ATTACHMENT_SIZE) {
        return Result<EncryptedAttachment, TetherFailure>::Err(
            TetherFailure::InvalidInput(
                fmt::format("Attachment of {} bytes exceeds the {} byte limit",
                            blob.size(), Constants::MAX_ATTACHMENT_SIZE)));
    }
    if (descriptor.owner_id.empty()) {
        return Result<EncryptedAttachment, TetherFailure>::Err(
            TetherFailure::InvalidInput("Attachment owner id cannot be empty"));
    }

    auto key_check = ComputeKeyCheck(key);
    if (key_check.IsErr()) {
        return Result<EncryptedAttachment, TetherFailure>::Err(std::move(key_check).UnwrapErr());
    }

    models::AttachmentMetadata metadata;
    metadata.id = fmt::format("{}{}", ATTACHMENT_ID_PREFIX,
                              SodiumInterop::ToHex(SodiumInterop::GetRandomBytes(ATTACHMENT_ID_RANDOM_BYTES)));
    metadata.type = descriptor.type;
    metadata.file_name = descriptor.file_name;
    metadata.file_size = blob.size();
    metadata.mime_type = descriptor.mime_type;
    metadata.payload_ref = fmt::format("{}{}", LedgerConstants::ATTACHMENT_PAYLOAD_PREFIX, metadata.id);
    metadata.iv = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    metadata.key_check = std::move(key_check).Unwrap();
    metadata.owner_id = descriptor.owner_id;
    metadata.uploaded_at = now;

    auto sealed = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Encrypt(key_bytes, metadata.iv, blob, AsBytes(metadata.id));
    });
    if (sealed.IsErr()) {
        return Result<EncryptedAttachment, TetherFailure>::Err(
            TetherFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto ciphertext = std::move(sealed).Unwrap();
    if (ciphertext.IsErr()) {
        return Result<EncryptedAttachment, TetherFailure>::Err(std::move(ciphertext).UnwrapErr());
    }

    TETHER_LOG_ID("ATTACH", "encrypted", metadata.id);
    return Result<EncryptedAttachment, TetherFailure>::Ok(
        EncryptedAttachment{std::move(metadata), std::move(ciphertext).Unwrap()});
}

Result<std::vector<uint8_t>, TetherFailure> AttachmentCipher::Decrypt(
    const models::AttachmentMetadata& metadata,
    std::span<const uint8_t> ciphertext,
    const SecureMemoryHandle& key) {

    auto key_check = ComputeKeyCheck(key);
    if (key_check.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(key_check).UnwrapErr());
    }
    if (!SodiumInterop::ConstantTimeEquals(key_check.Unwrap(), metadata.key_check)) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(DecryptionFailureReason::WrongKey,
                                            "Attachment was encrypted under a different key"));
    }

    auto opened = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Decrypt(key_bytes, metadata.iv, ciphertext, AsBytes(metadata.id));
    });
    if (opened.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    auto plaintext = std::move(opened).Unwrap();
    if (plaintext.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(DecryptionFailureReason::CorruptCiphertext,
                                            plaintext.UnwrapErr().message));
    }
    return plaintext;
}

Result<std::string, TetherFailure> AttachmentCipher::PackForWire(const EncryptedAttachment& attachment) {
    proto::messaging::AttachmentEnvelope envelope;
    *envelope.mutable_metadata() = attachment.metadata.ToProto();
    envelope.set_ciphertext(attachment.ciphertext.data(), attachment.ciphertext.size());

    std::string bytes;
    if (!envelope.SerializeToString(&bytes)) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::Encode("Failed to serialize AttachmentEnvelope"));
    }
    return Result<std::string, TetherFailure>::Ok(
        fmt::format("{}{}", WireFormatConstants::ATTACHMENT_PREFIX,
                    SodiumInterop::ToBase64(AsBytes(bytes), Base64Variant::UrlSafeNoPadding)));
}

Result<EncryptedAttachment, TetherFailure> AttachmentCipher::UnpackFromWire(std::string_view wire) {
    if (!IsWireAttachment(wire)) {
        return Result<EncryptedAttachment, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(DecryptionFailureReason::UnsupportedFormat,
                                            "Not an attachment envelope"));
    }
    auto decoded = SodiumInterop::FromBase64(
        wire.substr(WireFormatConstants::ATTACHMENT_PREFIX.size()), Base64Variant::UrlSafeNoPadding);
    if (decoded.IsErr()) {
        return Result<EncryptedAttachment, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(DecryptionFailureReason::Malformed,
                                            "Attachment envelope is not valid base64url"));
    }

    proto::messaging::AttachmentEnvelope envelope;
    const auto& bytes = decoded.Unwrap();
    if (!envelope.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())) || !envelope.has_metadata()) {
        return Result<EncryptedAttachment, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(DecryptionFailureReason::Malformed,
                                            "Attachment envelope failed to parse"));
    }
    auto metadata = models::AttachmentMetadata::FromProto(envelope.metadata());
    if (metadata.IsErr()) {
        return Result<EncryptedAttachment, TetherFailure>::Err(
            TetherFailure::DecryptionFailed(DecryptionFailureReason::Malformed,
                                            metadata.UnwrapErr().message));
    }
    return Result<EncryptedAttachment, TetherFailure>::Ok(
        EncryptedAttachment{std::move(metadata).Unwrap(),
                            std::vector<uint8_t>(envelope.ciphertext().begin(), envelope.ciphertext().end())});
}

bool AttachmentCipher::IsWireAttachment(std::string_view text) noexcept {
    return text.starts_with(WireFormatConstants::ATTACHMENT_PREFIX);
}

}
