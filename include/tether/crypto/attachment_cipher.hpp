#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/crypto/sodium_secure_memory_handle.hpp"
#include "tether/models/attachment_metadata.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tether::crypto {

struct EncryptedAttachment {
    models::AttachmentMetadata metadata;
    std::vector<uint8_t> ciphertext;
};

/// Caller-supplied description of a blob about to be encrypted.
struct AttachmentDescriptor {
    models::AttachmentType type = models::AttachmentType::File;
    std::string file_name;
    std::string mime_type;
    std::string owner_id;
};

/**
 * Binary blob encryption for photos, files and voice notes.
 *
 * The key comes from the sorted pair of device ids only, so two peers whose
 * local conversation ids disagree still agree on it. It is a separate
 * derivation from the conversation key and must stay that way.
 *
 * Metadata carries an 8-byte key check so Decrypt can tell a wrong key from
 * a damaged ciphertext. The attachment id is bound in as associated data.
 */
class AttachmentCipher {
public:
    [[nodiscard]] static Result<SecureMemoryHandle, TetherFailure> DeriveAttachmentKey(
        std::string_view device_id_a,
        std::string_view device_id_b);

    [[nodiscard]] static Result<EncryptedAttachment, TetherFailure> Encrypt(
        std::span<const uint8_t> blob,
        const AttachmentDescriptor& descriptor,
        const SecureMemoryHandle& key,
        models::TimePoint now);

    [[nodiscard]] static Result<std::vector<uint8_t>, TetherFailure> Decrypt(
        const models::AttachmentMetadata& metadata,
        std::span<const uint8_t> ciphertext,
        const SecureMemoryHandle& key);

    /// "ATT1_" + base64url(AttachmentEnvelope) for the message channel.
    [[nodiscard]] static Result<std::string, TetherFailure> PackForWire(const EncryptedAttachment& attachment);

    [[nodiscard]] static Result<EncryptedAttachment, TetherFailure> UnpackFromWire(std::string_view wire);

    [[nodiscard]] static bool IsWireAttachment(std::string_view text) noexcept;

    AttachmentCipher() = delete;
};

}
