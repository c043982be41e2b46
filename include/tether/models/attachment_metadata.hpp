#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/models/proto_time.hpp"
#include "messaging/message_record.pb.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tether::models {

enum class AttachmentType {
    File,
    Photo,
    Voice
};

[[nodiscard]] std::string_view AttachmentTypeName(AttachmentType type) noexcept;

/**
 * Describes one encrypted blob. Immutable once AttachmentCipher has produced
 * it; the ciphertext itself lives in the key-value store under payload_ref.
 */
struct AttachmentMetadata {
    std::string id;
    AttachmentType type = AttachmentType::File;
    std::string file_name;
    uint64_t file_size = 0;
    std::string mime_type;
    std::string payload_ref;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> key_check;
    std::string owner_id;
    TimePoint uploaded_at{};

    [[nodiscard]] proto::messaging::AttachmentMetadata ToProto() const;

    [[nodiscard]] static Result<AttachmentMetadata, TetherFailure> FromProto(
        const proto::messaging::AttachmentMetadata& proto);
};

}
