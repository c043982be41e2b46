#include "tether/models/attachment_metadata.hpp"
#include "tether/core/constants.hpp"
#include <fmt/core.h>

namespace tether::models {

namespace {
    AttachmentType ProtoTypeToEnum(const proto::messaging::AttachmentType proto_type) {
        switch (proto_type) {
            case proto::messaging::ATTACHMENT_TYPE_PHOTO:
                return AttachmentType::Photo;
            case proto::messaging::ATTACHMENT_TYPE_VOICE:
                return AttachmentType::Voice;
            default:
                return AttachmentType::File;
        }
    }

    proto::messaging::AttachmentType EnumToProtoType(const AttachmentType type) {
        switch (type) {
            case AttachmentType::Photo:
                return proto::messaging::ATTACHMENT_TYPE_PHOTO;
            case AttachmentType::Voice:
                return proto::messaging::ATTACHMENT_TYPE_VOICE;
            default:
                return proto::messaging::ATTACHMENT_TYPE_FILE;
        }
    }
}

std::string_view AttachmentTypeName(const AttachmentType type) noexcept {
    switch (type) {
        case AttachmentType::Photo: return "photo";
        case AttachmentType::Voice: return "voice";
        case AttachmentType::File: return "file";
    }
    return "file";
}

proto::messaging::AttachmentMetadata AttachmentMetadata::ToProto() const {
    proto::messaging::AttachmentMetadata proto;
    proto.set_id(id);
    proto.set_type(EnumToProtoType(type));
    proto.set_file_name(file_name);
    proto.set_file_size(file_size);
    proto.set_mime_type(mime_type);
    proto.set_payload_ref(payload_ref);
    proto.set_iv(iv.data(), iv.size());
    proto.set_key_check(key_check.data(), key_check.size());
    proto.set_owner_id(owner_id);
    *proto.mutable_uploaded_at() = ToProtoTimestamp(uploaded_at);
    return proto;
}

Result<AttachmentMetadata, TetherFailure> AttachmentMetadata::FromProto(
    const proto::messaging::AttachmentMetadata& proto) {

    if (proto.id().empty()) {
        return Result<AttachmentMetadata, TetherFailure>::Err(
            TetherFailure::Decode("Attachment metadata is missing its id"));
    }
    if (proto.iv().size() != Constants::AES_GCM_NONCE_SIZE) {
        return Result<AttachmentMetadata, TetherFailure>::Err(
            TetherFailure::Decode(
                fmt::format("Attachment IV must be {} bytes, got {}",
                            Constants::AES_GCM_NONCE_SIZE, proto.iv().size())));
    }
    if (proto.key_check().size() != Constants::KEY_CHECK_SIZE) {
        return Result<AttachmentMetadata, TetherFailure>::Err(
            TetherFailure::Decode("Attachment key check has the wrong length"));
    }
    if (proto.payload_ref() != fmt::format("{}{}", LedgerConstants::ATTACHMENT_PAYLOAD_PREFIX, proto.id())) {
        return Result<AttachmentMetadata, TetherFailure>::Err(
            TetherFailure::Decode("Attachment payload reference does not match its id"));
    }

    AttachmentMetadata metadata;
    metadata.id = proto.id();
    metadata.type = ProtoTypeToEnum(proto.type());
    metadata.file_name = proto.file_name();
    metadata.file_size = proto.file_size();
    metadata.mime_type = proto.mime_type();
    metadata.payload_ref = proto.payload_ref();
    metadata.iv.assign(proto.iv().begin(), proto.iv().end());
    metadata.key_check.assign(proto.key_check().begin(), proto.key_check().end());
    metadata.owner_id = proto.owner_id();
    metadata.uploaded_at = FromProtoTimestamp(proto.uploaded_at());
    return Result<AttachmentMetadata, TetherFailure>::Ok(std::move(metadata));
}

}
