#include "tether/models/message.hpp"

namespace tether::models {

namespace {
    proto::messaging::MessageStatus EnumToProtoStatus(const MessageStatus status) {
        switch (status) {
            case MessageStatus::Sending: return proto::messaging::MESSAGE_STATUS_SENDING;
            case MessageStatus::Sent: return proto::messaging::MESSAGE_STATUS_SENT;
            case MessageStatus::Delivered: return proto::messaging::MESSAGE_STATUS_DELIVERED;
            case MessageStatus::Seen: return proto::messaging::MESSAGE_STATUS_SEEN;
        }
        return proto::messaging::MESSAGE_STATUS_SENDING;
    }

    MessageStatus ProtoStatusToEnum(const proto::messaging::MessageStatus status) {
        switch (status) {
            case proto::messaging::MESSAGE_STATUS_SENT: return MessageStatus::Sent;
            case proto::messaging::MESSAGE_STATUS_DELIVERED: return MessageStatus::Delivered;
            case proto::messaging::MESSAGE_STATUS_SEEN: return MessageStatus::Seen;
            default: return MessageStatus::Sending;
        }
    }

    proto::messaging::MessageAuthenticity EnumToProtoAuthenticity(const MessageAuthenticity value) {
        switch (value) {
            case MessageAuthenticity::Authenticated:
                return proto::messaging::MESSAGE_AUTHENTICITY_AUTHENTICATED;
            case MessageAuthenticity::LegacyUnauthenticated:
                return proto::messaging::MESSAGE_AUTHENTICITY_LEGACY_UNAUTHENTICATED;
            case MessageAuthenticity::Plaintext:
                return proto::messaging::MESSAGE_AUTHENTICITY_PLAINTEXT;
            case MessageAuthenticity::Undecryptable:
                return proto::messaging::MESSAGE_AUTHENTICITY_UNDECRYPTABLE;
            case MessageAuthenticity::Unverified:
                return proto::messaging::MESSAGE_AUTHENTICITY_UNVERIFIED;
        }
        return proto::messaging::MESSAGE_AUTHENTICITY_UNDECRYPTABLE;
    }

    MessageAuthenticity ProtoAuthenticityToEnum(const proto::messaging::MessageAuthenticity value) {
        switch (value) {
            case proto::messaging::MESSAGE_AUTHENTICITY_AUTHENTICATED:
                return MessageAuthenticity::Authenticated;
            case proto::messaging::MESSAGE_AUTHENTICITY_LEGACY_UNAUTHENTICATED:
                return MessageAuthenticity::LegacyUnauthenticated;
            case proto::messaging::MESSAGE_AUTHENTICITY_PLAINTEXT:
                return MessageAuthenticity::Plaintext;
            case proto::messaging::MESSAGE_AUTHENTICITY_UNVERIFIED:
                return MessageAuthenticity::Unverified;
            default:
                return MessageAuthenticity::Undecryptable;
        }
    }
}

std::string_view MessageStatusName(const MessageStatus status) noexcept {
    switch (status) {
        case MessageStatus::Sending: return "sending";
        case MessageStatus::Sent: return "sent";
        case MessageStatus::Delivered: return "delivered";
        case MessageStatus::Seen: return "seen";
    }
    return "unknown";
}

proto::messaging::MessageRecord Message::ToProto() const {
    proto::messaging::MessageRecord proto;
    proto.set_id(id);
    proto.set_conversation_id(conversation_id);
    proto.set_sender_id(sender_id);
    proto.set_text(text);
    if (attachment.has_value()) {
        *proto.mutable_attachment() = attachment->ToProto();
    }
    *proto.mutable_timestamp() = ToProtoTimestamp(timestamp);
    proto.set_status(EnumToProtoStatus(status));
    proto.set_is_own(is_own);
    proto.set_auto_delete_timer_minutes(auto_delete_timer_minutes);
    if (delete_at.has_value()) {
        *proto.mutable_delete_at() = ToProtoTimestamp(*delete_at);
    }
    proto.set_authenticity(EnumToProtoAuthenticity(authenticity));
    proto.set_sync_pending(sync_pending);
    if (sent_at.has_value()) {
        *proto.mutable_sent_at() = ToProtoTimestamp(*sent_at);
    }
    return proto;
}

Result<Message, TetherFailure> Message::FromProto(const proto::messaging::MessageRecord& proto) {
    if (proto.id().empty() || proto.conversation_id().empty()) {
        return Result<Message, TetherFailure>::Err(
            TetherFailure::Decode("Message record is missing its id or conversation"));
    }

    Message message;
    message.id = proto.id();
    message.conversation_id = proto.conversation_id();
    message.sender_id = proto.sender_id();
    message.text = proto.text();
    if (proto.has_attachment()) {
        auto attachment = AttachmentMetadata::FromProto(proto.attachment());
        if (attachment.IsErr()) {
            return Result<Message, TetherFailure>::Err(std::move(attachment).UnwrapErr());
        }
        message.attachment = std::move(attachment).Unwrap();
    }
    message.timestamp = FromProtoTimestamp(proto.timestamp());
    message.status = ProtoStatusToEnum(proto.status());
    message.is_own = proto.is_own();
    message.auto_delete_timer_minutes = proto.auto_delete_timer_minutes();
    if (proto.has_delete_at()) {
        message.delete_at = FromProtoTimestamp(proto.delete_at());
    }
    message.authenticity = ProtoAuthenticityToEnum(proto.authenticity());
    message.sync_pending = proto.sync_pending();
    if (proto.has_sent_at()) {
        message.sent_at = FromProtoTimestamp(proto.sent_at());
    }
    return Result<Message, TetherFailure>::Ok(std::move(message));
}

}
