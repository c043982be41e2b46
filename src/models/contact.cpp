#include "tether/models/contact.hpp"
#include "tether/core/constants.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace tether::models {

namespace {
    proto::ledger::ContactStatus EnumToProtoStatus(const ContactStatus status) {
        switch (status) {
            case ContactStatus::Online: return proto::ledger::CONTACT_STATUS_ONLINE;
            case ContactStatus::Away: return proto::ledger::CONTACT_STATUS_AWAY;
            default: return proto::ledger::CONTACT_STATUS_OFFLINE;
        }
    }

    ContactStatus ProtoStatusToEnum(const proto::ledger::ContactStatus status) {
        switch (status) {
            case proto::ledger::CONTACT_STATUS_ONLINE: return ContactStatus::Online;
            case proto::ledger::CONTACT_STATUS_AWAY: return ContactStatus::Away;
            default: return ContactStatus::Offline;
        }
    }
}

proto::ledger::ContactRecord Contact::ToProto() const {
    proto::ledger::ContactRecord proto;
    proto.set_id(id);
    proto.set_contact_user_id(contact_user_id);
    proto.set_name(name);
    proto.set_public_key(public_key);
    proto.set_pairing_code(pairing_code);
    proto.set_conversation_id(conversation_id);
    *proto.mutable_paired_at() = ToProtoTimestamp(paired_at);
    proto.set_status(EnumToProtoStatus(status));
    proto.set_is_verified(is_verified);
    auto* p = proto.mutable_privacy();
    p->set_share_presence(privacy.share_presence);
    p->set_share_read_receipts(privacy.share_read_receipts);
    p->set_share_typing(privacy.share_typing);
    p->set_allow_attachments(privacy.allow_attachments);
    proto.set_is_deleted(is_deleted);
    proto.set_group_id(group_id);
    return proto;
}

Result<Contact, TetherFailure> Contact::FromProto(const proto::ledger::ContactRecord& proto) {
    if (proto.id().empty()) {
        return Result<Contact, TetherFailure>::Err(
            TetherFailure::Decode("Contact record is missing its id"));
    }

    Contact contact;
    contact.id = proto.id();
    contact.contact_user_id = proto.contact_user_id();
    contact.name = proto.name();
    contact.public_key = proto.public_key();
    contact.pairing_code = proto.pairing_code();
    contact.conversation_id = proto.conversation_id();
    contact.paired_at = FromProtoTimestamp(proto.paired_at());
    contact.status = ProtoStatusToEnum(proto.status());
    contact.is_verified = proto.is_verified();
    if (proto.has_privacy()) {
        contact.privacy.share_presence = proto.privacy().share_presence();
        contact.privacy.share_read_receipts = proto.privacy().share_read_receipts();
        contact.privacy.share_typing = proto.privacy().share_typing();
        contact.privacy.allow_attachments = proto.privacy().allow_attachments();
    }
    contact.is_deleted = proto.is_deleted();
    contact.group_id = proto.group_id();
    return Result<Contact, TetherFailure>::Ok(std::move(contact));
}

std::string MakeConversationId(std::string_view device_a, std::string_view device_b) {
    const auto [low, high] = std::minmax(device_a, device_b);
    return fmt::format("{}{}_{}", InviteConstants::CONVERSATION_ID_PREFIX, low, high);
}

}
