#include "tether/invite/invite_codec.hpp"
#include "tether/core/constants.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/debug/event_logger.hpp"
#include "invite/invite_payload.pb.h"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <fmt/core.h>
#include <cctype>

namespace tether::invite {

using crypto::Base64Variant;
using crypto::SodiumInterop;

namespace {
    std::string_view TrimWhitespace(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
            text.remove_suffix(1);
        }
        return text;
    }
}

InvitePayload InvitePayload::FromInvite(
    const models::Invite& invite,
    const std::optional<models::GroupMarking>& group) {

    InvitePayload payload;
    payload.version = WireFormatConstants::QR_PAYLOAD_VERSION;
    payload.code = invite.GetCode();
    payload.public_key = invite.GetIssuer().public_key;
    payload.name = invite.GetIssuer().name;
    payload.expires_at = invite.GetExpiresAt();
    payload.device_id = invite.GetIssuer().device_id;
    payload.user_id = invite.GetIssuer().user_id;
    if (invite.IsGroupInvite()) {
        payload.is_group_invite = true;
        payload.group_id = *invite.GetGroupId();
        payload.group_creator_name = invite.GetIssuer().name;
        if (group.has_value()) {
            payload.group_max_members = group->GetMaxMembers();
        }
    }
    return payload;
}

models::InviteIssuer InvitePayload::Issuer() const {
    return models::InviteIssuer{device_id, user_id, name, public_key};
}

Result<std::string, TetherFailure> InviteCodec::Encode(const InvitePayload& payload) {
    if (auto valid = RequireCoreFields(payload); valid.IsErr()) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::Encode(std::move(valid).UnwrapErr().message));
    }

    proto::invite::InvitePayload proto;
    proto.set_version(WireFormatConstants::QR_PAYLOAD_VERSION);
    proto.set_code(payload.code);
    proto.set_public_key(payload.public_key);
    proto.set_name(payload.name);
    *proto.mutable_expires_at() = models::ToProtoTimestamp(payload.expires_at);
    proto.set_device_id(payload.device_id);
    proto.set_user_id(payload.user_id);
    if (payload.is_group_invite) {
        proto.set_is_group_invite(true);
        proto.set_group_id(payload.group_id);
        proto.set_group_max_members(payload.group_max_members);
        proto.set_group_creator_name(payload.group_creator_name);
    }

    std::string bytes;
    if (!proto.SerializeToString(&bytes)) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::Encode("Failed to serialize invite payload"));
    }

    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    std::string encoded(WireFormatConstants::QR_V2_PREFIX);
    encoded += SodiumInterop::ToBase64(std::span<const uint8_t>(data, bytes.size()),
                                       Base64Variant::UrlSafeNoPadding);
    return Result<std::string, TetherFailure>::Ok(std::move(encoded));
}

Result<InvitePayload, TetherFailure> InviteCodec::Decode(std::string_view scanned, const models::TimePoint now) {
    const std::string_view text = TrimWhitespace(scanned);
    if (text.empty()) {
        return Result<InvitePayload, TetherFailure>::Err(
            TetherFailure::InvalidFormat("Scanned invite is empty"));
    }

    if (text.starts_with(WireFormatConstants::QR_V2_PREFIX)) {
        return DecodeV2(text.substr(WireFormatConstants::QR_V2_PREFIX.size()));
    }
    if (text.front() == '{') {
        return DecodeLegacyJson(text, now);
    }

    TETHER_LOG_MSG("invite", "scanned text matches no payload generation");
    return Result<InvitePayload, TetherFailure>::Err(
        TetherFailure::InvalidFormat("Scanned text is not a Tether invite"));
}

Result<InvitePayload, TetherFailure> InviteCodec::DecodeV2(std::string_view body) {
    auto bytes = SodiumInterop::FromBase64(body, Base64Variant::UrlSafeNoPadding);
    if (bytes.IsErr()) {
        return Result<InvitePayload, TetherFailure>::Err(
            TetherFailure::InvalidFormat("Invite payload is not valid base64url"));
    }
    const auto& raw = bytes.Unwrap();

    proto::invite::InvitePayload proto;
    if (!proto.ParseFromArray(raw.data(), static_cast<int>(raw.size()))) {
        return Result<InvitePayload, TetherFailure>::Err(
            TetherFailure::InvalidFormat("Invite payload does not parse"));
    }
    if (proto.version() != WireFormatConstants::QR_PAYLOAD_VERSION) {
        return Result<InvitePayload, TetherFailure>::Err(
            TetherFailure::InvalidFormat(fmt::format("Unsupported invite payload version {}", proto.version())));
    }
    if (!proto.has_expires_at()) {
        return Result<InvitePayload, TetherFailure>::Err(
            TetherFailure::InvalidFormat("Invite payload carries no expiry"));
    }

    InvitePayload payload;
    payload.version = proto.version();
    payload.code = proto.code();
    payload.public_key = proto.public_key();
    payload.name = proto.name();
    payload.expires_at = models::FromProtoTimestamp(proto.expires_at());
    payload.device_id = proto.device_id();
    payload.user_id = proto.user_id();
    payload.is_group_invite = proto.is_group_invite();
    payload.group_id = proto.group_id();
    payload.group_max_members = proto.group_max_members();
    payload.group_creator_name = proto.group_creator_name();

    if (auto valid = RequireCoreFields(payload); valid.IsErr()) {
        return Result<InvitePayload, TetherFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<InvitePayload, TetherFailure>::Ok(std::move(payload));
}

Result<InvitePayload, TetherFailure> InviteCodec::DecodeLegacyJson(std::string_view json, const models::TimePoint now) {
    proto::invite::LegacyInvitePayload legacy;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &legacy, options);
    if (!status.ok()) {
        return Result<InvitePayload, TetherFailure>::Err(
            TetherFailure::InvalidFormat("Invite JSON does not match the v1 layout"));
    }

    InvitePayload payload;
    payload.version = 1;
    payload.code = legacy.code();
    payload.public_key = legacy.public_key();
    payload.name = legacy.name();
    payload.device_id = legacy.device_id();
    payload.user_id = legacy.user_id();
    payload.is_group_invite = legacy.is_group_invite();
    payload.group_id = legacy.group_id();
    payload.group_max_members = legacy.group_max_members() > 0
        ? static_cast<uint32_t>(legacy.group_max_members())
        : 0;
    payload.group_creator_name = legacy.group_creator_name();

    if (!legacy.expires_at().empty()) {
        google::protobuf::Timestamp expires_at;
        if (!google::protobuf::util::TimeUtil::FromString(legacy.expires_at(), &expires_at)) {
            return Result<InvitePayload, TetherFailure>::Err(
                TetherFailure::InvalidFormat("Invite expiresAt is not an RFC 3339 time"));
        }
        payload.expires_at = models::FromProtoTimestamp(expires_at);
    } else if (legacy.timestamp() > 0) {
        payload.expires_at = models::TimePoint(std::chrono::milliseconds(legacy.timestamp()))
            + InviteConstants::DEFAULT_INVITE_TTL;
    } else {
        payload.expires_at = now + InviteConstants::DEFAULT_INVITE_TTL;
    }

    if (auto valid = RequireCoreFields(payload); valid.IsErr()) {
        return Result<InvitePayload, TetherFailure>::Err(std::move(valid).UnwrapErr());
    }
    TETHER_LOG_ID("invite", "decoded legacy invite", payload.code);
    return Result<InvitePayload, TetherFailure>::Ok(std::move(payload));
}

Result<Unit, TetherFailure> InviteCodec::RequireCoreFields(const InvitePayload& payload) {
    if (payload.code.empty() || payload.public_key.empty() || payload.name.empty()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidFormat("Invite payload needs code, publicKey and name"));
    }
    if (payload.is_group_invite && payload.group_id.empty()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidFormat("Group invite payload carries no group id"));
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

}
