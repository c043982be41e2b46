#include "tether/models/invite.hpp"

namespace tether::models {

Invite::Invite(
    std::string code,
    InviteIssuer issuer,
    const TimePoint created_at,
    const TimePoint expires_at,
    std::optional<std::string> group_id)
    : code_(std::move(code))
    , issuer_(std::move(issuer))
    , created_at_(created_at)
    , expires_at_(expires_at)
    , group_id_(std::move(group_id))
{
}

Result<Invite, TetherFailure> Invite::Create(
    std::string code,
    InviteIssuer issuer,
    const TimePoint created_at,
    const TimePoint expires_at,
    std::optional<std::string> group_id) {

    if (code.empty()) {
        return Result<Invite, TetherFailure>::Err(
            TetherFailure::InvalidInput("Invite code cannot be empty"));
    }
    if (issuer.device_id.empty() || issuer.public_key.empty()) {
        return Result<Invite, TetherFailure>::Err(
            TetherFailure::InvalidInput("Invite issuer needs a device id and key material"));
    }
    if (expires_at <= created_at) {
        return Result<Invite, TetherFailure>::Err(
            TetherFailure::InvalidInput("Invite must expire after it is created"));
    }
    if (group_id.has_value() && group_id->empty()) {
        return Result<Invite, TetherFailure>::Err(
            TetherFailure::InvalidInput("Group invite needs a group id"));
    }
    return Result<Invite, TetherFailure>::Ok(
        Invite(std::move(code), std::move(issuer), created_at, expires_at, std::move(group_id)));
}

Result<Invite, TetherFailure> Invite::FromProto(const proto::invite::InviteRecord& proto) {
    std::optional<std::string> group_id;
    if (proto.is_group_invite()) {
        group_id = proto.group_id();
    }
    auto created = Create(
        proto.code(),
        InviteIssuer{proto.issuer_device_id(), proto.issuer_user_id(),
                     proto.issuer_name(), proto.issuer_public_key()},
        FromProtoTimestamp(proto.created_at()),
        FromProtoTimestamp(proto.expires_at()),
        std::move(group_id));
    if (created.IsErr()) {
        return Result<Invite, TetherFailure>::Err(
            TetherFailure::Decode(std::move(created).UnwrapErr().message));
    }

    auto invite = std::move(created).Unwrap();
    invite.used_ = proto.used();
    if (!proto.used_by().empty()) {
        invite.used_by_ = proto.used_by();
    }
    return Result<Invite, TetherFailure>::Ok(std::move(invite));
}

bool Invite::IsActive(const TimePoint now) const noexcept {
    if (IsExpired(now)) {
        return false;
    }
    return IsGroupInvite() || !used_;
}

void Invite::MarkUsed(std::string used_by) {
    used_ = true;
    used_by_ = std::move(used_by);
}

proto::invite::InviteRecord Invite::ToProto() const {
    proto::invite::InviteRecord proto;
    proto.set_code(code_);
    proto.set_issuer_public_key(issuer_.public_key);
    proto.set_issuer_name(issuer_.name);
    proto.set_issuer_device_id(issuer_.device_id);
    proto.set_issuer_user_id(issuer_.user_id);
    *proto.mutable_created_at() = ToProtoTimestamp(created_at_);
    *proto.mutable_expires_at() = ToProtoTimestamp(expires_at_);
    proto.set_used(used_);
    if (used_by_.has_value()) {
        proto.set_used_by(*used_by_);
    }
    proto.set_is_group_invite(group_id_.has_value());
    if (group_id_.has_value()) {
        proto.set_group_id(*group_id_);
    }
    return proto;
}

}
