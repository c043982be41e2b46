#include "tether/invite/invite_registry.hpp"
#include "tether/models/contact.hpp"
#include "tether/debug/event_logger.hpp"

#include <fmt/core.h>

namespace tether::invite {

InviteRegistry::InviteRegistry(const interfaces::IClock& clock)
    : clock_(clock)
{
}

Result<Unit, TetherFailure> InviteRegistry::Register(models::Invite invite) {
    if (invite.IsGroupInvite()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput("Group invites must be registered with their group"));
    }
    std::lock_guard lock(mutex_);
    if (invites_.contains(invite.GetCode())) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput(fmt::format("Invite code {} already registered", invite.GetCode())));
    }
    std::string code = invite.GetCode();
    invites_.emplace(std::move(code), std::move(invite));
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> InviteRegistry::RegisterGroup(models::Invite invite, models::GroupMarking group) {
    if (!invite.IsGroupInvite() || *invite.GetGroupId() != group.GetGroupId()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput("Group invite and group marking disagree on the group id"));
    }
    std::lock_guard lock(mutex_);
    if (invites_.contains(invite.GetCode())) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput(fmt::format("Invite code {} already registered", invite.GetCode())));
    }
    // A second invite for an existing group shares its membership.
    if (!groups_.contains(group.GetGroupId())) {
        std::string group_id = group.GetGroupId();
        groups_.emplace(std::move(group_id), std::move(group));
    }
    std::string code = invite.GetCode();
    invites_.emplace(std::move(code), std::move(invite));
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<interfaces::InviteSnapshot, TetherFailure> InviteRegistry::Inspect(std::string_view code) const {
    std::lock_guard lock(mutex_);
    const auto it = invites_.find(code);
    if (it == invites_.end()) {
        return Result<interfaces::InviteSnapshot, TetherFailure>::Err(
            TetherFailure::InvalidFormat(fmt::format("Invite {} is not known", code)));
    }
    std::optional<models::GroupMarking> group;
    if (it->second.IsGroupInvite()) {
        if (const auto g = groups_.find(*it->second.GetGroupId()); g != groups_.end()) {
            group = g->second;
        }
    }
    return Result<interfaces::InviteSnapshot, TetherFailure>::Ok(
        interfaces::InviteSnapshot{it->second, std::move(group)});
}

Result<interfaces::RedeemOutcome, TetherFailure> InviteRegistry::Redeem(const interfaces::RedeemRequest& request) {
    using Outcome = Result<interfaces::RedeemOutcome, TetherFailure>;

    if (request.redeemer.device_id.empty()) {
        return Outcome::Err(TetherFailure::InvalidInput("Redeemer has no device id"));
    }

    const auto now = clock_.Now();
    std::lock_guard lock(mutex_);

    const auto it = invites_.find(request.code);
    if (it == invites_.end()) {
        return Outcome::Err(TetherFailure::InvalidFormat(fmt::format("Invite {} is not known", request.code)));
    }
    models::Invite& invite = it->second;
    const models::InviteIssuer& issuer = invite.GetIssuer();

    if (invite.IsExpired(now)) {
        return Outcome::Err(TetherFailure::Expired(fmt::format("Invite {} has expired", invite.GetCode())));
    }

    if (!invite.IsGroupInvite()) {
        if (invite.IsUsed()) {
            return Outcome::Err(TetherFailure::AlreadyUsed(fmt::format("Invite {} was already used", invite.GetCode())));
        }
        if (request.redeemer.public_key == issuer.public_key || request.redeemer.device_id == issuer.device_id) {
            return Outcome::Err(TetherFailure::SelfPairingRejected("Cannot redeem an invite issued by this device"));
        }
        if (blocked_.contains({issuer.device_id, request.redeemer.device_id})
            || blocked_.contains({request.redeemer.device_id, issuer.device_id})) {
            return Outcome::Err(TetherFailure::ContactWasDeleted(
                fmt::format("Pairing behind invite {} was removed", invite.GetCode())));
        }

        invite.MarkUsed(request.redeemer.device_id);
        std::string conversation_id = request.conversation_override.value_or(
            models::MakeConversationId(issuer.device_id, request.redeemer.device_id));
        TETHER_LOG_ID("registry", "personal invite consumed", invite.GetCode());
        return Outcome::Ok(interfaces::RedeemOutcome{issuer, std::move(conversation_id), std::nullopt});
    }

    const auto group_it = groups_.find(*invite.GetGroupId());
    if (group_it == groups_.end()) {
        return Outcome::Err(TetherFailure::NotFound(
            fmt::format("Group {} behind invite {} is gone", *invite.GetGroupId(), invite.GetCode())));
    }
    models::GroupMarking& group = group_it->second;

    if (group.HasMember(request.redeemer.device_id)) {
        return Outcome::Err(TetherFailure::AlreadyJoined(
            fmt::format("Device already belongs to group {}", group.GetGroupId())));
    }
    if (group.IsFull()) {
        return Outcome::Err(TetherFailure::GroupFull(
            fmt::format("Group {} is full ({} joined)", group.GetGroupId(), group.GetMaxMembers())));
    }
    if (request.redeemer.public_key == issuer.public_key) {
        return Outcome::Err(TetherFailure::SelfPairingRejected("Cannot redeem an invite issued by this device"));
    }

    if (auto appended = group.AddMember(request.redeemer.device_id); appended.IsErr()) {
        return Outcome::Err(std::move(appended).UnwrapErr());
    }
    TETHER_LOG_VALUE("registry", "group members", group.GetMemberIds().size());
    return Outcome::Ok(interfaces::RedeemOutcome{issuer, group.GetGroupId(), group});
}

Result<Unit, TetherFailure> InviteRegistry::Block(std::string_view owner_id, std::string_view blocked_id) {
    if (owner_id.empty() || blocked_id.empty() || owner_id == blocked_id) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::InvalidInput("Block needs two distinct device ids"));
    }
    std::lock_guard lock(mutex_);
    blocked_.emplace(std::string(owner_id), std::string(blocked_id));
    return Result<Unit, TetherFailure>::Ok(unit);
}

bool InviteRegistry::IsBlocked(std::string_view owner_id, std::string_view other_id) const {
    std::lock_guard lock(mutex_);
    return blocked_.contains({std::string(owner_id), std::string(other_id)});
}

std::optional<models::GroupMarking> InviteRegistry::FindGroup(std::string_view group_id) const {
    std::lock_guard lock(mutex_);
    if (const auto it = groups_.find(group_id); it != groups_.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t InviteRegistry::InviteCount() const {
    std::lock_guard lock(mutex_);
    return invites_.size();
}

}
