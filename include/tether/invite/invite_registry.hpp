#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/interfaces/i_backend.hpp"
#include "tether/interfaces/i_clock.hpp"
#include "tether/models/group_marking.hpp"
#include "tether/models/invite.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace tether::invite {

/**
 * Authoritative store of issued invites and group membership.
 *
 * All checks and the resulting mutation in Redeem happen under one lock, so
 * two redeemers racing for the last group seat cannot both get it. A group
 * invite holds only a group id; the member list lives in exactly one
 * GroupMarking here.
 */
class InviteRegistry {
public:
    explicit InviteRegistry(const interfaces::IClock& clock);

    [[nodiscard]] Result<Unit, TetherFailure> Register(models::Invite invite);

    [[nodiscard]] Result<Unit, TetherFailure> RegisterGroup(models::Invite invite, models::GroupMarking group);

    [[nodiscard]] Result<interfaces::InviteSnapshot, TetherFailure> Inspect(std::string_view code) const;

    /**
     * Check-and-commit one redemption.
     *
     * Unknown code -> InvalidFormat, then Expired, AlreadyUsed (personal),
     * AlreadyJoined / GroupFull (group), SelfPairingRejected, and
     * ContactWasDeleted when either side of a personal pairing blocked the other.
     */
    [[nodiscard]] Result<interfaces::RedeemOutcome, TetherFailure> Redeem(const interfaces::RedeemRequest& request);

    [[nodiscard]] Result<Unit, TetherFailure> Block(std::string_view owner_id, std::string_view blocked_id);

    [[nodiscard]] bool IsBlocked(std::string_view owner_id, std::string_view other_id) const;

    [[nodiscard]] std::optional<models::GroupMarking> FindGroup(std::string_view group_id) const;

    [[nodiscard]] size_t InviteCount() const;

private:
    const interfaces::IClock& clock_;
    mutable std::mutex mutex_;
    std::map<std::string, models::Invite, std::less<>> invites_;
    std::map<std::string, models::GroupMarking, std::less<>> groups_;
    std::set<std::pair<std::string, std::string>> blocked_;
};

}
