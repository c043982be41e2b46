#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/models/proto_time.hpp"
#include "invite/invite_payload.pb.h"
#include <optional>
#include <string>

namespace tether::models {

/// The issuing device as it appears inside an invite.
struct InviteIssuer {
    std::string device_id;
    std::string user_id;
    std::string name;
    std::string public_key;
};

/**
 * A time-boxed pairing token.
 *
 * Personal invites flip to used on their first redemption. Group invites
 * stay unused; their capacity lives in the GroupMarking named by group_id.
 */
class Invite {
public:
    [[nodiscard]] static Result<Invite, TetherFailure> Create(
        std::string code,
        InviteIssuer issuer,
        TimePoint created_at,
        TimePoint expires_at,
        std::optional<std::string> group_id = std::nullopt);

    [[nodiscard]] static Result<Invite, TetherFailure> FromProto(const proto::invite::InviteRecord& proto);

    [[nodiscard]] const std::string& GetCode() const noexcept { return code_; }
    [[nodiscard]] const InviteIssuer& GetIssuer() const noexcept { return issuer_; }
    [[nodiscard]] TimePoint GetCreatedAt() const noexcept { return created_at_; }
    [[nodiscard]] TimePoint GetExpiresAt() const noexcept { return expires_at_; }
    [[nodiscard]] bool IsUsed() const noexcept { return used_; }
    [[nodiscard]] const std::optional<std::string>& GetUsedBy() const noexcept { return used_by_; }
    [[nodiscard]] bool IsGroupInvite() const noexcept { return group_id_.has_value(); }
    [[nodiscard]] const std::optional<std::string>& GetGroupId() const noexcept { return group_id_; }

    [[nodiscard]] bool IsExpired(TimePoint now) const noexcept { return now >= expires_at_; }

    /// Active means redeemable as far as this record knows: unexpired and, if personal, unused.
    [[nodiscard]] bool IsActive(TimePoint now) const noexcept;

    void MarkUsed(std::string used_by);

    [[nodiscard]] proto::invite::InviteRecord ToProto() const;

private:
    Invite(std::string code, InviteIssuer issuer, TimePoint created_at, TimePoint expires_at,
           std::optional<std::string> group_id);

    std::string code_;
    InviteIssuer issuer_;
    TimePoint created_at_;
    TimePoint expires_at_;
    bool used_ = false;
    std::optional<std::string> used_by_;
    std::optional<std::string> group_id_;
};

}
