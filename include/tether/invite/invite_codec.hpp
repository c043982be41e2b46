#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/models/group_marking.hpp"
#include "tether/models/invite.hpp"
#include "tether/models/proto_time.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tether::invite {

/// The fields a scanner learns from a QR code.
struct InvitePayload {
    uint32_t version = 0;
    std::string code;
    std::string public_key;
    std::string name;
    models::TimePoint expires_at{};
    std::string device_id;
    std::string user_id;
    bool is_group_invite = false;
    std::string group_id;
    uint32_t group_max_members = 0;
    std::string group_creator_name;

    [[nodiscard]] static InvitePayload FromInvite(
        const models::Invite& invite,
        const std::optional<models::GroupMarking>& group = std::nullopt);

    [[nodiscard]] models::InviteIssuer Issuer() const;
};

/**
 * QR payload codec.
 *
 *   v2: "TQ2:" + base64url_nopad(InvitePayload protobuf)
 *   v1: the earlier JSON object, {"code","publicKey","name","expiresAt",...}
 *
 * Encode always writes v2. Decode tries each known generation and only
 * fails with InvalidFormat when none of them matches. A v1 payload without
 * an expiry is given one invite lifetime from its creation timestamp, or
 * from now when that is missing too.
 */
class InviteCodec {
public:
    [[nodiscard]] static Result<std::string, TetherFailure> Encode(const InvitePayload& payload);

    [[nodiscard]] static Result<InvitePayload, TetherFailure> Decode(
        std::string_view scanned,
        models::TimePoint now);

    InviteCodec() = delete;

private:
    [[nodiscard]] static Result<InvitePayload, TetherFailure> DecodeV2(std::string_view body);
    [[nodiscard]] static Result<InvitePayload, TetherFailure> DecodeLegacyJson(
        std::string_view json,
        models::TimePoint now);
    [[nodiscard]] static Result<Unit, TetherFailure> RequireCoreFields(const InvitePayload& payload);
};

}
