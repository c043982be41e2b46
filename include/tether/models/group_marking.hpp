#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/models/proto_time.hpp"
#include "invite/invite_payload.pb.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tether::models {

/**
 * Membership of one group conversation. The single source of truth for who
 * has joined: group invites refer to it by group id and never carry their own
 * copy of the member list.
 *
 * member_ids keeps join order and holds no duplicates. The creator is the
 * first member; max_members caps the devices that join through the invite,
 * so a full group lists max_members + 1 ids.
 */
class GroupMarking {
public:
    [[nodiscard]] static Result<GroupMarking, TetherFailure> Create(
        std::string group_id,
        std::string creator_id,
        uint32_t max_members,
        std::string name,
        TimePoint created_at);

    [[nodiscard]] static Result<GroupMarking, TetherFailure> FromProto(
        const proto::invite::GroupMarking& proto);

    [[nodiscard]] const std::string& GetGroupId() const noexcept { return group_id_; }
    [[nodiscard]] const std::string& GetCreatorId() const noexcept { return creator_id_; }
    [[nodiscard]] const std::string& GetName() const noexcept { return name_; }
    [[nodiscard]] const std::vector<std::string>& GetMemberIds() const noexcept { return member_ids_; }
    [[nodiscard]] uint32_t GetMaxMembers() const noexcept { return max_members_; }
    [[nodiscard]] TimePoint GetCreatedAt() const noexcept { return created_at_; }

    [[nodiscard]] bool HasMember(std::string_view member_id) const;
    /// Members other than the creator.
    [[nodiscard]] size_t JoinedCount() const;
    [[nodiscard]] bool IsFull() const;

    /// Fails AlreadyJoined for a repeat member, GroupFull at capacity.
    Result<Unit, TetherFailure> AddMember(std::string member_id);

    [[nodiscard]] proto::invite::GroupMarking ToProto() const;

private:
    GroupMarking(
        std::string group_id,
        std::string creator_id,
        std::vector<std::string> member_ids,
        uint32_t max_members,
        std::string name,
        TimePoint created_at);

    std::string group_id_;
    std::string creator_id_;
    std::vector<std::string> member_ids_;
    uint32_t max_members_;
    std::string name_;
    TimePoint created_at_;
};

}
