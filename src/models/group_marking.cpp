#include "tether/models/group_marking.hpp"
#include "tether/core/constants.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <unordered_set>

namespace tether::models {

namespace {
    Result<Unit, TetherFailure> ValidateCapacity(const uint32_t max_members) {
        if (max_members < InviteConstants::MIN_GROUP_MEMBERS ||
            max_members > InviteConstants::MAX_GROUP_MEMBERS) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::InvalidInput(
                    fmt::format("Group capacity must be in [{}, {}], got {}",
                                InviteConstants::MIN_GROUP_MEMBERS,
                                InviteConstants::MAX_GROUP_MEMBERS, max_members)));
        }
        return Result<Unit, TetherFailure>::Ok(unit);
    }
}

GroupMarking::GroupMarking(
    std::string group_id,
    std::string creator_id,
    std::vector<std::string> member_ids,
    const uint32_t max_members,
    std::string name,
    const TimePoint created_at)
    : group_id_(std::move(group_id))
    , creator_id_(std::move(creator_id))
    , member_ids_(std::move(member_ids))
    , max_members_(max_members)
    , name_(std::move(name))
    , created_at_(created_at)
{
}

Result<GroupMarking, TetherFailure> GroupMarking::Create(
    std::string group_id,
    std::string creator_id,
    const uint32_t max_members,
    std::string name,
    const TimePoint created_at) {

    if (group_id.empty()) {
        return Result<GroupMarking, TetherFailure>::Err(
            TetherFailure::InvalidInput("Group id cannot be empty"));
    }
    if (creator_id.empty()) {
        return Result<GroupMarking, TetherFailure>::Err(
            TetherFailure::InvalidInput("Group creator id cannot be empty"));
    }
    if (name.size() > InviteConstants::MAX_GROUP_NAME_LENGTH) {
        return Result<GroupMarking, TetherFailure>::Err(
            TetherFailure::InvalidInput(fmt::format("Group name too long (maximum {} characters)",
                                                    InviteConstants::MAX_GROUP_NAME_LENGTH)));
    }
    if (auto capacity = ValidateCapacity(max_members); capacity.IsErr()) {
        return Result<GroupMarking, TetherFailure>::Err(std::move(capacity).UnwrapErr());
    }

    std::vector<std::string> members{creator_id};
    return Result<GroupMarking, TetherFailure>::Ok(
        GroupMarking(std::move(group_id), std::move(creator_id), std::move(members),
                     max_members, std::move(name), created_at));
}

Result<GroupMarking, TetherFailure> GroupMarking::FromProto(const proto::invite::GroupMarking& proto) {
    if (proto.group_id().empty() || proto.creator_id().empty()) {
        return Result<GroupMarking, TetherFailure>::Err(
            TetherFailure::Decode("Group marking is missing its id or creator"));
    }
    if (auto capacity = ValidateCapacity(proto.max_members()); capacity.IsErr()) {
        return Result<GroupMarking, TetherFailure>::Err(
            TetherFailure::Decode(std::move(capacity).UnwrapErr().message));
    }

    std::vector<std::string> members;
    std::unordered_set<std::string> seen;
    for (const auto& member : proto.member_ids()) {
        if (seen.insert(member).second) {
            members.push_back(member);
        }
    }
    const bool creator_listed =
        std::find(members.begin(), members.end(), proto.creator_id()) != members.end();
    if (members.size() - (creator_listed ? 1 : 0) > proto.max_members()) {
        return Result<GroupMarking, TetherFailure>::Err(
            TetherFailure::Decode("Group marking holds more members than its capacity"));
    }

    return Result<GroupMarking, TetherFailure>::Ok(
        GroupMarking(proto.group_id(), proto.creator_id(), std::move(members),
                     proto.max_members(), proto.name(), FromProtoTimestamp(proto.created_at())));
}

bool GroupMarking::HasMember(std::string_view member_id) const {
    return std::find(member_ids_.begin(), member_ids_.end(), member_id) != member_ids_.end();
}

size_t GroupMarking::JoinedCount() const {
    return HasMember(creator_id_) ? member_ids_.size() - 1 : member_ids_.size();
}

bool GroupMarking::IsFull() const {
    return JoinedCount() >= max_members_;
}

Result<Unit, TetherFailure> GroupMarking::AddMember(std::string member_id) {
    if (HasMember(member_id)) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::AlreadyJoined(
                fmt::format("Device already joined group {}", group_id_)));
    }
    if (IsFull()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::GroupFull(
                fmt::format("Group {} is full ({} joined)", group_id_, max_members_)));
    }
    member_ids_.push_back(std::move(member_id));
    return Result<Unit, TetherFailure>::Ok(unit);
}

proto::invite::GroupMarking GroupMarking::ToProto() const {
    proto::invite::GroupMarking proto;
    proto.set_group_id(group_id_);
    proto.set_creator_id(creator_id_);
    for (const auto& member : member_ids_) {
        proto.add_member_ids(member);
    }
    proto.set_max_members(max_members_);
    *proto.mutable_created_at() = ToProtoTimestamp(created_at_);
    proto.set_name(name_);
    return proto;
}

}
