#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/models/attachment_metadata.hpp"
#include "tether/models/proto_time.hpp"
#include "messaging/message_record.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tether::models {

/// Forward-only: Sending -> Sent -> Delivered -> Seen.
enum class MessageStatus {
    Sending = 0,
    Sent = 1,
    Delivered = 2,
    Seen = 3
};

/// How much the displayed text can be trusted.
enum class MessageAuthenticity {
    Authenticated,
    LegacyUnauthenticated,
    Plaintext,
    Undecryptable,
    Unverified
};

[[nodiscard]] std::string_view MessageStatusName(MessageStatus status) noexcept;

struct Message {
    std::string id;
    std::string conversation_id;
    std::string sender_id;
    std::string text;
    std::optional<AttachmentMetadata> attachment;
    TimePoint timestamp{};
    MessageStatus status = MessageStatus::Sending;
    bool is_own = false;
    uint32_t auto_delete_timer_minutes = 0;
    // Set only on entering Seen with a nonzero timer.
    std::optional<TimePoint> delete_at;
    MessageAuthenticity authenticity = MessageAuthenticity::Authenticated;
    // Applied locally, backend write still outstanding.
    bool sync_pending = false;
    std::optional<TimePoint> sent_at;

    [[nodiscard]] bool IsExpired(TimePoint now) const noexcept {
        return delete_at.has_value() && now >= *delete_at;
    }

    [[nodiscard]] proto::messaging::MessageRecord ToProto() const;

    [[nodiscard]] static Result<Message, TetherFailure> FromProto(
        const proto::messaging::MessageRecord& proto);
};

}
