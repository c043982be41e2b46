#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/models/proto_time.hpp"
#include "ledger/ledger_state.pb.h"
#include <string>
#include <string_view>

namespace tether::models {

enum class ContactStatus {
    Offline,
    Online,
    Away
};

/// What the remote party lets this device see.
struct PrivacySettings {
    bool share_presence = true;
    bool share_read_receipts = true;
    bool share_typing = true;
    bool allow_attachments = true;

    bool operator==(const PrivacySettings&) const = default;
};

/**
 * A paired remote device. id is the remote device id and is globally unique;
 * once tombstoned it is never re-added.
 */
struct Contact {
    std::string id;
    std::string contact_user_id;
    std::string name;
    std::string public_key;
    std::string pairing_code;
    std::string conversation_id;
    TimePoint paired_at{};
    ContactStatus status = ContactStatus::Offline;
    bool is_verified = false;
    PrivacySettings privacy;
    bool is_deleted = false;
    // Non-empty for a group conversation entry.
    std::string group_id;

    [[nodiscard]] proto::ledger::ContactRecord ToProto() const;

    [[nodiscard]] static Result<Contact, TetherFailure> FromProto(const proto::ledger::ContactRecord& proto);
};

/// "conv_" + the two device ids sorted and joined with '_'.
[[nodiscard]] std::string MakeConversationId(std::string_view device_a, std::string_view device_b);

}
