#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/models/group_marking.hpp"
#include "tether/models/invite.hpp"
#include "tether/models/proto_time.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::interfaces {

using SubscriptionId = uint64_t;

/// What the registry currently knows about one invite code.
struct InviteSnapshot {
    models::Invite invite;
    // Present for group invites.
    std::optional<models::GroupMarking> group;
};

struct RedeemRequest {
    std::string code;
    models::InviteIssuer redeemer;
    // Conversation id the redeemer will use; forwarded to the issuer so both sides agree.
    std::optional<std::string> conversation_override;
};

struct RedeemOutcome {
    models::InviteIssuer issuer;
    std::string conversation_id;
    // Membership after the append, for group invites.
    std::optional<models::GroupMarking> group;
};

/// Delivered to an issuer when someone redeems one of its invites.
struct PairingNotice {
    std::string invite_code;
    models::InviteIssuer redeemer;
    std::string conversation_id;
    std::optional<models::GroupMarking> group;
};

/// A personal pairing the relay brokered, as seen from one of its two sides.
struct PairingRecord {
    models::InviteIssuer peer;
    std::string conversation_id;
    std::string invite_code;
    models::TimePoint paired_at{};
};

/// An opaque envelope travelling through the relay.
struct WireMessage {
    std::string id;
    std::string conversation_id;
    std::string sender_id;
    std::string payload;
    bool encrypted = true;
    models::TimePoint sent_at{};
    uint32_t auto_delete_timer_minutes = 0;
};

enum class ReceiptKind {
    Delivered,
    Seen
};

struct Receipt {
    ReceiptKind kind = ReceiptKind::Delivered;
    std::string conversation_id;
    std::string message_id;
    std::string from_id;
};

struct DeletionNotice {
    std::string conversation_id;
    std::string message_id;
    std::string requester_id;
};

/// Per-conversation callbacks. Unset members are skipped.
struct ConversationListener {
    std::function<void(const WireMessage&)> on_message;
    std::function<void(const Receipt&)> on_receipt;
    std::function<void(const DeletionNotice&)> on_deletion;
};

using ContactListener = std::function<void(const PairingNotice&)>;

/**
 * The realtime relay. Owns the authoritative invite registry and fans
 * messages, receipts and deletions out to subscribed devices. Delivery is
 * at-least-once; a device never receives its own messages back.
 *
 * RedeemInvite is the only place group capacity is enforced atomically.
 */
class IBackend {
public:
    virtual ~IBackend() = default;

    [[nodiscard]] virtual Result<Unit, TetherFailure> CreateInvite(const models::Invite& invite) = 0;

    [[nodiscard]] virtual Result<Unit, TetherFailure> CreateGroupInvite(
        const models::Invite& invite,
        const models::GroupMarking& group) = 0;

    [[nodiscard]] virtual Result<InviteSnapshot, TetherFailure> InspectInvite(std::string_view code) const = 0;

    [[nodiscard]] virtual Result<RedeemOutcome, TetherFailure> RedeemInvite(const RedeemRequest& request) = 0;

    /// Personal pairings involving my_id that the owner has not blocked since.
    [[nodiscard]] virtual Result<std::vector<PairingRecord>, TetherFailure> ListPairings(
        std::string_view my_id) const = 0;

    /**
     * owner_id removed blocked_id. From now on personal redemptions between
     * the two fail with ContactWasDeleted before any invite is consumed.
     */
    [[nodiscard]] virtual Result<Unit, TetherFailure> BlockContact(
        std::string_view owner_id,
        std::string_view blocked_id) = 0;

    /// Returns the relay-side message id.
    [[nodiscard]] virtual Result<std::string, TetherFailure> SendMessage(const WireMessage& message) = 0;

    [[nodiscard]] virtual Result<Unit, TetherFailure> AcknowledgeDelivery(
        std::string_view conversation_id,
        std::string_view message_id,
        std::string_view recipient_id) = 0;

    [[nodiscard]] virtual Result<Unit, TetherFailure> SendSeenReceipt(
        std::string_view conversation_id,
        std::string_view message_id,
        std::string_view reader_id) = 0;

    [[nodiscard]] virtual Result<SubscriptionId, TetherFailure> Subscribe(
        std::string_view conversation_id,
        std::string_view subscriber_id,
        ConversationListener listener) = 0;

    [[nodiscard]] virtual Result<SubscriptionId, TetherFailure> SubscribeToNewContacts(
        std::string_view my_id,
        ContactListener listener) = 0;

    virtual void Unsubscribe(SubscriptionId id) = 0;

    /// Only the original sender may delete for everyone; others get NotPermitted.
    [[nodiscard]] virtual Result<Unit, TetherFailure> DeleteMessageForEveryone(
        std::string_view conversation_id,
        std::string_view message_id,
        std::string_view requester_id) = 0;
};

}
