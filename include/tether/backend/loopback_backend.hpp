#pragma once
#include "tether/interfaces/i_backend.hpp"
#include "tether/interfaces/i_clock.hpp"
#include "tether/invite/invite_registry.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tether::backend {

/**
 * In-process relay for tests, demos and single-process embedding.
 *
 * Delivery is synchronous on the caller's thread and happens outside the
 * relay's lock, so a listener may call straight back into the relay.
 * SetOffline makes every write fail with a Backend failure, which is how
 * tests reach the "applied locally, sync pending" paths.
 */
class LoopbackBackend final : public interfaces::IBackend {
public:
    explicit LoopbackBackend(const interfaces::IClock& clock);

    [[nodiscard]] Result<Unit, TetherFailure> CreateInvite(const models::Invite& invite) override;
    [[nodiscard]] Result<Unit, TetherFailure> CreateGroupInvite(
        const models::Invite& invite,
        const models::GroupMarking& group) override;
    [[nodiscard]] Result<interfaces::InviteSnapshot, TetherFailure> InspectInvite(std::string_view code) const override;
    [[nodiscard]] Result<interfaces::RedeemOutcome, TetherFailure> RedeemInvite(
        const interfaces::RedeemRequest& request) override;
    [[nodiscard]] Result<std::vector<interfaces::PairingRecord>, TetherFailure> ListPairings(
        std::string_view my_id) const override;
    [[nodiscard]] Result<Unit, TetherFailure> BlockContact(
        std::string_view owner_id,
        std::string_view blocked_id) override;

    [[nodiscard]] Result<std::string, TetherFailure> SendMessage(const interfaces::WireMessage& message) override;
    [[nodiscard]] Result<Unit, TetherFailure> AcknowledgeDelivery(
        std::string_view conversation_id,
        std::string_view message_id,
        std::string_view recipient_id) override;
    [[nodiscard]] Result<Unit, TetherFailure> SendSeenReceipt(
        std::string_view conversation_id,
        std::string_view message_id,
        std::string_view reader_id) override;

    [[nodiscard]] Result<interfaces::SubscriptionId, TetherFailure> Subscribe(
        std::string_view conversation_id,
        std::string_view subscriber_id,
        interfaces::ConversationListener listener) override;
    [[nodiscard]] Result<interfaces::SubscriptionId, TetherFailure> SubscribeToNewContacts(
        std::string_view my_id,
        interfaces::ContactListener listener) override;
    void Unsubscribe(interfaces::SubscriptionId id) override;

    [[nodiscard]] Result<Unit, TetherFailure> DeleteMessageForEveryone(
        std::string_view conversation_id,
        std::string_view message_id,
        std::string_view requester_id) override;

    void SetOffline(bool offline) noexcept { offline_.store(offline); }
    [[nodiscard]] bool IsOffline() const noexcept { return offline_.load(); }

    [[nodiscard]] const invite::InviteRegistry& Registry() const noexcept { return registry_; }

    /// Envelopes relayed so far, in send order.
    [[nodiscard]] std::vector<interfaces::WireMessage> RelayedMessages() const;

private:
    struct ConversationSubscription {
        std::string conversation_id;
        std::string subscriber_id;
        interfaces::ConversationListener listener;
    };

    struct ContactSubscription {
        std::string my_id;
        interfaces::ContactListener listener;
    };

    [[nodiscard]] Result<Unit, TetherFailure> RequireOnline(std::string_view operation) const;

    /// Listeners of a conversation other than the excluded device.
    [[nodiscard]] std::vector<interfaces::ConversationListener> ListenersFor(
        std::string_view conversation_id,
        std::string_view excluded_id) const;

    [[nodiscard]] Result<Unit, TetherFailure> FanOutReceipt(interfaces::Receipt receipt);

    const interfaces::IClock& clock_;
    invite::InviteRegistry registry_;
    std::atomic<bool> offline_{false};

    mutable std::mutex mutex_;
    interfaces::SubscriptionId next_subscription_ = 1;
    std::map<interfaces::SubscriptionId, ConversationSubscription> conversation_subscriptions_;
    std::map<interfaces::SubscriptionId, ContactSubscription> contact_subscriptions_;
    std::vector<interfaces::WireMessage> relayed_;
    std::map<std::string, std::string, std::less<>> message_senders_;
    // device id -> pairings it took part in
    std::map<std::string, std::vector<interfaces::PairingRecord>, std::less<>> pairings_;
};

}
