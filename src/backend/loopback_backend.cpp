#include "tether/backend/loopback_backend.hpp"
#include "tether/debug/event_logger.hpp"

#include <fmt/core.h>

namespace tether::backend {

using interfaces::ConversationListener;
using interfaces::Receipt;
using interfaces::ReceiptKind;
using interfaces::SubscriptionId;

LoopbackBackend::LoopbackBackend(const interfaces::IClock& clock)
    : clock_(clock)
    , registry_(clock)
{
}

Result<Unit, TetherFailure> LoopbackBackend::RequireOnline(std::string_view operation) const {
    if (offline_.load()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::Backend(fmt::format("Relay unreachable during {}", operation)));
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> LoopbackBackend::CreateInvite(const models::Invite& invite) {
    if (auto online = RequireOnline("CreateInvite"); online.IsErr()) {
        return online;
    }
    return registry_.Register(invite);
}

Result<Unit, TetherFailure> LoopbackBackend::CreateGroupInvite(
    const models::Invite& invite,
    const models::GroupMarking& group) {

    if (auto online = RequireOnline("CreateGroupInvite"); online.IsErr()) {
        return online;
    }
    return registry_.RegisterGroup(invite, group);
}

Result<interfaces::InviteSnapshot, TetherFailure> LoopbackBackend::InspectInvite(std::string_view code) const {
    if (auto online = RequireOnline("InspectInvite"); online.IsErr()) {
        return Result<interfaces::InviteSnapshot, TetherFailure>::Err(std::move(online).UnwrapErr());
    }
    return registry_.Inspect(code);
}

Result<interfaces::RedeemOutcome, TetherFailure> LoopbackBackend::RedeemInvite(const interfaces::RedeemRequest& request) {
    if (auto online = RequireOnline("RedeemInvite"); online.IsErr()) {
        return Result<interfaces::RedeemOutcome, TetherFailure>::Err(std::move(online).UnwrapErr());
    }

    auto outcome = registry_.Redeem(request);
    if (outcome.IsErr()) {
        return outcome;
    }

    const auto& redeemed = outcome.Unwrap();
    interfaces::PairingNotice notice{request.code, request.redeemer, redeemed.conversation_id, redeemed.group};

    std::vector<interfaces::ContactListener> listeners;
    {
        std::lock_guard lock(mutex_);
        if (!redeemed.group.has_value()) {
            const auto now = clock_.Now();
            pairings_[redeemed.issuer.device_id].push_back(
                interfaces::PairingRecord{request.redeemer, redeemed.conversation_id, request.code, now});
            pairings_[request.redeemer.device_id].push_back(
                interfaces::PairingRecord{redeemed.issuer, redeemed.conversation_id, request.code, now});
        }
        for (const auto& [id, subscription] : contact_subscriptions_) {
            if (subscription.my_id == redeemed.issuer.device_id && subscription.listener) {
                listeners.push_back(subscription.listener);
            }
        }
    }
    for (const auto& listener : listeners) {
        listener(notice);
    }
    return outcome;
}

Result<std::vector<interfaces::PairingRecord>, TetherFailure> LoopbackBackend::ListPairings(
    std::string_view my_id) const {

    if (auto online = RequireOnline("ListPairings"); online.IsErr()) {
        return Result<std::vector<interfaces::PairingRecord>, TetherFailure>::Err(std::move(online).UnwrapErr());
    }
    std::lock_guard lock(mutex_);
    if (const auto it = pairings_.find(my_id); it != pairings_.end()) {
        return Result<std::vector<interfaces::PairingRecord>, TetherFailure>::Ok(it->second);
    }
    return Result<std::vector<interfaces::PairingRecord>, TetherFailure>::Ok({});
}

Result<Unit, TetherFailure> LoopbackBackend::BlockContact(std::string_view owner_id, std::string_view blocked_id) {
    if (auto online = RequireOnline("BlockContact"); online.IsErr()) {
        return online;
    }
    if (auto blocked = registry_.Block(owner_id, blocked_id); blocked.IsErr()) {
        return blocked;
    }
    std::lock_guard lock(mutex_);
    if (const auto it = pairings_.find(owner_id); it != pairings_.end()) {
        std::erase_if(it->second, [blocked_id](const interfaces::PairingRecord& record) {
            return record.peer.device_id == blocked_id;
        });
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<std::string, TetherFailure> LoopbackBackend::SendMessage(const interfaces::WireMessage& message) {
    if (auto online = RequireOnline("SendMessage"); online.IsErr()) {
        return Result<std::string, TetherFailure>::Err(std::move(online).UnwrapErr());
    }
    if (message.id.empty() || message.conversation_id.empty() || message.sender_id.empty()) {
        return Result<std::string, TetherFailure>::Err(
            TetherFailure::InvalidInput("Relayed message needs an id, conversation and sender"));
    }

    {
        std::lock_guard lock(mutex_);
        relayed_.push_back(message);
        message_senders_.insert_or_assign(message.id, message.sender_id);
    }
    for (const auto& listener : ListenersFor(message.conversation_id, message.sender_id)) {
        if (listener.on_message) {
            listener.on_message(message);
        }
    }
    return Result<std::string, TetherFailure>::Ok(message.id);
}

Result<Unit, TetherFailure> LoopbackBackend::FanOutReceipt(Receipt receipt) {
    for (const auto& listener : ListenersFor(receipt.conversation_id, receipt.from_id)) {
        if (listener.on_receipt) {
            listener.on_receipt(receipt);
        }
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> LoopbackBackend::AcknowledgeDelivery(
    std::string_view conversation_id,
    std::string_view message_id,
    std::string_view recipient_id) {

    if (auto online = RequireOnline("AcknowledgeDelivery"); online.IsErr()) {
        return online;
    }
    return FanOutReceipt(Receipt{ReceiptKind::Delivered, std::string(conversation_id),
                                 std::string(message_id), std::string(recipient_id)});
}

Result<Unit, TetherFailure> LoopbackBackend::SendSeenReceipt(
    std::string_view conversation_id,
    std::string_view message_id,
    std::string_view reader_id) {

    if (auto online = RequireOnline("SendSeenReceipt"); online.IsErr()) {
        return online;
    }
    return FanOutReceipt(Receipt{ReceiptKind::Seen, std::string(conversation_id),
                                 std::string(message_id), std::string(reader_id)});
}

Result<SubscriptionId, TetherFailure> LoopbackBackend::Subscribe(
    std::string_view conversation_id,
    std::string_view subscriber_id,
    ConversationListener listener) {

    if (conversation_id.empty() || subscriber_id.empty()) {
        return Result<SubscriptionId, TetherFailure>::Err(
            TetherFailure::InvalidInput("Subscription needs a conversation and a subscriber"));
    }
    std::lock_guard lock(mutex_);
    const SubscriptionId id = next_subscription_++;
    conversation_subscriptions_.emplace(id, ConversationSubscription{
        std::string(conversation_id), std::string(subscriber_id), std::move(listener)});
    TETHER_LOG_ID("relay", "subscribed", std::string(conversation_id));
    return Result<SubscriptionId, TetherFailure>::Ok(id);
}

Result<SubscriptionId, TetherFailure> LoopbackBackend::SubscribeToNewContacts(
    std::string_view my_id,
    interfaces::ContactListener listener) {

    if (my_id.empty() || !listener) {
        return Result<SubscriptionId, TetherFailure>::Err(
            TetherFailure::InvalidInput("Contact subscription needs a device id and a listener"));
    }
    std::lock_guard lock(mutex_);
    const SubscriptionId id = next_subscription_++;
    contact_subscriptions_.emplace(id, ContactSubscription{std::string(my_id), std::move(listener)});
    return Result<SubscriptionId, TetherFailure>::Ok(id);
}

void LoopbackBackend::Unsubscribe(const SubscriptionId id) {
    std::lock_guard lock(mutex_);
    conversation_subscriptions_.erase(id);
    contact_subscriptions_.erase(id);
}

Result<Unit, TetherFailure> LoopbackBackend::DeleteMessageForEveryone(
    std::string_view conversation_id,
    std::string_view message_id,
    std::string_view requester_id) {

    if (auto online = RequireOnline("DeleteMessageForEveryone"); online.IsErr()) {
        return online;
    }
    {
        std::lock_guard lock(mutex_);
        const auto it = message_senders_.find(message_id);
        if (it == message_senders_.end()) {
            return Result<Unit, TetherFailure>::Ok(unit);
        }
        if (it->second != requester_id) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::NotPermitted("Only the sender can delete a message for everyone"));
        }
        message_senders_.erase(it);
    }

    const interfaces::DeletionNotice notice{
        std::string(conversation_id), std::string(message_id), std::string(requester_id)};
    for (const auto& listener : ListenersFor(conversation_id, requester_id)) {
        if (listener.on_deletion) {
            listener.on_deletion(notice);
        }
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

std::vector<ConversationListener> LoopbackBackend::ListenersFor(
    std::string_view conversation_id,
    std::string_view excluded_id) const {

    std::lock_guard lock(mutex_);
    std::vector<ConversationListener> result;
    for (const auto& [id, subscription] : conversation_subscriptions_) {
        if (subscription.conversation_id == conversation_id && subscription.subscriber_id != excluded_id) {
            result.push_back(subscription.listener);
        }
    }
    return result;
}

std::vector<interfaces::WireMessage> LoopbackBackend::RelayedMessages() const {
    std::lock_guard lock(mutex_);
    return relayed_;
}

}
