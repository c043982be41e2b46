#include "tether/messaging/event_hub.hpp"
#include <algorithm>

namespace tether::messaging {

HandlerToken EventHub::Subscribe(std::shared_ptr<interfaces::IMessengerEventHandler> handler) {
    if (!handler) {
        return 0;
    }
    std::lock_guard lock(mutex_);
    const HandlerToken token = next_token_++;
    handlers_.emplace_back(token, std::move(handler));
    return token;
}

void EventHub::Unsubscribe(const HandlerToken token) {
    std::lock_guard lock(mutex_);
    handlers_.erase(
        std::remove_if(handlers_.begin(), handlers_.end(),
                       [token](const Entry& entry) { return entry.first == token; }),
        handlers_.end());
}

size_t EventHub::HandlerCount() const {
    std::lock_guard lock(mutex_);
    return handlers_.size();
}

std::vector<EventHub::Entry> EventHub::Snapshot() const {
    std::lock_guard lock(mutex_);
    return handlers_;
}

void EventHub::PublishMessageReceived(const models::Message& message) const {
    for (const auto& [token, handler] : Snapshot()) {
        handler->OnMessageReceived(message);
    }
}

void EventHub::PublishMessageStateChanged(const models::Message& message) const {
    for (const auto& [token, handler] : Snapshot()) {
        handler->OnMessageStateChanged(message);
    }
}

void EventHub::PublishMessageDeleted(const std::string& conversation_id, const std::string& message_id) const {
    for (const auto& [token, handler] : Snapshot()) {
        handler->OnMessageDeleted(conversation_id, message_id);
    }
}

void EventHub::PublishContactUpdated(const models::Contact& contact) const {
    for (const auto& [token, handler] : Snapshot()) {
        handler->OnContactUpdated(contact);
    }
}

void EventHub::PublishInviteRotated(const models::Invite& invite) const {
    for (const auto& [token, handler] : Snapshot()) {
        handler->OnInviteRotated(invite);
    }
}

}
