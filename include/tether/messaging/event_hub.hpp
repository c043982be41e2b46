#pragma once
#include "tether/interfaces/i_messenger_event_handler.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace tether::messaging {

using HandlerToken = uint64_t;

/**
 * Fan-out of core events to registered handlers.
 *
 * Handlers are invoked outside the hub's lock on a snapshot of the
 * registration list, so a handler may subscribe or unsubscribe while an
 * event is being delivered.
 */
class EventHub {
public:
    /// Null handlers are ignored and get token 0.
    HandlerToken Subscribe(std::shared_ptr<interfaces::IMessengerEventHandler> handler);

    /// Unknown tokens are ignored.
    void Unsubscribe(HandlerToken token);

    [[nodiscard]] size_t HandlerCount() const;

    void PublishMessageReceived(const models::Message& message) const;
    void PublishMessageStateChanged(const models::Message& message) const;
    void PublishMessageDeleted(const std::string& conversation_id, const std::string& message_id) const;
    void PublishContactUpdated(const models::Contact& contact) const;
    void PublishInviteRotated(const models::Invite& invite) const;

private:
    using Entry = std::pair<HandlerToken, std::shared_ptr<interfaces::IMessengerEventHandler>>;

    [[nodiscard]] std::vector<Entry> Snapshot() const;

    mutable std::mutex mutex_;
    std::vector<Entry> handlers_;
    HandlerToken next_token_ = 1;
};

}
