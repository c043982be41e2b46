#pragma once
#include "tether/models/contact.hpp"
#include "tether/models/invite.hpp"
#include "tether/models/message.hpp"
#include <string>

namespace tether::interfaces {

/**
 * Receives state changes from the messaging core. Callbacks run on whatever
 * thread produced the change (caller, backend delivery or sweeper) and must
 * not call back into the core synchronously from OnMessageDeleted.
 */
class IMessengerEventHandler {
public:
    virtual ~IMessengerEventHandler() = default;

    virtual void OnMessageReceived(const models::Message& message) = 0;
    virtual void OnMessageStateChanged(const models::Message& message) = 0;
    virtual void OnMessageDeleted(const std::string& conversation_id, const std::string& message_id) = 0;
    virtual void OnContactUpdated(const models::Contact& contact) = 0;
    virtual void OnInviteRotated(const models::Invite& invite) = 0;
};

}
