#pragma once
#include "tether/interfaces/i_messenger_event_handler.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tether::test {

/// Event handler that keeps a copy of everything it was told.
class RecordingEventHandler final : public interfaces::IMessengerEventHandler {
public:
    void OnMessageReceived(const models::Message& message) override {
        std::lock_guard lock(mutex_);
        received_.push_back(message);
    }

    void OnMessageStateChanged(const models::Message& message) override {
        std::lock_guard lock(mutex_);
        state_changes_.push_back(message);
    }

    void OnMessageDeleted(const std::string& conversation_id, const std::string& message_id) override {
        std::lock_guard lock(mutex_);
        deleted_.emplace_back(conversation_id, message_id);
    }

    void OnContactUpdated(const models::Contact& contact) override {
        std::lock_guard lock(mutex_);
        contacts_.push_back(contact);
    }

    void OnInviteRotated(const models::Invite& invite) override {
        std::lock_guard lock(mutex_);
        rotated_codes_.push_back(invite.GetCode());
    }

    std::vector<models::Message> Received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

    std::vector<models::Message> StateChanges() const {
        std::lock_guard lock(mutex_);
        return state_changes_;
    }

    std::vector<std::pair<std::string, std::string>> Deleted() const {
        std::lock_guard lock(mutex_);
        return deleted_;
    }

    std::vector<models::Contact> ContactUpdates() const {
        std::lock_guard lock(mutex_);
        return contacts_;
    }

    std::vector<std::string> RotatedCodes() const {
        std::lock_guard lock(mutex_);
        return rotated_codes_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<models::Message> received_;
    std::vector<models::Message> state_changes_;
    std::vector<std::pair<std::string, std::string>> deleted_;
    std::vector<models::Contact> contacts_;
    std::vector<std::string> rotated_codes_;
};

}
