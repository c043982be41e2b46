#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/configuration/messenger_config.hpp"
#include "tether/contacts/contact_ledger.hpp"
#include "tether/identity/identity_store.hpp"
#include "tether/interfaces/i_backend.hpp"
#include "tether/interfaces/i_clock.hpp"
#include "tether/interfaces/i_key_value_store.hpp"
#include "tether/interfaces/i_messenger_event_handler.hpp"
#include "tether/invite/invite_protocol.hpp"
#include "tether/messaging/event_hub.hpp"
#include "tether/messaging/message_lifecycle_engine.hpp"
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tether::system {

/**
 * @brief One device's messenger: identity, ledger, invites and messaging
 *
 * Owns the components and wires them to the relay. Every conversation in
 * the ledger is subscribed on creation, and pairing notices for this device
 * are routed to the invite protocol. The store, relay and clock are
 * borrowed and must outlive the system.
 *
 * @code
 * auto alice = MessengerSystem::Create(store, relay, clock, "Alice").Unwrap();
 * auto invite = alice->IssuePersonalInvite().Unwrap();
 * auto qr = alice->EncodeInvite(invite).Unwrap();
 * auto contact = bob->RedeemInvite(qr).Unwrap();
 * bob->SendText(contact.id, "hello");
 * @endcode
 */
class MessengerSystem {
public:
    [[nodiscard]] static Result<std::unique_ptr<MessengerSystem>, TetherFailure> Create(
        interfaces::IKeyValueStore& store,
        interfaces::IBackend& backend,
        const interfaces::IClock& clock,
        std::string display_name,
        configuration::MessengerConfig config = configuration::MessengerConfig::Default());

    ~MessengerSystem();

    MessengerSystem(const MessengerSystem&) = delete;
    MessengerSystem& operator=(const MessengerSystem&) = delete;

    [[nodiscard]] const identity::DeviceIdentity& GetIdentity() const noexcept { return identity_; }
    [[nodiscard]] const std::string& GetDeviceId() const noexcept { return identity_.device_id; }

    messaging::HandlerToken AddEventHandler(std::shared_ptr<interfaces::IMessengerEventHandler> handler);
    void RemoveEventHandler(messaging::HandlerToken token);

    // Pairing

    [[nodiscard]] Result<models::Invite, TetherFailure> IssuePersonalInvite();
    [[nodiscard]] Result<invite::GroupInvite, TetherFailure> IssueGroupInvite(
        uint32_t max_members,
        std::string_view group_name);
    [[nodiscard]] Result<std::string, TetherFailure> EncodeInvite(const models::Invite& invite) const;
    [[nodiscard]] Result<models::Contact, TetherFailure> RedeemInvite(std::string_view scanned);

    // Contacts

    [[nodiscard]] std::vector<models::Contact> Contacts() const;
    [[nodiscard]] std::optional<models::Contact> FindContact(std::string_view contact_id) const;
    /// Also asks the relay to refuse future pairings with a removed personal contact.
    [[nodiscard]] Result<Unit, TetherFailure> RemoveContact(std::string_view contact_id);

    /// Pull pairings the relay brokered while this device was not listening. Returns how many were new.
    [[nodiscard]] Result<size_t, TetherFailure> SyncContacts();
    [[nodiscard]] Result<models::Contact, TetherFailure> UpdateContactPrivacy(
        std::string_view contact_id,
        const models::PrivacySettings& privacy);

    // Messaging

    [[nodiscard]] Result<models::Message, TetherFailure> SendText(
        std::string_view contact_id,
        std::string_view text,
        std::optional<uint32_t> auto_delete_minutes = std::nullopt);

    [[nodiscard]] std::future<Result<models::Message, TetherFailure>> SendTextAsync(
        std::string contact_id,
        std::string text,
        std::optional<uint32_t> auto_delete_minutes = std::nullopt);

    [[nodiscard]] Result<models::Message, TetherFailure> SendAttachment(
        std::string_view contact_id,
        std::span<const uint8_t> blob,
        crypto::AttachmentDescriptor descriptor,
        std::optional<uint32_t> auto_delete_minutes = std::nullopt);

    [[nodiscard]] Result<std::vector<uint8_t>, TetherFailure> OpenAttachment(std::string_view message_id);

    [[nodiscard]] std::vector<models::Message> Conversation(std::string_view conversation_id) const;
    [[nodiscard]] Result<size_t, TetherFailure> MarkConversationViewed(std::string_view conversation_id);
    [[nodiscard]] Result<Unit, TetherFailure> DeleteForMe(std::string_view message_id);
    [[nodiscard]] Result<Unit, TetherFailure> DeleteForEveryone(std::string_view message_id);
    [[nodiscard]] Result<size_t, TetherFailure> Sweep();
    [[nodiscard]] Result<size_t, TetherFailure> RetryPendingSync();

    void StartSweeper();
    void StopSweeper();

    [[nodiscard]] contacts::ContactLedger& Ledger() noexcept { return *ledger_; }
    [[nodiscard]] messaging::MessageLifecycleEngine& Engine() noexcept { return *engine_; }
    [[nodiscard]] invite::InviteProtocol& Invites() noexcept { return *invites_; }

private:
    MessengerSystem(
        interfaces::IBackend& backend,
        identity::DeviceIdentity identity,
        std::unique_ptr<contacts::ContactLedger> ledger);

    [[nodiscard]] Result<Unit, TetherFailure> SubscribeConversation(const models::Contact& contact);
    [[nodiscard]] Result<Unit, TetherFailure> SubscribeAll();
    void OnPairingNotice(const interfaces::PairingNotice& notice);
    void UnsubscribeAll();

    interfaces::IBackend& backend_;
    identity::DeviceIdentity identity_;
    messaging::EventHub events_;
    std::unique_ptr<contacts::ContactLedger> ledger_;
    std::unique_ptr<messaging::MessageLifecycleEngine> engine_;
    std::unique_ptr<invite::InviteProtocol> invites_;

    mutable std::mutex subscriptions_mutex_;
    // conversation id -> relay subscription
    std::map<std::string, interfaces::SubscriptionId, std::less<>> conversation_subscriptions_;
    std::optional<interfaces::SubscriptionId> contact_subscription_;
};

}
