#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/configuration/messenger_config.hpp"
#include "tether/contacts/contact_ledger.hpp"
#include "tether/crypto/attachment_cipher.hpp"
#include "tether/crypto/sodium_secure_memory_handle.hpp"
#include "tether/interfaces/i_backend.hpp"
#include "tether/interfaces/i_clock.hpp"
#include "tether/messaging/event_hub.hpp"
#include "tether/models/message.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tether::messaging {

/// The local half of every conversation key derivation.
struct LocalDevice {
    std::string device_id;
    std::string private_key;
};

/**
 * Per-message state machine: Sending -> Sent -> Delivered -> Seen.
 *
 * - Sent once the envelope is sealed and stored locally.
 * - Delivered on the relay's acknowledgement, or after the configured
 *   simulated delay when one is set (checked by Sweep).
 * - Seen when the recipient views the conversation; own messages learn it
 *   from a seen receipt.
 *
 * Entering Seen with a nonzero timer sets delete_at; Sweep erases what is
 * due. Every delete path is idempotent. Status never moves backwards.
 *
 * Conversation and attachment keys are derived on first use and cached per
 * contact in guarded memory until ForgetContact.
 */
class MessageLifecycleEngine {
public:
    MessageLifecycleEngine(
        LocalDevice self,
        contacts::ContactLedger& ledger,
        interfaces::IBackend& backend,
        const EventHub& events,
        const interfaces::IClock& clock,
        configuration::MessengerConfig config);

    ~MessageLifecycleEngine();

    MessageLifecycleEngine(const MessageLifecycleEngine&) = delete;
    MessageLifecycleEngine& operator=(const MessageLifecycleEngine&) = delete;

    /**
     * Seal text for a contact, store it and hand it to the relay.
     *
     * A relay failure does not fail the send: the message stays Sent with
     * sync_pending set. Fails ContactWasDeleted if the contact was removed
     * before the sealed message could be stored.
     */
    [[nodiscard]] Result<models::Message, TetherFailure> SendText(
        std::string_view contact_id,
        std::string_view text,
        std::optional<uint32_t> auto_delete_minutes = std::nullopt);

    /// SendText on a worker thread. The engine must outlive the future.
    [[nodiscard]] std::future<Result<models::Message, TetherFailure>> SendTextAsync(
        std::string contact_id,
        std::string text,
        std::optional<uint32_t> auto_delete_minutes = std::nullopt);

    [[nodiscard]] Result<models::Message, TetherFailure> SendAttachment(
        std::string_view contact_id,
        std::span<const uint8_t> blob,
        crypto::AttachmentDescriptor descriptor,
        std::optional<uint32_t> auto_delete_minutes = std::nullopt);

    /// Decrypts a stored attachment. An incoming attachment stays Unverified until
    /// the first open settles it as Authenticated or Undecryptable.
    [[nodiscard]] Result<std::vector<uint8_t>, TetherFailure> OpenAttachment(std::string_view message_id);

    /**
     * Store an envelope from the relay and acknowledge it.
     *
     * A message that cannot be decrypted is kept with authenticity
     * Undecryptable and empty text. Redelivery of a known id is a no-op.
     */
    [[nodiscard]] Result<models::Message, TetherFailure> OnIncoming(const interfaces::WireMessage& wire);

    /// Receipts for unknown or foreign messages are ignored.
    [[nodiscard]] Result<Unit, TetherFailure> OnReceipt(const interfaces::Receipt& receipt);

    /// Mark every delivered incoming message in the conversation Seen. Returns how many changed.
    [[nodiscard]] Result<size_t, TetherFailure> MarkConversationViewed(std::string_view conversation_id);

    /// Erase expired messages and apply simulated delivery. Returns how many were erased.
    [[nodiscard]] Result<size_t, TetherFailure> Sweep();

    void StartSweeper();
    void StopSweeper();
    [[nodiscard]] bool IsSweeperRunning() const;

    [[nodiscard]] Result<Unit, TetherFailure> DeleteForMe(std::string_view message_id);

    /// Sender only. The local copy comes back if the relay refuses.
    [[nodiscard]] Result<Unit, TetherFailure> DeleteForEveryone(std::string_view message_id);

    [[nodiscard]] Result<Unit, TetherFailure> OnRemoteDeletion(const interfaces::DeletionNotice& notice);

    /// Re-send own messages whose relay write failed. Returns how many went through.
    [[nodiscard]] Result<size_t, TetherFailure> RetryPendingSync();

    /// Drop and wipe cached keys for a removed contact.
    void ForgetContact(std::string_view contact_id);

    [[nodiscard]] const configuration::MessengerConfig& GetConfig() const noexcept { return config_; }

private:
    using KeyHandle = std::shared_ptr<crypto::SecureMemoryHandle>;
    using MessageMutator = std::function<bool(models::Message&)>;

    [[nodiscard]] Result<models::Contact, TetherFailure> RequireContact(std::string_view contact_id) const;
    [[nodiscard]] Result<models::Contact, TetherFailure> RequireContactForConversation(std::string_view conversation_id) const;

    [[nodiscard]] Result<KeyHandle, TetherFailure> ConversationKey(const models::Contact& contact);
    [[nodiscard]] Result<KeyHandle, TetherFailure> AttachmentKey(const models::Contact& contact);

    [[nodiscard]] models::Message NewOwnMessage(const models::Contact& contact, std::optional<uint32_t> auto_delete_minutes) const;

    /// Append, publish Sent, hand to the relay, flag sync_pending on failure.
    [[nodiscard]] Result<models::Message, TetherFailure> StoreAndDispatch(models::Message message, std::string payload);

    /// Atomically read-modify-write one message; nullopt when it is gone or unchanged.
    [[nodiscard]] Result<std::optional<models::Message>, TetherFailure> MutateMessage(
        std::string_view message_id,
        const MessageMutator& mutate);

    /// Removes one message while holding the same lock as MutateMessage.
    [[nodiscard]] Result<std::optional<models::Message>, TetherFailure> EraseMessage(std::string_view message_id);

    [[nodiscard]] Result<std::string, TetherFailure> BuildPayload(const models::Message& message);

    void EnterSeen(models::Message& message, models::TimePoint now) const;

    void SweeperLoop();

    LocalDevice self_;
    contacts::ContactLedger& ledger_;
    interfaces::IBackend& backend_;
    const EventHub& events_;
    const interfaces::IClock& clock_;
    configuration::MessengerConfig config_;

    mutable std::mutex keys_mutex_;
    std::map<std::string, KeyHandle, std::less<>> conversation_keys_;
    std::map<std::string, KeyHandle, std::less<>> attachment_keys_;

    // Serializes read-modify-write on message records. Never held across relay calls.
    std::mutex lifecycle_mutex_;

    mutable std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    std::thread sweeper_;
    bool sweeper_stop_ = false;
};

}
