#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/interfaces/i_key_value_store.hpp"
#include "tether/models/contact.hpp"
#include "tether/models/group_marking.hpp"
#include "tether/models/message.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tether::contacts {

enum class MergeOutcome {
    Inserted,
    AlreadyPresent,
    Tombstoned
};

/**
 * Authoritative list of paired contacts, the tombstone set, group records
 * and per-conversation message history.
 *
 * Contacts, tombstones and groups form one LedgerState record in the
 * key-value store; each conversation is a record of its own and attachment
 * payloads sit under their payload_ref. A mutation builds the next value of
 * the record it touches, persists it and only then replaces the in-memory
 * copy, so a failed write leaves the ledger unchanged.
 *
 * A tombstoned identifier (device id, user id or conversation id) can never
 * be attached to a live contact again.
 */
class ContactLedger {
public:
    [[nodiscard]] static Result<std::unique_ptr<ContactLedger>, TetherFailure> Open(
        interfaces::IKeyValueStore& store);

    /// Insert, or refresh the pairing fields of an existing entry with the same id.
    [[nodiscard]] Result<models::Contact, TetherFailure> AddContact(models::Contact contact);

    /**
     * Tombstone every alias of the contact and drop its conversation and
     * attachment payloads. Removing an already tombstoned id succeeds.
     */
    [[nodiscard]] Result<Unit, TetherFailure> RemoveContact(std::string_view contact_id);

    [[nodiscard]] Result<models::Contact, TetherFailure> UpdateContactPrivacy(
        std::string_view contact_id,
        const models::PrivacySettings& privacy);

    /// Merge a contact learned from the relay. Never an error for present or tombstoned entries.
    [[nodiscard]] Result<MergeOutcome, TetherFailure> MergeDiscovered(models::Contact contact);

    [[nodiscard]] bool IsTombstoned(std::string_view identifier) const;

    [[nodiscard]] std::optional<models::Contact> FindContact(std::string_view contact_id) const;
    [[nodiscard]] std::optional<models::Contact> FindContactByConversation(std::string_view conversation_id) const;
    [[nodiscard]] std::vector<models::Contact> Contacts() const;

    [[nodiscard]] Result<Unit, TetherFailure> RecordGroup(models::GroupMarking group);
    [[nodiscard]] std::optional<models::GroupMarking> FindGroup(std::string_view group_id) const;

    // Message history

    /// false when a message with the same id is already stored (redelivery).
    [[nodiscard]] Result<bool, TetherFailure> AppendMessage(models::Message message);

    [[nodiscard]] std::optional<models::Message> FindMessage(std::string_view message_id) const;

    [[nodiscard]] Result<Unit, TetherFailure> UpdateMessage(const models::Message& message);

    /// The erased message, or nullopt when it was already gone.
    [[nodiscard]] Result<std::optional<models::Message>, TetherFailure> EraseMessage(std::string_view message_id);

    /// Oldest first.
    [[nodiscard]] std::vector<models::Message> MessagesFor(std::string_view conversation_id) const;

    [[nodiscard]] std::vector<models::Message> AllMessages() const;

    // Attachment payloads live beside the ledger under their payload_ref.

    [[nodiscard]] Result<Unit, TetherFailure> StoreAttachmentPayload(
        std::string_view payload_ref,
        const std::vector<uint8_t>& ciphertext);

    [[nodiscard]] Result<std::vector<uint8_t>, TetherFailure> LoadAttachmentPayload(
        std::string_view payload_ref) const;

    /// Drop a payload no message refers to. Absent payloads are fine.
    [[nodiscard]] Result<Unit, TetherFailure> DiscardAttachmentPayload(std::string_view payload_ref);

    ContactLedger(const ContactLedger&) = delete;
    ContactLedger& operator=(const ContactLedger&) = delete;

private:
    struct State {
        std::map<std::string, models::Contact, std::less<>> contacts;
        std::set<std::string, std::less<>> tombstones;
        std::map<std::string, models::GroupMarking, std::less<>> groups;
    };
    using MessageList = std::vector<models::Message>;

    explicit ContactLedger(interfaces::IKeyValueStore& store);

    [[nodiscard]] Result<Unit, TetherFailure> Load();
    [[nodiscard]] Result<MessageList, TetherFailure> LoadConversation(const std::string& conversation_id) const;

    /// Persists the contact directory, then adopts next.
    [[nodiscard]] Result<Unit, TetherFailure> CommitLocked(State next);

    /// Persists one conversation, then adopts messages. An empty list drops the record.
    [[nodiscard]] Result<Unit, TetherFailure> CommitConversationLocked(
        const std::string& conversation_id,
        MessageList messages);

    [[nodiscard]] static std::string ConversationKey(std::string_view conversation_id);

    [[nodiscard]] static bool IsTombstonedIn(const State& state, const models::Contact& contact);
    [[nodiscard]] static const models::Contact* FindByConversationIn(const State& state, std::string_view conversation_id);

    interfaces::IKeyValueStore& store_;
    mutable std::mutex mutex_;
    State state_;
    std::map<std::string, MessageList, std::less<>> conversations_;
};

}
