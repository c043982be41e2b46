#include "tether/contacts/contact_ledger.hpp"
#include "tether/core/constants.hpp"
#include "tether/debug/event_logger.hpp"
#include "ledger/ledger_state.pb.h"

#include <fmt/core.h>
#include <algorithm>

namespace tether::contacts {

ContactLedger::ContactLedger(interfaces::IKeyValueStore& store)
    : store_(store)
{
}

Result<std::unique_ptr<ContactLedger>, TetherFailure> ContactLedger::Open(interfaces::IKeyValueStore& store) {
    std::unique_ptr<ContactLedger> ledger(new ContactLedger(store));
    if (auto loaded = ledger->Load(); loaded.IsErr()) {
        return Result<std::unique_ptr<ContactLedger>, TetherFailure>::Err(std::move(loaded).UnwrapErr());
    }
    return Result<std::unique_ptr<ContactLedger>, TetherFailure>::Ok(std::move(ledger));
}

Result<Unit, TetherFailure> ContactLedger::Load() {
    auto stored = store_.Get(LedgerConstants::KEY_LEDGER_STATE);
    if (stored.IsErr()) {
        return Result<Unit, TetherFailure>::Err(stored.UnwrapErr());
    }
    const auto bytes = std::move(stored).Unwrap();
    if (!bytes.has_value()) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }

    proto::ledger::LedgerState proto;
    if (!proto.ParseFromString(*bytes)) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::Storage("Ledger record is corrupt"));
    }

    State state;
    for (const auto& record : proto.contacts()) {
        auto contact = models::Contact::FromProto(record);
        if (contact.IsErr()) {
            return Result<Unit, TetherFailure>::Err(std::move(contact).UnwrapErr());
        }
        auto value = std::move(contact).Unwrap();
        std::string id = value.id;
        state.contacts.insert_or_assign(std::move(id), std::move(value));
    }
    for (const auto& tombstone : proto.tombstones()) {
        state.tombstones.insert(tombstone);
    }
    for (const auto& record : proto.groups()) {
        auto group = models::GroupMarking::FromProto(record);
        if (group.IsErr()) {
            return Result<Unit, TetherFailure>::Err(std::move(group).UnwrapErr());
        }
        auto value = std::move(group).Unwrap();
        std::string id = value.GetGroupId();
        state.groups.insert_or_assign(std::move(id), std::move(value));
    }
    std::map<std::string, MessageList, std::less<>> conversations;
    for (const auto& [id, contact] : state.contacts) {
        if (conversations.contains(contact.conversation_id)) {
            continue;
        }
        auto messages = LoadConversation(contact.conversation_id);
        if (messages.IsErr()) {
            return Result<Unit, TetherFailure>::Err(std::move(messages).UnwrapErr());
        }
        if (!messages.Unwrap().empty()) {
            conversations.emplace(contact.conversation_id, std::move(messages).Unwrap());
        }
    }

    std::lock_guard lock(mutex_);
    state_ = std::move(state);
    conversations_ = std::move(conversations);
    TETHER_LOG_VALUE("ledger", "contacts loaded", state_.contacts.size());
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> ContactLedger::CommitLocked(State next) {
    proto::ledger::LedgerState proto;
    for (const auto& [id, contact] : next.contacts) {
        *proto.add_contacts() = contact.ToProto();
    }
    for (const auto& tombstone : next.tombstones) {
        proto.add_tombstones(tombstone);
    }
    for (const auto& [id, group] : next.groups) {
        *proto.add_groups() = group.ToProto();
    }

    std::string bytes;
    if (!proto.SerializeToString(&bytes)) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::Storage("Failed to serialize ledger"));
    }
    if (auto stored = store_.Set(LedgerConstants::KEY_LEDGER_STATE, std::move(bytes)); stored.IsErr()) {
        return stored;
    }
    state_ = std::move(next);
    return Result<Unit, TetherFailure>::Ok(unit);
}

std::string ContactLedger::ConversationKey(std::string_view conversation_id) {
    return fmt::format("{}{}", LedgerConstants::CONVERSATION_KEY_PREFIX, conversation_id);
}

Result<ContactLedger::MessageList, TetherFailure> ContactLedger::LoadConversation(
    const std::string& conversation_id) const {

    auto stored = store_.Get(ConversationKey(conversation_id));
    if (stored.IsErr()) {
        return Result<MessageList, TetherFailure>::Err(stored.UnwrapErr());
    }
    const auto bytes = std::move(stored).Unwrap();
    if (!bytes.has_value()) {
        return Result<MessageList, TetherFailure>::Ok(MessageList{});
    }

    proto::ledger::Conversation proto;
    if (!proto.ParseFromString(*bytes) || proto.conversation_id() != conversation_id) {
        return Result<MessageList, TetherFailure>::Err(
            TetherFailure::Storage(fmt::format("Conversation record {} is corrupt", conversation_id)));
    }
    MessageList messages;
    messages.reserve(static_cast<size_t>(proto.messages_size()));
    for (const auto& record : proto.messages()) {
        auto message = models::Message::FromProto(record);
        if (message.IsErr()) {
            return Result<MessageList, TetherFailure>::Err(std::move(message).UnwrapErr());
        }
        messages.push_back(std::move(message).Unwrap());
    }
    return Result<MessageList, TetherFailure>::Ok(std::move(messages));
}

Result<Unit, TetherFailure> ContactLedger::CommitConversationLocked(
    const std::string& conversation_id,
    MessageList messages) {

    const auto key = ConversationKey(conversation_id);
    if (messages.empty()) {
        if (auto deleted = store_.Delete(key); deleted.IsErr()) {
            return deleted;
        }
        conversations_.erase(conversation_id);
        return Result<Unit, TetherFailure>::Ok(unit);
    }

    proto::ledger::Conversation proto;
    proto.set_conversation_id(conversation_id);
    for (const auto& message : messages) {
        *proto.add_messages() = message.ToProto();
    }
    std::string bytes;
    if (!proto.SerializeToString(&bytes)) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::Storage("Failed to serialize conversation"));
    }
    if (auto stored = store_.Set(key, std::move(bytes)); stored.IsErr()) {
        return stored;
    }
    conversations_.insert_or_assign(conversation_id, std::move(messages));
    return Result<Unit, TetherFailure>::Ok(unit);
}

bool ContactLedger::IsTombstonedIn(const State& state, const models::Contact& contact) {
    const auto tombstoned = [&state](const std::string& identifier) {
        return !identifier.empty() && state.tombstones.contains(identifier);
    };
    return tombstoned(contact.id)
        || tombstoned(contact.contact_user_id)
        || tombstoned(contact.conversation_id);
}

const models::Contact* ContactLedger::FindByConversationIn(const State& state, std::string_view conversation_id) {
    for (const auto& [id, contact] : state.contacts) {
        if (contact.conversation_id == conversation_id) {
            return &contact;
        }
    }
    return nullptr;
}

Result<models::Contact, TetherFailure> ContactLedger::AddContact(models::Contact contact) {
    if (contact.id.empty() || contact.conversation_id.empty()) {
        return Result<models::Contact, TetherFailure>::Err(
            TetherFailure::InvalidInput("Contact needs an id and a conversation id"));
    }

    std::lock_guard lock(mutex_);
    if (IsTombstonedIn(state_, contact)) {
        TETHER_LOG_ID("ledger", "rejected tombstoned contact", contact.id);
        return Result<models::Contact, TetherFailure>::Err(
            TetherFailure::ContactWasDeleted(std::string(ErrorMessages::CONTACT_TOMBSTONED)));
    }

    State next = state_;
    models::Contact stored;
    if (const auto it = next.contacts.find(contact.id); it != next.contacts.end()) {
        models::Contact& existing = it->second;
        existing.name = std::move(contact.name);
        existing.public_key = std::move(contact.public_key);
        existing.pairing_code = std::move(contact.pairing_code);
        existing.conversation_id = std::move(contact.conversation_id);
        if (!contact.contact_user_id.empty()) {
            existing.contact_user_id = std::move(contact.contact_user_id);
        }
        existing.group_id = std::move(contact.group_id);
        existing.is_deleted = false;
        stored = existing;
    } else {
        stored = contact;
        std::string id = contact.id;
        next.contacts.emplace(std::move(id), std::move(contact));
    }

    if (auto committed = CommitLocked(std::move(next)); committed.IsErr()) {
        return Result<models::Contact, TetherFailure>::Err(std::move(committed).UnwrapErr());
    }
    TETHER_LOG_ID("ledger", "contact stored", stored.id);
    return Result<models::Contact, TetherFailure>::Ok(std::move(stored));
}

Result<Unit, TetherFailure> ContactLedger::RemoveContact(std::string_view contact_id) {
    std::vector<std::string> payload_refs;
    {
        std::lock_guard lock(mutex_);
        const auto it = state_.contacts.find(contact_id);
        if (it == state_.contacts.end()) {
            if (state_.tombstones.contains(contact_id)) {
                return Result<Unit, TetherFailure>::Ok(unit);
            }
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::NotFound(fmt::format("No contact {}", contact_id)));
        }

        State next = state_;
        const models::Contact removed = it->second;
        for (const auto* alias : {&removed.id, &removed.contact_user_id, &removed.conversation_id}) {
            if (!alias->empty()) {
                next.tombstones.insert(*alias);
            }
        }
        if (!removed.group_id.empty()) {
            next.groups.erase(removed.group_id);
        }
        next.contacts.erase(removed.id);

        if (auto committed = CommitLocked(std::move(next)); committed.IsErr()) {
            return committed;
        }
        TETHER_LOG_ID("ledger", "contact tombstoned", removed.id);

        if (const auto conversation = conversations_.find(removed.conversation_id);
            conversation != conversations_.end()) {
            for (const auto& message : conversation->second) {
                if (message.attachment.has_value()) {
                    payload_refs.push_back(message.attachment->payload_ref);
                }
            }
        }
        if (auto dropped = CommitConversationLocked(removed.conversation_id, {}); dropped.IsErr()) {
            return dropped;
        }
    }

    for (const auto& ref : payload_refs) {
        if (auto deleted = store_.Delete(ref); deleted.IsErr()) {
            return deleted;
        }
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<models::Contact, TetherFailure> ContactLedger::UpdateContactPrivacy(
    std::string_view contact_id,
    const models::PrivacySettings& privacy) {

    std::lock_guard lock(mutex_);
    const auto it = state_.contacts.find(contact_id);
    if (it == state_.contacts.end()) {
        return Result<models::Contact, TetherFailure>::Err(
            TetherFailure::NotFound(fmt::format("No contact {}", contact_id)));
    }
    if (it->second.privacy == privacy) {
        return Result<models::Contact, TetherFailure>::Ok(it->second);
    }

    State next = state_;
    models::Contact& updated = next.contacts.find(contact_id)->second;
    updated.privacy = privacy;
    models::Contact result = updated;
    if (auto committed = CommitLocked(std::move(next)); committed.IsErr()) {
        return Result<models::Contact, TetherFailure>::Err(std::move(committed).UnwrapErr());
    }
    return Result<models::Contact, TetherFailure>::Ok(std::move(result));
}

Result<MergeOutcome, TetherFailure> ContactLedger::MergeDiscovered(models::Contact contact) {
    std::lock_guard lock(mutex_);

    const bool present = std::any_of(state_.contacts.begin(), state_.contacts.end(),
        [&contact](const auto& entry) {
            const models::Contact& known = entry.second;
            return known.id == contact.id
                || (!contact.contact_user_id.empty() && known.contact_user_id == contact.contact_user_id)
                || (!contact.public_key.empty() && known.public_key == contact.public_key);
        });
    if (present) {
        return Result<MergeOutcome, TetherFailure>::Ok(MergeOutcome::AlreadyPresent);
    }
    if (IsTombstonedIn(state_, contact)) {
        return Result<MergeOutcome, TetherFailure>::Ok(MergeOutcome::Tombstoned);
    }
    if (contact.id.empty() || contact.conversation_id.empty()) {
        return Result<MergeOutcome, TetherFailure>::Err(
            TetherFailure::InvalidInput("Discovered contact needs an id and a conversation id"));
    }

    State next = state_;
    std::string id = contact.id;
    next.contacts.emplace(std::move(id), std::move(contact));
    if (auto committed = CommitLocked(std::move(next)); committed.IsErr()) {
        return Result<MergeOutcome, TetherFailure>::Err(std::move(committed).UnwrapErr());
    }
    return Result<MergeOutcome, TetherFailure>::Ok(MergeOutcome::Inserted);
}

bool ContactLedger::IsTombstoned(std::string_view identifier) const {
    std::lock_guard lock(mutex_);
    return state_.tombstones.contains(identifier);
}

std::optional<models::Contact> ContactLedger::FindContact(std::string_view contact_id) const {
    std::lock_guard lock(mutex_);
    if (const auto it = state_.contacts.find(contact_id); it != state_.contacts.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<models::Contact> ContactLedger::FindContactByConversation(std::string_view conversation_id) const {
    std::lock_guard lock(mutex_);
    if (const auto* contact = FindByConversationIn(state_, conversation_id)) {
        return *contact;
    }
    return std::nullopt;
}

std::vector<models::Contact> ContactLedger::Contacts() const {
    std::lock_guard lock(mutex_);
    std::vector<models::Contact> result;
    result.reserve(state_.contacts.size());
    for (const auto& [id, contact] : state_.contacts) {
        result.push_back(contact);
    }
    return result;
}

Result<Unit, TetherFailure> ContactLedger::RecordGroup(models::GroupMarking group) {
    std::lock_guard lock(mutex_);
    if (state_.tombstones.contains(group.GetGroupId())) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::ContactWasDeleted(std::string(ErrorMessages::CONTACT_TOMBSTONED)));
    }
    State next = state_;
    std::string id = group.GetGroupId();
    next.groups.insert_or_assign(std::move(id), std::move(group));
    return CommitLocked(std::move(next));
}

std::optional<models::GroupMarking> ContactLedger::FindGroup(std::string_view group_id) const {
    std::lock_guard lock(mutex_);
    if (const auto it = state_.groups.find(group_id); it != state_.groups.end()) {
        return it->second;
    }
    return std::nullopt;
}

Result<bool, TetherFailure> ContactLedger::AppendMessage(models::Message message) {
    if (message.id.empty()) {
        return Result<bool, TetherFailure>::Err(TetherFailure::InvalidInput("Message id cannot be empty"));
    }

    std::lock_guard lock(mutex_);
    if (state_.tombstones.contains(message.conversation_id)) {
        return Result<bool, TetherFailure>::Err(
            TetherFailure::ContactWasDeleted(std::string(ErrorMessages::CONTACT_TOMBSTONED)));
    }
    if (FindByConversationIn(state_, message.conversation_id) == nullptr) {
        return Result<bool, TetherFailure>::Err(
            TetherFailure::NotFound(fmt::format("No contact owns conversation {}", message.conversation_id)));
    }

    MessageList next;
    if (const auto conversation = conversations_.find(message.conversation_id);
        conversation != conversations_.end()) {
        const auto& messages = conversation->second;
        const bool duplicate = std::any_of(messages.begin(), messages.end(),
            [&message](const models::Message& m) { return m.id == message.id; });
        if (duplicate) {
            return Result<bool, TetherFailure>::Ok(false);
        }
        next = messages;
    }

    const std::string conversation_id = message.conversation_id;
    next.push_back(std::move(message));
    if (auto committed = CommitConversationLocked(conversation_id, std::move(next)); committed.IsErr()) {
        return Result<bool, TetherFailure>::Err(std::move(committed).UnwrapErr());
    }
    return Result<bool, TetherFailure>::Ok(true);
}

std::optional<models::Message> ContactLedger::FindMessage(std::string_view message_id) const {
    std::lock_guard lock(mutex_);
    for (const auto& [conversation_id, messages] : conversations_) {
        for (const auto& message : messages) {
            if (message.id == message_id) {
                return message;
            }
        }
    }
    return std::nullopt;
}

Result<Unit, TetherFailure> ContactLedger::UpdateMessage(const models::Message& message) {
    std::lock_guard lock(mutex_);
    const auto conversation = conversations_.find(message.conversation_id);
    if (conversation == conversations_.end()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::NotFound(fmt::format("No message {}", message.id)));
    }
    const auto& messages = conversation->second;
    const auto it = std::find_if(messages.begin(), messages.end(),
        [&message](const models::Message& m) { return m.id == message.id; });
    if (it == messages.end()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::NotFound(fmt::format("No message {}", message.id)));
    }

    MessageList next = messages;
    next[static_cast<size_t>(it - messages.begin())] = message;
    return CommitConversationLocked(conversation->first, std::move(next));
}

Result<std::optional<models::Message>, TetherFailure> ContactLedger::EraseMessage(std::string_view message_id) {
    using EraseResult = Result<std::optional<models::Message>, TetherFailure>;

    std::optional<models::Message> erased;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [conversation_id, messages] : conversations_) {
            const auto it = std::find_if(messages.begin(), messages.end(),
                [message_id](const models::Message& m) { return m.id == message_id; });
            if (it == messages.end()) {
                continue;
            }
            const std::string owner = conversation_id;
            MessageList next = messages;
            const auto index = static_cast<size_t>(it - messages.begin());
            erased = std::move(next[index]);
            next.erase(next.begin() + static_cast<std::ptrdiff_t>(index));
            if (auto committed = CommitConversationLocked(owner, std::move(next)); committed.IsErr()) {
                return EraseResult::Err(std::move(committed).UnwrapErr());
            }
            break;
        }
        if (!erased.has_value()) {
            return EraseResult::Ok(std::nullopt);
        }
    }

    if (erased->attachment.has_value()) {
        if (auto deleted = store_.Delete(erased->attachment->payload_ref); deleted.IsErr()) {
            return EraseResult::Err(std::move(deleted).UnwrapErr());
        }
    }
    return EraseResult::Ok(std::move(erased));
}

std::vector<models::Message> ContactLedger::MessagesFor(std::string_view conversation_id) const {
    std::lock_guard lock(mutex_);
    if (const auto it = conversations_.find(conversation_id); it != conversations_.end()) {
        return it->second;
    }
    return {};
}

std::vector<models::Message> ContactLedger::AllMessages() const {
    std::lock_guard lock(mutex_);
    std::vector<models::Message> result;
    for (const auto& [conversation_id, messages] : conversations_) {
        result.insert(result.end(), messages.begin(), messages.end());
    }
    return result;
}

Result<Unit, TetherFailure> ContactLedger::StoreAttachmentPayload(
    std::string_view payload_ref,
    const std::vector<uint8_t>& ciphertext) {

    if (!payload_ref.starts_with(LedgerConstants::ATTACHMENT_PAYLOAD_PREFIX)) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput(fmt::format("Not an attachment payload reference: {}", payload_ref)));
    }
    std::lock_guard lock(mutex_);
    auto existing = store_.Has(payload_ref);
    if (existing.IsErr()) {
        return Result<Unit, TetherFailure>::Err(existing.UnwrapErr());
    }
    if (existing.Unwrap()) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::AlreadyUsed(fmt::format("Attachment payload {} already exists", payload_ref)));
    }
    return store_.Set(payload_ref, std::string(ciphertext.begin(), ciphertext.end()));
}

Result<std::vector<uint8_t>, TetherFailure> ContactLedger::LoadAttachmentPayload(std::string_view payload_ref) const {
    auto stored = store_.Get(payload_ref);
    if (stored.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(stored.UnwrapErr());
    }
    const auto bytes = std::move(stored).Unwrap();
    if (!bytes.has_value()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::NotFound(fmt::format("Attachment payload {} is gone", payload_ref)));
    }
    return Result<std::vector<uint8_t>, TetherFailure>::Ok(std::vector<uint8_t>(bytes->begin(), bytes->end()));
}

Result<Unit, TetherFailure> ContactLedger::DiscardAttachmentPayload(std::string_view payload_ref) {
    if (!payload_ref.starts_with(LedgerConstants::ATTACHMENT_PAYLOAD_PREFIX)) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::InvalidInput(fmt::format("Not an attachment payload reference: {}", payload_ref)));
    }
    return store_.Delete(payload_ref);
}

}
