#include "tether/messaging/message_lifecycle_engine.hpp"
#include "tether/core/constants.hpp"
#include "tether/crypto/message_cipher.hpp"
#include "tether/crypto/shared_secret_deriver.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/debug/event_logger.hpp"

#include <fmt/core.h>
#include <algorithm>

namespace tether::messaging {

using crypto::AttachmentCipher;
using crypto::MessageCipher;
using crypto::SharedSecretDeriver;
using crypto::SodiumInterop;
using models::Message;
using models::MessageAuthenticity;
using models::MessageStatus;

namespace {
    std::string NewMessageId() {
        return fmt::format("{}{}", MessagingConstants::MESSAGE_ID_PREFIX,
                           SodiumInterop::ToHex(SodiumInterop::GetRandomBytes(Constants::MESSAGE_ID_RANDOM_BYTES)));
    }

    Result<uint32_t, TetherFailure> ResolveTimer(
        const std::optional<uint32_t> requested,
        const configuration::MessengerConfig& config) {

        const uint32_t minutes = requested.value_or(config.GetDefaultAutoDeleteMinutes());
        if (minutes > MessagingConstants::MAX_AUTO_DELETE_MINUTES) {
            return Result<uint32_t, TetherFailure>::Err(
                TetherFailure::InvalidInput(fmt::format("Auto-delete timer above {} minutes",
                                                        MessagingConstants::MAX_AUTO_DELETE_MINUTES)));
        }
        return Result<uint32_t, TetherFailure>::Ok(minutes);
    }
}

MessageLifecycleEngine::MessageLifecycleEngine(
    LocalDevice self,
    contacts::ContactLedger& ledger,
    interfaces::IBackend& backend,
    const EventHub& events,
    const interfaces::IClock& clock,
    configuration::MessengerConfig config)
    : self_(std::move(self))
    , ledger_(ledger)
    , backend_(backend)
    , events_(events)
    , clock_(clock)
    , config_(config)
{
}

MessageLifecycleEngine::~MessageLifecycleEngine() {
    StopSweeper();
    auto wiped = SodiumInterop::SecureWipe(self_.private_key);
    (void)wiped;
}

Result<models::Contact, TetherFailure> MessageLifecycleEngine::RequireContact(std::string_view contact_id) const {
    if (auto contact = ledger_.FindContact(contact_id)) {
        return Result<models::Contact, TetherFailure>::Ok(std::move(*contact));
    }
    if (ledger_.IsTombstoned(contact_id)) {
        return Result<models::Contact, TetherFailure>::Err(
            TetherFailure::ContactWasDeleted(std::string(ErrorMessages::CONTACT_TOMBSTONED)));
    }
    return Result<models::Contact, TetherFailure>::Err(
        TetherFailure::NotFound(fmt::format("No contact {}", contact_id)));
}

Result<models::Contact, TetherFailure> MessageLifecycleEngine::RequireContactForConversation(
    std::string_view conversation_id) const {

    if (auto contact = ledger_.FindContactByConversation(conversation_id)) {
        return Result<models::Contact, TetherFailure>::Ok(std::move(*contact));
    }
    if (ledger_.IsTombstoned(conversation_id)) {
        return Result<models::Contact, TetherFailure>::Err(
            TetherFailure::ContactWasDeleted(std::string(ErrorMessages::CONTACT_TOMBSTONED)));
    }
    return Result<models::Contact, TetherFailure>::Err(
        TetherFailure::NotFound(fmt::format("No contact owns conversation {}", conversation_id)));
}

Result<MessageLifecycleEngine::KeyHandle, TetherFailure> MessageLifecycleEngine::ConversationKey(
    const models::Contact& contact) {

    {
        std::lock_guard lock(keys_mutex_);
        if (const auto it = conversation_keys_.find(contact.id); it != conversation_keys_.end()) {
            return Result<KeyHandle, TetherFailure>::Ok(it->second);
        }
    }

    // A group shares one key: the creator's key material stretched together with the group id.
    Result<crypto::SecureMemoryHandle, TetherFailure> derived = [&]() {
        if (contact.group_id.empty()) {
            return SharedSecretDeriver::DeriveSharedKey(self_.private_key, contact.public_key);
        }
        auto creator_key = SharedSecretDeriver::StripKeyRole(contact.public_key);
        if (creator_key.IsErr()) {
            return Result<crypto::SecureMemoryHandle, TetherFailure>::Err(std::move(creator_key).UnwrapErr());
        }
        auto key = SharedSecretDeriver::DeriveFromSortedPair(
            creator_key.Unwrap(), contact.group_id, KeyDerivationConstants::CONVERSATION_SALT);
        auto wiped = SodiumInterop::SecureWipe(creator_key.Unwrap());
        (void)wiped;
        return key;
    }();
    if (derived.IsErr()) {
        return Result<KeyHandle, TetherFailure>::Err(std::move(derived).UnwrapErr());
    }

    auto handle = std::make_shared<crypto::SecureMemoryHandle>(std::move(derived).Unwrap());
    std::lock_guard lock(keys_mutex_);
    const auto [it, inserted] = conversation_keys_.try_emplace(contact.id, std::move(handle));
    TETHER_LOG_ID("engine", "conversation key ready", contact.conversation_id);
    return Result<KeyHandle, TetherFailure>::Ok(it->second);
}

Result<MessageLifecycleEngine::KeyHandle, TetherFailure> MessageLifecycleEngine::AttachmentKey(
    const models::Contact& contact) {

    {
        std::lock_guard lock(keys_mutex_);
        if (const auto it = attachment_keys_.find(contact.id); it != attachment_keys_.end()) {
            return Result<KeyHandle, TetherFailure>::Ok(it->second);
        }
    }

    std::string peer = contact.id;
    std::string local = self_.device_id;
    if (!contact.group_id.empty()) {
        const auto group = ledger_.FindGroup(contact.group_id);
        if (!group.has_value()) {
            return Result<KeyHandle, TetherFailure>::Err(
                TetherFailure::NotFound(fmt::format("No group record for {}", contact.group_id)));
        }
        peer = contact.group_id;
        local = group->GetCreatorId();
    }

    auto derived = AttachmentCipher::DeriveAttachmentKey(local, peer);
    if (derived.IsErr()) {
        return Result<KeyHandle, TetherFailure>::Err(std::move(derived).UnwrapErr());
    }
    auto handle = std::make_shared<crypto::SecureMemoryHandle>(std::move(derived).Unwrap());
    std::lock_guard lock(keys_mutex_);
    const auto [it, inserted] = attachment_keys_.try_emplace(contact.id, std::move(handle));
    return Result<KeyHandle, TetherFailure>::Ok(it->second);
}

void MessageLifecycleEngine::ForgetContact(std::string_view contact_id) {
    std::lock_guard lock(keys_mutex_);
    if (const auto it = conversation_keys_.find(contact_id); it != conversation_keys_.end()) {
        conversation_keys_.erase(it);
    }
    if (const auto it = attachment_keys_.find(contact_id); it != attachment_keys_.end()) {
        attachment_keys_.erase(it);
    }
}

Message MessageLifecycleEngine::NewOwnMessage(
    const models::Contact& contact,
    const std::optional<uint32_t> auto_delete_minutes) const {

    Message message;
    message.id = NewMessageId();
    message.conversation_id = contact.conversation_id;
    message.sender_id = self_.device_id;
    message.timestamp = clock_.Now();
    message.status = MessageStatus::Sending;
    message.is_own = true;
    message.auto_delete_timer_minutes = auto_delete_minutes.value_or(0);
    message.authenticity = MessageAuthenticity::Authenticated;
    return message;
}

Result<Message, TetherFailure> MessageLifecycleEngine::SendText(
    std::string_view contact_id,
    std::string_view text,
    const std::optional<uint32_t> auto_delete_minutes) {

    if (text.empty()) {
        return Result<Message, TetherFailure>::Err(TetherFailure::InvalidInput("Message text cannot be empty"));
    }
    auto timer = ResolveTimer(auto_delete_minutes, config_);
    if (timer.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(timer).UnwrapErr());
    }
    auto contact = RequireContact(contact_id);
    if (contact.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(contact).UnwrapErr());
    }
    auto key = ConversationKey(contact.Unwrap());
    if (key.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(key).UnwrapErr());
    }

    Message message = NewOwnMessage(contact.Unwrap(), timer.Unwrap());
    message.text = std::string(text);

    auto envelope = MessageCipher::Encrypt(text, *key.Unwrap());
    if (envelope.IsErr()) {
        TETHER_LOG_FAILURE("engine", envelope.UnwrapErr());
        return Result<Message, TetherFailure>::Err(std::move(envelope).UnwrapErr());
    }
    return StoreAndDispatch(std::move(message), std::move(envelope).Unwrap());
}

std::future<Result<Message, TetherFailure>> MessageLifecycleEngine::SendTextAsync(
    std::string contact_id,
    std::string text,
    const std::optional<uint32_t> auto_delete_minutes) {

    return std::async(std::launch::async,
        [this, contact_id = std::move(contact_id), text = std::move(text), auto_delete_minutes]() {
            return SendText(contact_id, text, auto_delete_minutes);
        });
}

Result<Message, TetherFailure> MessageLifecycleEngine::SendAttachment(
    std::string_view contact_id,
    std::span<const uint8_t> blob,
    crypto::AttachmentDescriptor descriptor,
    const std::optional<uint32_t> auto_delete_minutes) {

    auto timer = ResolveTimer(auto_delete_minutes, config_);
    if (timer.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(timer).UnwrapErr());
    }
    auto contact = RequireContact(contact_id);
    if (contact.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(contact).UnwrapErr());
    }
    if (!contact.Unwrap().privacy.allow_attachments) {
        return Result<Message, TetherFailure>::Err(
            TetherFailure::NotPermitted(fmt::format("{} does not accept attachments", contact.Unwrap().name)));
    }
    auto key = AttachmentKey(contact.Unwrap());
    if (key.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(key).UnwrapErr());
    }

    descriptor.owner_id = self_.device_id;
    auto encrypted = AttachmentCipher::Encrypt(blob, descriptor, *key.Unwrap(), clock_.Now());
    if (encrypted.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(encrypted).UnwrapErr());
    }
    auto wire = AttachmentCipher::PackForWire(encrypted.Unwrap());
    if (wire.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(wire).UnwrapErr());
    }

    const auto& sealed = encrypted.Unwrap();
    if (auto stored = ledger_.StoreAttachmentPayload(sealed.metadata.payload_ref, sealed.ciphertext);
        stored.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(stored).UnwrapErr());
    }

    Message message = NewOwnMessage(contact.Unwrap(), timer.Unwrap());
    message.attachment = sealed.metadata;
    return StoreAndDispatch(std::move(message), std::move(wire).Unwrap());
}

Result<Message, TetherFailure> MessageLifecycleEngine::StoreAndDispatch(Message message, std::string payload) {
    const std::string message_id = message.id;
    message.status = MessageStatus::Sent;
    message.sent_at = clock_.Now();

    interfaces::WireMessage wire;
    wire.id = message.id;
    wire.conversation_id = message.conversation_id;
    wire.sender_id = self_.device_id;
    wire.payload = std::move(payload);
    wire.encrypted = true;
    wire.sent_at = *message.sent_at;
    wire.auto_delete_timer_minutes = message.auto_delete_timer_minutes;

    // The contact may have been removed while the envelope was being sealed.
    auto appended = ledger_.AppendMessage(message);
    if (appended.IsErr()) {
        TETHER_LOG_FAILURE("engine", appended.UnwrapErr());
        if (message.attachment.has_value()) {
            if (auto dropped = ledger_.DiscardAttachmentPayload(message.attachment->payload_ref); dropped.IsErr()) {
                TETHER_LOG_FAILURE("engine", dropped.UnwrapErr());
            }
        }
        return Result<Message, TetherFailure>::Err(std::move(appended).UnwrapErr());
    }
    events_.PublishMessageStateChanged(message);

    auto sent = backend_.SendMessage(wire);
    if (sent.IsErr()) {
        TETHER_LOG_FAILURE("engine", sent.UnwrapErr());
        auto flagged = MutateMessage(message_id, [](Message& m) {
            if (m.sync_pending) {
                return false;
            }
            m.sync_pending = true;
            return true;
        });
        if (flagged.IsErr()) {
            return Result<Message, TetherFailure>::Err(std::move(flagged).UnwrapErr());
        }
        if (flagged.Unwrap().has_value()) {
            events_.PublishMessageStateChanged(*flagged.Unwrap());
        }
    }

    if (auto latest = ledger_.FindMessage(message_id)) {
        return Result<Message, TetherFailure>::Ok(std::move(*latest));
    }
    // Already swept or deleted by a concurrent path.
    return Result<Message, TetherFailure>::Ok(std::move(message));
}

Result<std::optional<Message>, TetherFailure> MessageLifecycleEngine::MutateMessage(
    std::string_view message_id,
    const MessageMutator& mutate) {

    std::lock_guard lock(lifecycle_mutex_);
    auto current = ledger_.FindMessage(message_id);
    if (!current.has_value() || !mutate(*current)) {
        return Result<std::optional<Message>, TetherFailure>::Ok(std::nullopt);
    }
    if (auto updated = ledger_.UpdateMessage(*current); updated.IsErr()) {
        if (updated.UnwrapErr().Is(TetherFailureType::NotFound)) {
            return Result<std::optional<Message>, TetherFailure>::Ok(std::nullopt);
        }
        return Result<std::optional<Message>, TetherFailure>::Err(std::move(updated).UnwrapErr());
    }
    return Result<std::optional<Message>, TetherFailure>::Ok(std::move(current));
}

Result<std::optional<Message>, TetherFailure> MessageLifecycleEngine::EraseMessage(std::string_view message_id) {
    std::lock_guard lock(lifecycle_mutex_);
    return ledger_.EraseMessage(message_id);
}

void MessageLifecycleEngine::EnterSeen(Message& message, const models::TimePoint now) const {
    message.status = MessageStatus::Seen;
    if (message.auto_delete_timer_minutes > 0 && !message.delete_at.has_value()) {
        message.delete_at = now + std::chrono::minutes(message.auto_delete_timer_minutes);
    }
}

Result<Message, TetherFailure> MessageLifecycleEngine::OnIncoming(const interfaces::WireMessage& wire) {
    if (wire.sender_id == self_.device_id) {
        return Result<Message, TetherFailure>::Err(
            TetherFailure::InvalidInput("Relay echoed an own message back"));
    }
    auto contact = RequireContactForConversation(wire.conversation_id);
    if (contact.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(contact).UnwrapErr());
    }

    if (auto known = ledger_.FindMessage(wire.id)) {
        return Result<Message, TetherFailure>::Ok(std::move(*known));
    }

    Message message;
    message.id = wire.id;
    message.conversation_id = wire.conversation_id;
    message.sender_id = wire.sender_id;
    message.timestamp = wire.sent_at;
    message.status = MessageStatus::Delivered;
    message.is_own = false;
    message.auto_delete_timer_minutes = std::min(wire.auto_delete_timer_minutes,
                                                 MessagingConstants::MAX_AUTO_DELETE_MINUTES);
    message.sent_at = wire.sent_at;

    if (!wire.encrypted) {
        message.text = wire.payload;
        message.authenticity = MessageAuthenticity::Plaintext;
    } else if (AttachmentCipher::IsWireAttachment(wire.payload)) {
        auto unpacked = AttachmentCipher::UnpackFromWire(wire.payload);
        if (unpacked.IsErr()) {
            TETHER_LOG_FAILURE("engine", unpacked.UnwrapErr());
            message.authenticity = MessageAuthenticity::Undecryptable;
        } else {
            auto attachment = std::move(unpacked).Unwrap();
            auto stored = ledger_.StoreAttachmentPayload(attachment.metadata.payload_ref, attachment.ciphertext);
            if (stored.IsErr() && !stored.UnwrapErr().Is(TetherFailureType::AlreadyUsed)) {
                return Result<Message, TetherFailure>::Err(std::move(stored).UnwrapErr());
            }
            if (stored.IsErr()) {
                // A payload reference is never rebound to new bytes.
                TETHER_LOG_FAILURE("engine", stored.UnwrapErr());
                message.authenticity = MessageAuthenticity::Undecryptable;
            } else {
                message.attachment = std::move(attachment.metadata);
                message.authenticity = MessageAuthenticity::Unverified;
            }
        }
    } else {
        auto key = ConversationKey(contact.Unwrap());
        if (key.IsErr()) {
            return Result<Message, TetherFailure>::Err(std::move(key).UnwrapErr());
        }
        auto opened = MessageCipher::Decrypt(wire.payload, *key.Unwrap());
        if (opened.IsErr()) {
            // One bad envelope never ends the conversation.
            TETHER_LOG_FAILURE("engine", opened.UnwrapErr());
            message.authenticity = MessageAuthenticity::Undecryptable;
        } else {
            auto decrypted = std::move(opened).Unwrap();
            message.text = std::move(decrypted.text);
            message.authenticity = decrypted.authenticated
                ? MessageAuthenticity::Authenticated
                : MessageAuthenticity::LegacyUnauthenticated;
        }
    }

    auto appended = ledger_.AppendMessage(message);
    if (appended.IsErr()) {
        return Result<Message, TetherFailure>::Err(std::move(appended).UnwrapErr());
    }
    if (appended.Unwrap()) {
        events_.PublishMessageReceived(message);
    }

    auto acked = backend_.AcknowledgeDelivery(wire.conversation_id, wire.id, self_.device_id);
    if (acked.IsErr()) {
        TETHER_LOG_FAILURE("engine", acked.UnwrapErr());
    }
    return Result<Message, TetherFailure>::Ok(std::move(message));
}

Result<Unit, TetherFailure> MessageLifecycleEngine::OnReceipt(const interfaces::Receipt& receipt) {
    if (receipt.from_id == self_.device_id) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }
    const auto now = clock_.Now();
    auto changed = MutateMessage(receipt.message_id, [&](Message& m) {
        if (!m.is_own) {
            return false;
        }
        if (receipt.kind == interfaces::ReceiptKind::Delivered) {
            if (m.status >= MessageStatus::Delivered) {
                return false;
            }
            m.status = MessageStatus::Delivered;
            return true;
        }
        if (m.status >= MessageStatus::Seen) {
            return false;
        }
        EnterSeen(m, now);
        return true;
    });
    if (changed.IsErr()) {
        return Result<Unit, TetherFailure>::Err(std::move(changed).UnwrapErr());
    }
    if (changed.Unwrap().has_value()) {
        events_.PublishMessageStateChanged(*changed.Unwrap());
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<size_t, TetherFailure> MessageLifecycleEngine::MarkConversationViewed(std::string_view conversation_id) {
    const auto now = clock_.Now();
    std::vector<Message> seen;

    for (const auto& candidate : ledger_.MessagesFor(conversation_id)) {
        if (candidate.is_own || candidate.status >= MessageStatus::Seen) {
            continue;
        }
        auto changed = MutateMessage(candidate.id, [&](Message& m) {
            if (m.status >= MessageStatus::Seen) {
                return false;
            }
            EnterSeen(m, now);
            return true;
        });
        if (changed.IsErr()) {
            return Result<size_t, TetherFailure>::Err(std::move(changed).UnwrapErr());
        }
        if (changed.Unwrap().has_value()) {
            seen.push_back(std::move(*changed.Unwrap()));
        }
    }

    for (const auto& message : seen) {
        events_.PublishMessageStateChanged(message);
        auto receipt = backend_.SendSeenReceipt(message.conversation_id, message.id, self_.device_id);
        if (receipt.IsErr()) {
            TETHER_LOG_FAILURE("engine", receipt.UnwrapErr());
        }
    }
    return Result<size_t, TetherFailure>::Ok(seen.size());
}

Result<size_t, TetherFailure> MessageLifecycleEngine::Sweep() {
    const auto now = clock_.Now();
    size_t erased_count = 0;
    const auto& delay = config_.GetSimulatedDeliveryDelay();

    for (const auto& message : ledger_.AllMessages()) {
        if (message.IsExpired(now)) {
            auto erased = EraseMessage(message.id);
            if (erased.IsErr()) {
                return Result<size_t, TetherFailure>::Err(std::move(erased).UnwrapErr());
            }
            // A concurrent delete may have won; that is fine.
            if (erased.Unwrap().has_value()) {
                ++erased_count;
                events_.PublishMessageDeleted(message.conversation_id, message.id);
            }
            continue;
        }

        if (delay.has_value() && message.is_own && message.status == MessageStatus::Sent
            && message.sent_at.has_value() && now >= *message.sent_at + *delay) {
            auto delivered = MutateMessage(message.id, [](Message& m) {
                if (m.status != MessageStatus::Sent) {
                    return false;
                }
                m.status = MessageStatus::Delivered;
                return true;
            });
            if (delivered.IsErr()) {
                return Result<size_t, TetherFailure>::Err(std::move(delivered).UnwrapErr());
            }
            if (delivered.Unwrap().has_value()) {
                events_.PublishMessageStateChanged(*delivered.Unwrap());
            }
        }
    }

    if (erased_count > 0) {
        TETHER_LOG_VALUE("engine", "messages swept", erased_count);
    }
    return Result<size_t, TetherFailure>::Ok(erased_count);
}

void MessageLifecycleEngine::StartSweeper() {
    std::lock_guard lock(sweeper_mutex_);
    if (sweeper_.joinable()) {
        return;
    }
    sweeper_stop_ = false;
    sweeper_ = std::thread(&MessageLifecycleEngine::SweeperLoop, this);
}

void MessageLifecycleEngine::StopSweeper() {
    std::thread worker;
    {
        std::lock_guard lock(sweeper_mutex_);
        if (!sweeper_.joinable()) {
            return;
        }
        sweeper_stop_ = true;
        worker = std::move(sweeper_);
    }
    sweeper_cv_.notify_all();
    worker.join();
}

bool MessageLifecycleEngine::IsSweeperRunning() const {
    std::lock_guard lock(sweeper_mutex_);
    return sweeper_.joinable();
}

void MessageLifecycleEngine::SweeperLoop() {
    std::unique_lock lock(sweeper_mutex_);
    while (!sweeper_stop_) {
        if (sweeper_cv_.wait_for(lock, config_.GetSweepInterval(), [this] { return sweeper_stop_; })) {
            break;
        }
        lock.unlock();
        auto swept = Sweep();
        if (swept.IsErr()) {
            TETHER_LOG_FAILURE("sweeper", swept.UnwrapErr());
        }
        lock.lock();
    }
}

Result<Unit, TetherFailure> MessageLifecycleEngine::DeleteForMe(std::string_view message_id) {
    auto erased = EraseMessage(message_id);
    if (erased.IsErr()) {
        return Result<Unit, TetherFailure>::Err(std::move(erased).UnwrapErr());
    }
    if (const auto& message = erased.Unwrap(); message.has_value()) {
        events_.PublishMessageDeleted(message->conversation_id, message->id);
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> MessageLifecycleEngine::DeleteForEveryone(std::string_view message_id) {
    const auto original = ledger_.FindMessage(message_id);
    if (!original.has_value()) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }
    if (!original->is_own || original->sender_id != self_.device_id) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::NotPermitted("Only the sender can delete a message for everyone"));
    }

    std::optional<std::vector<uint8_t>> payload;
    if (original->attachment.has_value()) {
        auto loaded = ledger_.LoadAttachmentPayload(original->attachment->payload_ref);
        if (loaded.IsOk()) {
            payload = std::move(loaded).Unwrap();
        }
    }

    auto erased = EraseMessage(message_id);
    if (erased.IsErr()) {
        return Result<Unit, TetherFailure>::Err(std::move(erased).UnwrapErr());
    }
    if (!erased.Unwrap().has_value()) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }
    events_.PublishMessageDeleted(original->conversation_id, original->id);

    auto remote = backend_.DeleteMessageForEveryone(original->conversation_id, original->id, self_.device_id);
    if (remote.IsOk()) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }

    TETHER_LOG_FAILURE("engine", remote.UnwrapErr());
    if (payload.has_value()) {
        if (auto restored = ledger_.StoreAttachmentPayload(original->attachment->payload_ref, *payload);
            restored.IsErr()) {
            return restored;
        }
    }
    auto restored = ledger_.AppendMessage(*original);
    if (restored.IsErr()) {
        return Result<Unit, TetherFailure>::Err(std::move(restored).UnwrapErr());
    }
    events_.PublishMessageReceived(*original);
    return Result<Unit, TetherFailure>::Err(std::move(remote).UnwrapErr());
}

Result<Unit, TetherFailure> MessageLifecycleEngine::OnRemoteDeletion(const interfaces::DeletionNotice& notice) {
    if (notice.requester_id == self_.device_id) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }
    const auto message = ledger_.FindMessage(notice.message_id);
    if (!message.has_value()) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }
    if (message->sender_id != notice.requester_id) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::NotPermitted("Deletion requested by someone other than the sender"));
    }
    return DeleteForMe(notice.message_id);
}

Result<std::string, TetherFailure> MessageLifecycleEngine::BuildPayload(const Message& message) {
    auto contact = RequireContactForConversation(message.conversation_id);
    if (contact.IsErr()) {
        return Result<std::string, TetherFailure>::Err(std::move(contact).UnwrapErr());
    }
    if (!message.attachment.has_value()) {
        auto key = ConversationKey(contact.Unwrap());
        if (key.IsErr()) {
            return Result<std::string, TetherFailure>::Err(std::move(key).UnwrapErr());
        }
        return MessageCipher::Encrypt(message.text, *key.Unwrap());
    }

    auto ciphertext = ledger_.LoadAttachmentPayload(message.attachment->payload_ref);
    if (ciphertext.IsErr()) {
        return Result<std::string, TetherFailure>::Err(std::move(ciphertext).UnwrapErr());
    }
    return AttachmentCipher::PackForWire(
        crypto::EncryptedAttachment{*message.attachment, std::move(ciphertext).Unwrap()});
}

Result<size_t, TetherFailure> MessageLifecycleEngine::RetryPendingSync() {
    size_t synced = 0;
    for (const auto& message : ledger_.AllMessages()) {
        if (!message.is_own || !message.sync_pending) {
            continue;
        }
        auto payload = BuildPayload(message);
        if (payload.IsErr()) {
            return Result<size_t, TetherFailure>::Err(std::move(payload).UnwrapErr());
        }

        interfaces::WireMessage wire;
        wire.id = message.id;
        wire.conversation_id = message.conversation_id;
        wire.sender_id = self_.device_id;
        wire.payload = std::move(payload).Unwrap();
        wire.sent_at = message.sent_at.value_or(message.timestamp);
        wire.auto_delete_timer_minutes = message.auto_delete_timer_minutes;

        auto sent = backend_.SendMessage(wire);
        if (sent.IsErr()) {
            TETHER_LOG_FAILURE("engine", sent.UnwrapErr());
            continue;
        }
        auto cleared = MutateMessage(message.id, [](Message& m) {
            if (!m.sync_pending) {
                return false;
            }
            m.sync_pending = false;
            return true;
        });
        if (cleared.IsErr()) {
            return Result<size_t, TetherFailure>::Err(std::move(cleared).UnwrapErr());
        }
        if (cleared.Unwrap().has_value()) {
            events_.PublishMessageStateChanged(*cleared.Unwrap());
        }
        ++synced;
    }
    return Result<size_t, TetherFailure>::Ok(synced);
}

Result<std::vector<uint8_t>, TetherFailure> MessageLifecycleEngine::OpenAttachment(std::string_view message_id) {
    const auto message = ledger_.FindMessage(message_id);
    if (!message.has_value()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::NotFound(fmt::format("No message {}", message_id)));
    }
    if (!message->attachment.has_value()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(
            TetherFailure::InvalidInput("Message carries no attachment"));
    }
    auto contact = RequireContactForConversation(message->conversation_id);
    if (contact.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(contact).UnwrapErr());
    }
    auto key = AttachmentKey(contact.Unwrap());
    if (key.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(key).UnwrapErr());
    }
    auto ciphertext = ledger_.LoadAttachmentPayload(message->attachment->payload_ref);
    if (ciphertext.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(ciphertext).UnwrapErr());
    }
    auto opened = AttachmentCipher::Decrypt(*message->attachment, ciphertext.Unwrap(), *key.Unwrap());
    if (message->authenticity != MessageAuthenticity::Unverified) {
        return opened;
    }
    if (opened.IsErr() && !opened.UnwrapErr().Is(TetherFailureType::DecryptionFailed)) {
        return opened;
    }
    const auto verdict = opened.IsOk() ? MessageAuthenticity::Authenticated : MessageAuthenticity::Undecryptable;
    auto settled = MutateMessage(message_id, [verdict](Message& m) {
        if (m.authenticity != MessageAuthenticity::Unverified) {
            return false;
        }
        m.authenticity = verdict;
        return true;
    });
    if (settled.IsErr()) {
        return Result<std::vector<uint8_t>, TetherFailure>::Err(std::move(settled).UnwrapErr());
    }
    if (settled.Unwrap().has_value()) {
        events_.PublishMessageStateChanged(*settled.Unwrap());
    }
    return opened;
}

}
