#include "tether/system/messenger_system.hpp"
#include "tether/debug/event_logger.hpp"

namespace tether::system {

MessengerSystem::MessengerSystem(
    interfaces::IBackend& backend,
    identity::DeviceIdentity identity,
    std::unique_ptr<contacts::ContactLedger> ledger)
    : backend_(backend)
    , identity_(std::move(identity))
    , ledger_(std::move(ledger))
{
}

Result<std::unique_ptr<MessengerSystem>, TetherFailure> MessengerSystem::Create(
    interfaces::IKeyValueStore& store,
    interfaces::IBackend& backend,
    const interfaces::IClock& clock,
    std::string display_name,
    configuration::MessengerConfig config) {

    using SystemResult = Result<std::unique_ptr<MessengerSystem>, TetherFailure>;

    if (display_name.empty()) {
        return SystemResult::Err(TetherFailure::InvalidInput("Display name cannot be empty"));
    }

    identity::IdentityStore identity_store(store);
    auto identity = identity_store.GetOrCreateIdentity();
    if (identity.IsErr()) {
        return SystemResult::Err(std::move(identity).UnwrapErr());
    }
    auto ledger = contacts::ContactLedger::Open(store);
    if (ledger.IsErr()) {
        return SystemResult::Err(std::move(ledger).UnwrapErr());
    }

    std::unique_ptr<MessengerSystem> system(
        new MessengerSystem(backend, std::move(identity).Unwrap(), std::move(ledger).Unwrap()));

    system->engine_ = std::make_unique<messaging::MessageLifecycleEngine>(
        messaging::LocalDevice{system->identity_.device_id, system->identity_.key_pair.private_key},
        *system->ledger_,
        backend,
        system->events_,
        clock,
        config);
    system->invites_ = std::make_unique<invite::InviteProtocol>(
        system->identity_,
        std::move(display_name),
        *system->ledger_,
        backend,
        store,
        system->events_,
        clock,
        config);

    if (auto subscribed = system->SubscribeAll(); subscribed.IsErr()) {
        return SystemResult::Err(std::move(subscribed).UnwrapErr());
    }
    // Pairings completed while this device was not listening.
    if (auto synced = system->SyncContacts(); synced.IsErr()) {
        TETHER_LOG_FAILURE("system", synced.UnwrapErr());
    }
    TETHER_LOG_ID("system", "device ready", system->identity_.device_id);
    return SystemResult::Ok(std::move(system));
}

MessengerSystem::~MessengerSystem() {
    UnsubscribeAll();
    if (engine_) {
        engine_->StopSweeper();
    }
}

Result<Unit, TetherFailure> MessengerSystem::SubscribeAll() {
    for (const auto& contact : ledger_->Contacts()) {
        if (auto subscribed = SubscribeConversation(contact); subscribed.IsErr()) {
            return subscribed;
        }
    }

    auto subscription = backend_.SubscribeToNewContacts(
        identity_.device_id,
        [this](const interfaces::PairingNotice& notice) { OnPairingNotice(notice); });
    if (subscription.IsErr()) {
        return Result<Unit, TetherFailure>::Err(std::move(subscription).UnwrapErr());
    }
    std::lock_guard lock(subscriptions_mutex_);
    contact_subscription_ = subscription.Unwrap();
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Unit, TetherFailure> MessengerSystem::SubscribeConversation(const models::Contact& contact) {
    {
        std::lock_guard lock(subscriptions_mutex_);
        if (conversation_subscriptions_.contains(contact.conversation_id)) {
            return Result<Unit, TetherFailure>::Ok(unit);
        }
    }

    interfaces::ConversationListener listener;
    listener.on_message = [this](const interfaces::WireMessage& wire) {
        if (auto received = engine_->OnIncoming(wire); received.IsErr()) {
            TETHER_LOG_FAILURE("system", received.UnwrapErr());
        }
    };
    listener.on_receipt = [this](const interfaces::Receipt& receipt) {
        if (auto applied = engine_->OnReceipt(receipt); applied.IsErr()) {
            TETHER_LOG_FAILURE("system", applied.UnwrapErr());
        }
    };
    listener.on_deletion = [this](const interfaces::DeletionNotice& notice) {
        if (auto deleted = engine_->OnRemoteDeletion(notice); deleted.IsErr()) {
            TETHER_LOG_FAILURE("system", deleted.UnwrapErr());
        }
    };

    auto subscription = backend_.Subscribe(contact.conversation_id, identity_.device_id, std::move(listener));
    if (subscription.IsErr()) {
        return Result<Unit, TetherFailure>::Err(std::move(subscription).UnwrapErr());
    }

    std::lock_guard lock(subscriptions_mutex_);
    const auto [it, inserted] = conversation_subscriptions_.try_emplace(contact.conversation_id, subscription.Unwrap());
    if (!inserted) {
        // Lost a race with another subscriber for the same conversation.
        backend_.Unsubscribe(subscription.Unwrap());
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

void MessengerSystem::OnPairingNotice(const interfaces::PairingNotice& notice) {
    auto contact = invites_->HandleIncomingContact(notice);
    if (contact.IsErr()) {
        TETHER_LOG_FAILURE("system", contact.UnwrapErr());
        return;
    }
    if (auto subscribed = SubscribeConversation(contact.Unwrap()); subscribed.IsErr()) {
        TETHER_LOG_FAILURE("system", subscribed.UnwrapErr());
    }
}

void MessengerSystem::UnsubscribeAll() {
    std::map<std::string, interfaces::SubscriptionId, std::less<>> conversations;
    std::optional<interfaces::SubscriptionId> contacts;
    {
        std::lock_guard lock(subscriptions_mutex_);
        conversations.swap(conversation_subscriptions_);
        contacts.swap(contact_subscription_);
    }
    for (const auto& [conversation_id, id] : conversations) {
        backend_.Unsubscribe(id);
    }
    if (contacts.has_value()) {
        backend_.Unsubscribe(*contacts);
    }
}

messaging::HandlerToken MessengerSystem::AddEventHandler(std::shared_ptr<interfaces::IMessengerEventHandler> handler) {
    return events_.Subscribe(std::move(handler));
}

void MessengerSystem::RemoveEventHandler(const messaging::HandlerToken token) {
    events_.Unsubscribe(token);
}

Result<models::Invite, TetherFailure> MessengerSystem::IssuePersonalInvite() {
    return invites_->IssuePersonalInvite();
}

Result<invite::GroupInvite, TetherFailure> MessengerSystem::IssueGroupInvite(
    const uint32_t max_members,
    std::string_view group_name) {

    auto issued = invites_->IssueGroupInvite(max_members, group_name);
    if (issued.IsErr()) {
        return issued;
    }
    if (const auto entry = ledger_->FindContact(issued.Unwrap().group.GetGroupId())) {
        if (auto subscribed = SubscribeConversation(*entry); subscribed.IsErr()) {
            return Result<invite::GroupInvite, TetherFailure>::Err(std::move(subscribed).UnwrapErr());
        }
    }
    return issued;
}

Result<std::string, TetherFailure> MessengerSystem::EncodeInvite(const models::Invite& invite) const {
    return invites_->EncodeForQr(invite);
}

Result<models::Contact, TetherFailure> MessengerSystem::RedeemInvite(std::string_view scanned) {
    auto contact = invites_->RedeemInvite(scanned, invites_->GetDisplayName());
    if (contact.IsErr()) {
        return contact;
    }
    if (auto subscribed = SubscribeConversation(contact.Unwrap()); subscribed.IsErr()) {
        return Result<models::Contact, TetherFailure>::Err(std::move(subscribed).UnwrapErr());
    }
    return contact;
}

std::vector<models::Contact> MessengerSystem::Contacts() const {
    return ledger_->Contacts();
}

std::optional<models::Contact> MessengerSystem::FindContact(std::string_view contact_id) const {
    return ledger_->FindContact(contact_id);
}

Result<Unit, TetherFailure> MessengerSystem::RemoveContact(std::string_view contact_id) {
    const auto contact = ledger_->FindContact(contact_id);
    if (auto removed = ledger_->RemoveContact(contact_id); removed.IsErr()) {
        return removed;
    }
    engine_->ForgetContact(contact_id);
    if (!contact.has_value()) {
        return Result<Unit, TetherFailure>::Ok(unit);
    }
    if (contact->group_id.empty()) {
        if (auto blocked = backend_.BlockContact(identity_.device_id, contact->id); blocked.IsErr()) {
            TETHER_LOG_FAILURE("system", blocked.UnwrapErr());
        }
    }

    std::optional<interfaces::SubscriptionId> subscription;
    {
        std::lock_guard lock(subscriptions_mutex_);
        if (const auto it = conversation_subscriptions_.find(contact->conversation_id);
            it != conversation_subscriptions_.end()) {
            subscription = it->second;
            conversation_subscriptions_.erase(it);
        }
    }
    if (subscription.has_value()) {
        backend_.Unsubscribe(*subscription);
    }

    models::Contact tombstoned = *contact;
    tombstoned.is_deleted = true;
    events_.PublishContactUpdated(tombstoned);
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<size_t, TetherFailure> MessengerSystem::SyncContacts() {
    auto inserted = invites_->SyncPairings();
    if (inserted.IsErr()) {
        return Result<size_t, TetherFailure>::Err(std::move(inserted).UnwrapErr());
    }
    for (const auto& contact : inserted.Unwrap()) {
        if (auto subscribed = SubscribeConversation(contact); subscribed.IsErr()) {
            return Result<size_t, TetherFailure>::Err(std::move(subscribed).UnwrapErr());
        }
    }
    return Result<size_t, TetherFailure>::Ok(inserted.Unwrap().size());
}

Result<models::Contact, TetherFailure> MessengerSystem::UpdateContactPrivacy(
    std::string_view contact_id,
    const models::PrivacySettings& privacy) {

    auto updated = ledger_->UpdateContactPrivacy(contact_id, privacy);
    if (updated.IsOk()) {
        events_.PublishContactUpdated(updated.Unwrap());
    }
    return updated;
}

Result<models::Message, TetherFailure> MessengerSystem::SendText(
    std::string_view contact_id,
    std::string_view text,
    const std::optional<uint32_t> auto_delete_minutes) {
    return engine_->SendText(contact_id, text, auto_delete_minutes);
}

std::future<Result<models::Message, TetherFailure>> MessengerSystem::SendTextAsync(
    std::string contact_id,
    std::string text,
    const std::optional<uint32_t> auto_delete_minutes) {
    return engine_->SendTextAsync(std::move(contact_id), std::move(text), auto_delete_minutes);
}

Result<models::Message, TetherFailure> MessengerSystem::SendAttachment(
    std::string_view contact_id,
    std::span<const uint8_t> blob,
    crypto::AttachmentDescriptor descriptor,
    const std::optional<uint32_t> auto_delete_minutes) {
    return engine_->SendAttachment(contact_id, blob, std::move(descriptor), auto_delete_minutes);
}

Result<std::vector<uint8_t>, TetherFailure> MessengerSystem::OpenAttachment(std::string_view message_id) {
    return engine_->OpenAttachment(message_id);
}

std::vector<models::Message> MessengerSystem::Conversation(std::string_view conversation_id) const {
    return ledger_->MessagesFor(conversation_id);
}

Result<size_t, TetherFailure> MessengerSystem::MarkConversationViewed(std::string_view conversation_id) {
    return engine_->MarkConversationViewed(conversation_id);
}

Result<Unit, TetherFailure> MessengerSystem::DeleteForMe(std::string_view message_id) {
    return engine_->DeleteForMe(message_id);
}

Result<Unit, TetherFailure> MessengerSystem::DeleteForEveryone(std::string_view message_id) {
    return engine_->DeleteForEveryone(message_id);
}

Result<size_t, TetherFailure> MessengerSystem::Sweep() {
    return engine_->Sweep();
}

Result<size_t, TetherFailure> MessengerSystem::RetryPendingSync() {
    return engine_->RetryPendingSync();
}

void MessengerSystem::StartSweeper() {
    engine_->StartSweeper();
}

void MessengerSystem::StopSweeper() {
    engine_->StopSweeper();
}

}
