#include "tether/invite/invite_protocol.hpp"
#include "tether/core/constants.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/debug/event_logger.hpp"
#include "tether/invite/invite_codec.hpp"

#include <fmt/core.h>

namespace tether::invite {

using crypto::SodiumInterop;
using models::Contact;
using models::Invite;

InviteProtocol::InviteProtocol(
    identity::DeviceIdentity self,
    std::string display_name,
    contacts::ContactLedger& ledger,
    interfaces::IBackend& backend,
    interfaces::IKeyValueStore& store,
    const messaging::EventHub& events,
    const interfaces::IClock& clock,
    configuration::MessengerConfig config)
    : self_(std::move(self))
    , display_name_(std::move(display_name))
    , ledger_(ledger)
    , backend_(backend)
    , store_(store)
    , events_(events)
    , clock_(clock)
    , config_(config)
{
}

InviteProtocol::~InviteProtocol() {
    auto wiped = SodiumInterop::SecureWipe(self_.key_pair.private_key);
    (void)wiped;
}

std::string InviteProtocol::GenerateInviteCode() {
    auto bytes = SodiumInterop::GetRandomBytes(InviteConstants::CODE_SYMBOLS);
    constexpr auto alphabet = IdentityConstants::USER_ID_ALPHABET;
    std::string code(InviteConstants::CODE_PREFIX);
    code.reserve(code.size() + bytes.size());
    for (const uint8_t b : bytes) {
        code.push_back(alphabet[b % alphabet.size()]);
    }
    return code;
}

std::string InviteProtocol::GenerateGroupId() {
    return fmt::format("{}{}", InviteConstants::GROUP_ID_PREFIX,
                       SodiumInterop::ToHex(SodiumInterop::GetRandomBytes(InviteConstants::GROUP_ID_RANDOM_BYTES)));
}

models::InviteIssuer InviteProtocol::SelfAsIssuer() const {
    return models::InviteIssuer{self_.device_id, self_.user_id, display_name_, self_.key_pair.public_key};
}

std::optional<Invite> InviteProtocol::LoadCurrentLocked() const {
    auto raw = store_.Get(InviteConstants::KEY_CURRENT_INVITE);
    if (raw.IsErr()) {
        TETHER_LOG_FAILURE("invite", raw.UnwrapErr());
        return std::nullopt;
    }
    if (!raw.Unwrap().has_value()) {
        return std::nullopt;
    }
    proto::invite::InviteRecord record;
    if (!record.ParseFromString(*raw.Unwrap())) {
        TETHER_LOG_MSG("invite", "stored invite record is unreadable");
        return std::nullopt;
    }
    auto invite = Invite::FromProto(record);
    if (invite.IsErr()) {
        TETHER_LOG_FAILURE("invite", invite.UnwrapErr());
        return std::nullopt;
    }
    return std::move(invite).Unwrap();
}

Result<Unit, TetherFailure> InviteProtocol::PersistCurrentLocked(const Invite& invite) {
    std::string bytes;
    if (!invite.ToProto().SerializeToString(&bytes)) {
        return Result<Unit, TetherFailure>::Err(TetherFailure::Encode("Failed to serialize invite record"));
    }
    return store_.Set(InviteConstants::KEY_CURRENT_INVITE, std::move(bytes));
}

Result<Invite, TetherFailure> InviteProtocol::MintPersonalLocked(const models::TimePoint now) {
    auto invite = Invite::Create(GenerateInviteCode(), SelfAsIssuer(), now, now + config_.GetInviteTtl());
    if (invite.IsErr()) {
        return invite;
    }
    if (auto registered = backend_.CreateInvite(invite.Unwrap()); registered.IsErr()) {
        return Result<Invite, TetherFailure>::Err(std::move(registered).UnwrapErr());
    }
    if (auto persisted = PersistCurrentLocked(invite.Unwrap()); persisted.IsErr()) {
        return Result<Invite, TetherFailure>::Err(std::move(persisted).UnwrapErr());
    }
    TETHER_LOG_ID("invite", "minted", invite.Unwrap().GetCode());
    return invite;
}

Result<Invite, TetherFailure> InviteProtocol::IssuePersonalInvite() {
    const auto now = clock_.Now();
    std::lock_guard lock(invite_mutex_);

    if (auto current = LoadCurrentLocked(); current.has_value() && current->IsActive(now)) {
        auto snapshot = backend_.InspectInvite(current->GetCode());
        if (snapshot.IsOk() && snapshot.Unwrap().invite.IsActive(now)) {
            return Result<Invite, TetherFailure>::Ok(std::move(*current));
        }
        // The relay lost the record; hand it the same invite again.
        if (snapshot.IsErr() && snapshot.UnwrapErr().Is(TetherFailureType::InvalidFormat)) {
            if (auto registered = backend_.CreateInvite(*current); registered.IsOk()) {
                return Result<Invite, TetherFailure>::Ok(std::move(*current));
            }
        } else if (snapshot.IsErr()) {
            return Result<Invite, TetherFailure>::Err(std::move(snapshot).UnwrapErr());
        }
    }
    return MintPersonalLocked(now);
}

Result<GroupInvite, TetherFailure> InviteProtocol::IssueGroupInvite(
    const uint32_t max_members,
    std::string_view group_name) {

    if (max_members < configuration::MessengerConfig::GetMinGroupMembers()
        || max_members > configuration::MessengerConfig::GetMaxGroupMembers()) {
        return Result<GroupInvite, TetherFailure>::Err(TetherFailure::InvalidInput(
            fmt::format("Group size must be between {} and {}, got {}",
                        configuration::MessengerConfig::GetMinGroupMembers(),
                        configuration::MessengerConfig::GetMaxGroupMembers(),
                        max_members)));
    }

    const auto now = clock_.Now();
    const std::string group_id = GenerateGroupId();

    auto group = models::GroupMarking::Create(group_id, self_.device_id, max_members, std::string(group_name), now);
    if (group.IsErr()) {
        return Result<GroupInvite, TetherFailure>::Err(std::move(group).UnwrapErr());
    }
    auto invite = Invite::Create(GenerateInviteCode(), SelfAsIssuer(), now, now + config_.GetInviteTtl(), group_id);
    if (invite.IsErr()) {
        return Result<GroupInvite, TetherFailure>::Err(std::move(invite).UnwrapErr());
    }

    if (auto registered = backend_.CreateGroupInvite(invite.Unwrap(), group.Unwrap()); registered.IsErr()) {
        return Result<GroupInvite, TetherFailure>::Err(std::move(registered).UnwrapErr());
    }
    if (auto recorded = ledger_.RecordGroup(group.Unwrap()); recorded.IsErr()) {
        return Result<GroupInvite, TetherFailure>::Err(std::move(recorded).UnwrapErr());
    }

    Contact entry;
    entry.id = group_id;
    entry.name = std::string(group_name);
    entry.public_key = self_.key_pair.public_key;
    entry.pairing_code = invite.Unwrap().GetCode();
    entry.conversation_id = group_id;
    entry.paired_at = now;
    entry.is_verified = true;
    entry.group_id = group_id;

    auto stored = ledger_.AddContact(std::move(entry));
    if (stored.IsErr()) {
        return Result<GroupInvite, TetherFailure>::Err(std::move(stored).UnwrapErr());
    }
    events_.PublishContactUpdated(stored.Unwrap());
    TETHER_LOG_ID("invite", "group created", group_id);

    return Result<GroupInvite, TetherFailure>::Ok(
        GroupInvite{std::move(invite).Unwrap(), std::move(group).Unwrap()});
}

Result<std::string, TetherFailure> InviteProtocol::EncodeForQr(const Invite& invite) const {
    std::optional<models::GroupMarking> group;
    if (invite.IsGroupInvite()) {
        group = ledger_.FindGroup(*invite.GetGroupId());
    }
    return InviteCodec::Encode(InvitePayload::FromInvite(invite, group));
}

Result<Unit, TetherFailure> InviteProtocol::CheckRedeemable(
    const interfaces::InviteSnapshot& snapshot,
    std::string_view scanned_public_key,
    const models::TimePoint now) const {

    const Invite& invite = snapshot.invite;
    if (invite.IsExpired(now)) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::Expired(fmt::format("Invite {} has expired", invite.GetCode())));
    }

    if (!invite.IsGroupInvite()) {
        if (invite.IsUsed()) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::AlreadyUsed(fmt::format("Invite {} was already used", invite.GetCode())));
        }
    } else {
        if (!snapshot.group.has_value()) {
            return Result<Unit, TetherFailure>::Err(
                TetherFailure::NotFound(fmt::format("Group behind invite {} is gone", invite.GetCode())));
        }
        if (snapshot.group->HasMember(self_.device_id)) {
            return Result<Unit, TetherFailure>::Err(TetherFailure::AlreadyJoined(
                fmt::format("Already a member of group {}", snapshot.group->GetGroupId())));
        }
        if (snapshot.group->IsFull()) {
            return Result<Unit, TetherFailure>::Err(TetherFailure::GroupFull(
                fmt::format("Group {} is full ({} joined)",
                            snapshot.group->GetGroupId(), snapshot.group->GetMaxMembers())));
        }
    }

    const models::InviteIssuer& issuer = invite.GetIssuer();
    if (scanned_public_key == self_.key_pair.public_key
        || issuer.public_key == self_.key_pair.public_key
        || issuer.device_id == self_.device_id) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::SelfPairingRejected("Cannot redeem an invite issued by this device"));
    }

    const bool tombstoned = invite.IsGroupInvite()
        ? ledger_.IsTombstoned(*invite.GetGroupId())
        : ledger_.IsTombstoned(issuer.device_id)
            || (!issuer.user_id.empty() && ledger_.IsTombstoned(issuer.user_id))
            || ledger_.IsTombstoned(models::MakeConversationId(issuer.device_id, self_.device_id));
    if (tombstoned) {
        return Result<Unit, TetherFailure>::Err(
            TetherFailure::ContactWasDeleted(std::string(ErrorMessages::CONTACT_TOMBSTONED)));
    }
    return Result<Unit, TetherFailure>::Ok(unit);
}

Result<Contact, TetherFailure> InviteProtocol::RedeemInvite(
    std::string_view scanned,
    std::string_view redeemer_name) {

    const auto now = clock_.Now();

    auto decoded = InviteCodec::Decode(scanned, now);
    if (decoded.IsErr()) {
        return Result<Contact, TetherFailure>::Err(std::move(decoded).UnwrapErr());
    }
    const InvitePayload& payload = decoded.Unwrap();
    if (now >= payload.expires_at) {
        return Result<Contact, TetherFailure>::Err(
            TetherFailure::Expired(fmt::format("Invite {} has expired", payload.code)));
    }

    auto snapshot = backend_.InspectInvite(payload.code);
    if (snapshot.IsErr()) {
        return Result<Contact, TetherFailure>::Err(std::move(snapshot).UnwrapErr());
    }
    if (payload.public_key != snapshot.Unwrap().invite.GetIssuer().public_key) {
        TETHER_LOG_ID("invite", "scanned key differs from issuer", payload.code);
        return Result<Contact, TetherFailure>::Err(TetherFailure::InvalidFormat(
            fmt::format("Invite {} does not carry its issuer's key", payload.code)));
    }
    if (auto redeemable = CheckRedeemable(snapshot.Unwrap(), payload.public_key, now); redeemable.IsErr()) {
        TETHER_LOG_FAILURE("invite", redeemable.UnwrapErr());
        return Result<Contact, TetherFailure>::Err(std::move(redeemable).UnwrapErr());
    }

    const std::string name = redeemer_name.empty() ? display_name_ : std::string(redeemer_name);
    interfaces::RedeemRequest request{
        payload.code,
        models::InviteIssuer{self_.device_id, self_.user_id, name, self_.key_pair.public_key},
        std::nullopt};

    auto redeemed = backend_.RedeemInvite(request);
    if (redeemed.IsErr()) {
        TETHER_LOG_FAILURE("invite", redeemed.UnwrapErr());
        return Result<Contact, TetherFailure>::Err(std::move(redeemed).UnwrapErr());
    }
    const interfaces::RedeemOutcome& outcome = redeemed.Unwrap();

    Contact contact;
    contact.public_key = outcome.issuer.public_key;
    contact.pairing_code = payload.code;
    contact.conversation_id = outcome.conversation_id;
    contact.paired_at = now;
    contact.is_verified = true;

    if (outcome.group.has_value()) {
        if (auto recorded = ledger_.RecordGroup(*outcome.group); recorded.IsErr()) {
            return Result<Contact, TetherFailure>::Err(std::move(recorded).UnwrapErr());
        }
        contact.id = outcome.group->GetGroupId();
        contact.name = outcome.group->GetName();
        contact.group_id = outcome.group->GetGroupId();
    } else {
        contact.id = outcome.issuer.device_id;
        contact.contact_user_id = outcome.issuer.user_id;
        contact.name = outcome.issuer.name;
    }

    auto stored = ledger_.AddContact(std::move(contact));
    if (stored.IsErr()) {
        return stored;
    }
    events_.PublishContactUpdated(stored.Unwrap());
    TETHER_LOG_ID("invite", "paired via", payload.code);
    return stored;
}

Result<Contact, TetherFailure> InviteProtocol::HandleIncomingContact(const interfaces::PairingNotice& notice) {
    if (notice.redeemer.device_id.empty() || notice.redeemer.device_id == self_.device_id) {
        return Result<Contact, TetherFailure>::Err(
            TetherFailure::InvalidInput("Pairing notice carries no foreign redeemer"));
    }
    const auto now = clock_.Now();

    if (notice.group.has_value()) {
        if (auto recorded = ledger_.RecordGroup(*notice.group); recorded.IsErr()) {
            return Result<Contact, TetherFailure>::Err(std::move(recorded).UnwrapErr());
        }
        auto entry = ledger_.FindContact(notice.group->GetGroupId());
        if (!entry.has_value()) {
            return Result<Contact, TetherFailure>::Err(
                TetherFailure::NotFound(fmt::format("No conversation for group {}", notice.group->GetGroupId())));
        }
        events_.PublishContactUpdated(*entry);
        return Result<Contact, TetherFailure>::Ok(std::move(*entry));
    }

    const std::string conversation_id = notice.conversation_id.empty()
        ? models::MakeConversationId(self_.device_id, notice.redeemer.device_id)
        : notice.conversation_id;
    if (ledger_.IsTombstoned(notice.redeemer.device_id)
        || (!notice.redeemer.user_id.empty() && ledger_.IsTombstoned(notice.redeemer.user_id))
        || ledger_.IsTombstoned(conversation_id)) {
        TETHER_LOG_ID("invite", "pairing from removed contact ignored", notice.redeemer.device_id);
        return Result<Contact, TetherFailure>::Err(
            TetherFailure::ContactWasDeleted(std::string(ErrorMessages::CONTACT_TOMBSTONED)));
    }

    {
        std::lock_guard lock(invite_mutex_);
        const auto current = LoadCurrentLocked();
        if (current.has_value() && current->GetCode() == notice.invite_code) {
            if (auto cleared = store_.Delete(InviteConstants::KEY_CURRENT_INVITE); cleared.IsErr()) {
                TETHER_LOG_FAILURE("invite", cleared.UnwrapErr());
            }
            auto rotated = MintPersonalLocked(now);
            if (rotated.IsOk()) {
                events_.PublishInviteRotated(rotated.Unwrap());
            } else {
                TETHER_LOG_FAILURE("invite", rotated.UnwrapErr());
            }
        }
    }

    Contact contact;
    contact.id = notice.redeemer.device_id;
    contact.contact_user_id = notice.redeemer.user_id;
    contact.name = notice.redeemer.name;
    contact.public_key = notice.redeemer.public_key;
    contact.pairing_code = notice.invite_code;
    contact.conversation_id = conversation_id;
    contact.paired_at = now;
    contact.is_verified = true;

    auto stored = ledger_.AddContact(std::move(contact));
    if (stored.IsErr()) {
        TETHER_LOG_FAILURE("invite", stored.UnwrapErr());
        return stored;
    }
    events_.PublishContactUpdated(stored.Unwrap());
    return stored;
}

Result<std::vector<Contact>, TetherFailure> InviteProtocol::SyncPairings() {
    auto pairings = backend_.ListPairings(self_.device_id);
    if (pairings.IsErr()) {
        return Result<std::vector<Contact>, TetherFailure>::Err(std::move(pairings).UnwrapErr());
    }

    std::vector<Contact> inserted;
    for (const auto& record : pairings.Unwrap()) {
        Contact contact;
        contact.id = record.peer.device_id;
        contact.contact_user_id = record.peer.user_id;
        contact.name = record.peer.name;
        contact.public_key = record.peer.public_key;
        contact.pairing_code = record.invite_code;
        contact.conversation_id = record.conversation_id;
        contact.paired_at = record.paired_at;
        contact.is_verified = true;

        auto merged = ledger_.MergeDiscovered(contact);
        if (merged.IsErr()) {
            return Result<std::vector<Contact>, TetherFailure>::Err(std::move(merged).UnwrapErr());
        }
        if (merged.Unwrap() != contacts::MergeOutcome::Inserted) {
            continue;
        }
        events_.PublishContactUpdated(contact);
        TETHER_LOG_ID("invite", "pairing recovered from relay", contact.id);
        inserted.push_back(std::move(contact));
    }
    return Result<std::vector<Contact>, TetherFailure>::Ok(std::move(inserted));
}

std::optional<Invite> InviteProtocol::CurrentInvite() const {
    const auto now = clock_.Now();
    std::lock_guard lock(invite_mutex_);
    auto current = LoadCurrentLocked();
    if (current.has_value() && current->IsActive(now)) {
        return current;
    }
    return std::nullopt;
}

}
