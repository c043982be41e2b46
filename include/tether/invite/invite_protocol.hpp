#pragma once
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include "tether/configuration/messenger_config.hpp"
#include "tether/contacts/contact_ledger.hpp"
#include "tether/identity/identity_store.hpp"
#include "tether/interfaces/i_backend.hpp"
#include "tether/interfaces/i_clock.hpp"
#include "tether/interfaces/i_key_value_store.hpp"
#include "tether/messaging/event_hub.hpp"
#include "tether/models/contact.hpp"
#include "tether/models/group_marking.hpp"
#include "tether/models/invite.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::invite {

struct GroupInvite {
    models::Invite invite;
    models::GroupMarking group;
};

/**
 * Pairing between two devices, or a device and a group.
 *
 * The issuing side mints invites and registers them with the relay; the
 * scanning side validates a decoded QR payload and redeems it. The relay's
 * registry has the final word on use and capacity, the local checks only
 * turn the common failures into early, specific errors:
 *
 *   InvalidFormat -> Expired -> AlreadyUsed | AlreadyJoined | GroupFull
 *     -> SelfPairingRejected -> ContactWasDeleted
 *
 * A personal invite is single-use. As soon as the issuer learns it was
 * redeemed it mints a replacement and publishes InviteRotated.
 */
class InviteProtocol {
public:
    InviteProtocol(
        identity::DeviceIdentity self,
        std::string display_name,
        contacts::ContactLedger& ledger,
        interfaces::IBackend& backend,
        interfaces::IKeyValueStore& store,
        const messaging::EventHub& events,
        const interfaces::IClock& clock,
        configuration::MessengerConfig config);

    ~InviteProtocol();

    InviteProtocol(const InviteProtocol&) = delete;
    InviteProtocol& operator=(const InviteProtocol&) = delete;

    /// The stored invite while it is still redeemable, otherwise a fresh one.
    [[nodiscard]] Result<models::Invite, TetherFailure> IssuePersonalInvite();

    /// max_members must lie in [2, 50] and counts the devices that may join.
    /// The issuer is the first member on top of that.
    [[nodiscard]] Result<GroupInvite, TetherFailure> IssueGroupInvite(
        uint32_t max_members,
        std::string_view group_name);

    [[nodiscard]] Result<std::string, TetherFailure> EncodeForQr(const models::Invite& invite) const;

    /// Redeem a scanned QR string. Returns the contact (or group entry) now in the ledger.
    [[nodiscard]] Result<models::Contact, TetherFailure> RedeemInvite(
        std::string_view scanned,
        std::string_view redeemer_name);

    /**
     * Issuer side of a redemption reported by the relay.
     *
     * A redeemer this device removed is refused with ContactWasDeleted and
     * leaves the current invite alone. Otherwise personal invites get a
     * reciprocal contact and the invite is rotated. For group invites the
     * local membership record is refreshed.
     */
    [[nodiscard]] Result<models::Contact, TetherFailure> HandleIncomingContact(
        const interfaces::PairingNotice& notice);

    /// Merge the relay's record of personal pairings. Returns the contacts that were new here.
    [[nodiscard]] Result<std::vector<models::Contact>, TetherFailure> SyncPairings();

    [[nodiscard]] std::optional<models::Invite> CurrentInvite() const;

    [[nodiscard]] const std::string& GetDisplayName() const noexcept { return display_name_; }

    /// "INV-" + 10 symbols from the unambiguous alphabet.
    [[nodiscard]] static std::string GenerateInviteCode();

    /// "grp_" + 16 lowercase hex characters.
    [[nodiscard]] static std::string GenerateGroupId();

private:
    [[nodiscard]] models::InviteIssuer SelfAsIssuer() const;

    [[nodiscard]] Result<models::Invite, TetherFailure> MintPersonalLocked(models::TimePoint now);

    [[nodiscard]] std::optional<models::Invite> LoadCurrentLocked() const;
    [[nodiscard]] Result<Unit, TetherFailure> PersistCurrentLocked(const models::Invite& invite);

    /// Local pre-checks against the relay's view of the invite.
    [[nodiscard]] Result<Unit, TetherFailure> CheckRedeemable(
        const interfaces::InviteSnapshot& snapshot,
        std::string_view scanned_public_key,
        models::TimePoint now) const;

    identity::DeviceIdentity self_;
    std::string display_name_;
    contacts::ContactLedger& ledger_;
    interfaces::IBackend& backend_;
    interfaces::IKeyValueStore& store_;
    const messaging::EventHub& events_;
    const interfaces::IClock& clock_;
    configuration::MessengerConfig config_;

    // Guards the current-invite record; never held across relay callbacks into this object.
    mutable std::mutex invite_mutex_;
};

}
