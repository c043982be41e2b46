#include <catch2/catch_test_macros.hpp>
#include "tether/messaging/message_lifecycle_engine.hpp"
#include "tether/backend/loopback_backend.hpp"
#include "tether/contacts/contact_ledger.hpp"
#include "tether/crypto/attachment_cipher.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/storage/in_memory_key_value_store.hpp"
#include "helpers/manual_clock.hpp"
#include "helpers/recording_event_handler.hpp"
#include <memory>
#include <string>
using namespace tether;
using namespace tether::messaging;
using namespace std::chrono_literals;
using models::MessageStatus;
namespace {
const std::string kAliceHex(64, '1');
const std::string kBobHex(64, '2');
const std::string kConversation = models::MakeConversationId("dev_alice", "dev_bob");
/// One device: its own storage, ledger and engine, subscribed to the shared relay.
struct Device {
    Device(std::string id, const std::string& secret, const std::string& peer_id, const std::string& peer_secret,
           backend::LoopbackBackend& relay, const interfaces::IClock& clock,
           configuration::MessengerConfig config = configuration::MessengerConfig::Default(),
           bool subscribe = true)
        : relay(relay)
        , device_id(std::move(id))
    {
        ledger = contacts::ContactLedger::Open(store).Unwrap();
        models::Contact peer;
        peer.id = peer_id;
        peer.name = peer_id;
        peer.public_key = "tpub_" + peer_secret;
        peer.conversation_id = kConversation;
        peer.is_verified = true;
        REQUIRE(ledger->AddContact(peer).IsOk());
        events.Subscribe(recorder);
        engine = std::make_unique<MessageLifecycleEngine>(
            LocalDevice{device_id, "tpriv_" + secret}, *ledger, this->relay, events, clock, config);
        if (subscribe) {
            interfaces::ConversationListener listener;
            listener.on_message = [this](const interfaces::WireMessage& wire) { (void)engine->OnIncoming(wire); };
            listener.on_receipt = [this](const interfaces::Receipt& receipt) { (void)engine->OnReceipt(receipt); };
            listener.on_deletion = [this](const interfaces::DeletionNotice& notice) { (void)engine->OnRemoteDeletion(notice); };
            subscription = this->relay.Subscribe(kConversation, device_id, std::move(listener)).Unwrap();
        }
    }
    ~Device() {
        if (subscription != 0) {
            relay.Unsubscribe(subscription);
        }
    }
    std::optional<models::Message> Find(const std::string& message_id) const {
        return ledger->FindMessage(message_id);
    }
    backend::LoopbackBackend& relay;
    std::string device_id;
    storage::InMemoryKeyValueStore store;
    std::unique_ptr<contacts::ContactLedger> ledger;
    EventHub events;
    std::shared_ptr<test::RecordingEventHandler> recorder = std::make_shared<test::RecordingEventHandler>();
    std::unique_ptr<MessageLifecycleEngine> engine;
    interfaces::SubscriptionId subscription = 0;
};
struct Pair {
    explicit Pair(configuration::MessengerConfig config = configuration::MessengerConfig::Default(),
                  bool bob_listens = true)
        : relay(clock)
        , alice("dev_alice", kAliceHex, "dev_bob", kBobHex, relay, clock, config)
        , bob("dev_bob", kBobHex, "dev_alice", kAliceHex, relay, clock, config, bob_listens) {}
    test::ManualClock clock;
    backend::LoopbackBackend relay;
    Device alice;
    Device bob;
};
}
TEST_CASE("MessageLifecycle - Sending text", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair;
    SECTION("Message reaches the peer and comes back Delivered") {
        auto sent = pair.alice.engine->SendText("dev_bob", "hello bob");
        REQUIRE(sent.IsOk());
        const auto& message = sent.Unwrap();
        REQUIRE(message.id.starts_with("msg_"));
        REQUIRE(message.is_own);
        REQUIRE(message.status == MessageStatus::Delivered);
        REQUIRE_FALSE(message.sync_pending);
        const auto received = pair.bob.Find(message.id);
        REQUIRE(received.has_value());
        REQUIRE(received->text == "hello bob");
        REQUIRE_FALSE(received->is_own);
        REQUIRE(received->status == MessageStatus::Delivered);
        REQUIRE(received->authenticity == models::MessageAuthenticity::Authenticated);
        REQUIRE(pair.bob.recorder->Received().size() == 1);
    }
    SECTION("The relay only ever sees ciphertext") {
        REQUIRE(pair.alice.engine->SendText("dev_bob", "do not read this").IsOk());
        const auto relayed = pair.relay.RelayedMessages();
        REQUIRE(relayed.size() == 1);
        REQUIRE(relayed[0].payload.starts_with("ENC2_"));
        REQUIRE(relayed[0].payload.find("do not read this") == std::string::npos);
    }
    SECTION("Invalid sends") {
        REQUIRE(pair.alice.engine->SendText("dev_bob", "").UnwrapErr().Is(TetherFailureType::InvalidInput));
        REQUIRE(pair.alice.engine->SendText("dev_nobody", "hi").UnwrapErr().Is(TetherFailureType::NotFound));
        REQUIRE(pair.alice.engine->SendText("dev_bob", "hi", MessagingConstants::MAX_AUTO_DELETE_MINUTES + 1)
                    .UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Asynchronous send") {
        auto future = pair.alice.engine->SendTextAsync("dev_bob", "from a worker");
        auto sent = future.get();
        REQUIRE(sent.IsOk());
        REQUIRE(pair.bob.Find(sent.Unwrap().id)->text == "from a worker");
    }
    SECTION("Removed contact cannot be messaged") {
        REQUIRE(pair.alice.ledger->RemoveContact("dev_bob").IsOk());
        pair.alice.engine->ForgetContact("dev_bob");
        REQUIRE(pair.alice.engine->SendText("dev_bob", "still there?").UnwrapErr().Is(TetherFailureType::ContactWasDeleted));
    }
}
TEST_CASE("MessageLifecycle - Seen and auto-delete", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair;
    const auto sent = pair.alice.engine->SendText("dev_bob", "self destructs", 5).Unwrap();
    REQUIRE_FALSE(sent.delete_at.has_value());
    REQUIRE(pair.bob.engine->MarkConversationViewed(kConversation).Unwrap() == 1);
    SECTION("Both copies are Seen and scheduled") {
        const auto bob_copy = pair.bob.Find(sent.id);
        REQUIRE(bob_copy->status == MessageStatus::Seen);
        REQUIRE(bob_copy->delete_at == std::optional<models::TimePoint>(pair.clock.Now() + 5min));
        const auto alice_copy = pair.alice.Find(sent.id);
        REQUIRE(alice_copy->status == MessageStatus::Seen);
        REQUIRE(alice_copy->delete_at.has_value());
    }
    SECTION("Viewing again changes nothing") {
        REQUIRE(pair.bob.engine->MarkConversationViewed(kConversation).Unwrap() == 0);
    }
    SECTION("Sweep erases once the timer runs out") {
        pair.clock.Advance(4min);
        REQUIRE(pair.bob.engine->Sweep().Unwrap() == 0);
        pair.clock.Advance(1min);
        REQUIRE(pair.bob.engine->Sweep().Unwrap() == 1);
        REQUIRE(pair.alice.engine->Sweep().Unwrap() == 1);
        REQUIRE_FALSE(pair.bob.Find(sent.id).has_value());
        REQUIRE_FALSE(pair.alice.Find(sent.id).has_value());
        REQUIRE(pair.bob.recorder->Deleted().size() == 1);
        REQUIRE(pair.bob.engine->Sweep().Unwrap() == 0);
    }
    SECTION("Status never moves backwards") {
        REQUIRE(pair.alice.engine->OnReceipt({interfaces::ReceiptKind::Delivered, kConversation, sent.id, "dev_bob"}).IsOk());
        REQUIRE(pair.alice.Find(sent.id)->status == MessageStatus::Seen);
    }
}
TEST_CASE("MessageLifecycle - Messages without a timer persist", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair;
    const auto sent = pair.alice.engine->SendText("dev_bob", "keep me").Unwrap();
    REQUIRE(pair.bob.engine->MarkConversationViewed(kConversation).Unwrap() == 1);
    pair.clock.Advance(24h * 30);
    REQUIRE(pair.bob.engine->Sweep().Unwrap() == 0);
    REQUIRE_FALSE(pair.bob.Find(sent.id)->delete_at.has_value());
}
TEST_CASE("MessageLifecycle - Offline relay", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair;
    pair.relay.SetOffline(true);
    auto sent = pair.alice.engine->SendText("dev_bob", "queued");
    REQUIRE(sent.IsOk());
    REQUIRE(sent.Unwrap().status == MessageStatus::Sent);
    REQUIRE(sent.Unwrap().sync_pending);
    REQUIRE_FALSE(pair.bob.Find(sent.Unwrap().id).has_value());
    SECTION("Retry fails quietly while still offline") {
        REQUIRE(pair.alice.engine->RetryPendingSync().Unwrap() == 0);
        REQUIRE(pair.alice.Find(sent.Unwrap().id)->sync_pending);
    }
    SECTION("Retry delivers once back online") {
        pair.relay.SetOffline(false);
        REQUIRE(pair.alice.engine->RetryPendingSync().Unwrap() == 1);
        REQUIRE(pair.bob.Find(sent.Unwrap().id)->text == "queued");
        const auto synced = pair.alice.Find(sent.Unwrap().id);
        REQUIRE_FALSE(synced->sync_pending);
        REQUIRE(synced->status == MessageStatus::Delivered);
        REQUIRE(pair.alice.engine->RetryPendingSync().Unwrap() == 0);
    }
}
TEST_CASE("MessageLifecycle - Simulated delivery", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair(configuration::MessengerConfig::WithSimulatedDelivery(2s), false);
    const auto sent = pair.alice.engine->SendText("dev_bob", "anyone?").Unwrap();
    REQUIRE(sent.status == MessageStatus::Sent);
    pair.clock.Advance(1s);
    REQUIRE(pair.alice.engine->Sweep().IsOk());
    REQUIRE(pair.alice.Find(sent.id)->status == MessageStatus::Sent);
    pair.clock.Advance(1s);
    REQUIRE(pair.alice.engine->Sweep().IsOk());
    REQUIRE(pair.alice.Find(sent.id)->status == MessageStatus::Delivered);
}
TEST_CASE("MessageLifecycle - Deleting", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair;
    const auto sent = pair.alice.engine->SendText("dev_bob", "oops").Unwrap();
    SECTION("Delete for me is local and idempotent") {
        REQUIRE(pair.bob.engine->DeleteForMe(sent.id).IsOk());
        REQUIRE(pair.bob.engine->DeleteForMe(sent.id).IsOk());
        REQUIRE_FALSE(pair.bob.Find(sent.id).has_value());
        REQUIRE(pair.alice.Find(sent.id).has_value());
        REQUIRE(pair.bob.recorder->Deleted().size() == 1);
    }
    SECTION("Delete for everyone reaches the peer") {
        REQUIRE(pair.alice.engine->DeleteForEveryone(sent.id).IsOk());
        REQUIRE_FALSE(pair.alice.Find(sent.id).has_value());
        REQUIRE_FALSE(pair.bob.Find(sent.id).has_value());
        REQUIRE(pair.alice.engine->DeleteForEveryone(sent.id).IsOk());
    }
    SECTION("Only the sender may delete for everyone") {
        REQUIRE(pair.bob.engine->DeleteForEveryone(sent.id).UnwrapErr().Is(TetherFailureType::NotPermitted));
        REQUIRE(pair.bob.engine->OnRemoteDeletion({kConversation, sent.id, "dev_mallory"})
                    .UnwrapErr().Is(TetherFailureType::NotPermitted));
        REQUIRE(pair.bob.Find(sent.id).has_value());
    }
    SECTION("Local copy comes back when the relay refuses") {
        pair.relay.SetOffline(true);
        auto result = pair.alice.engine->DeleteForEveryone(sent.id);
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::Backend));
        REQUIRE(pair.alice.Find(sent.id).has_value());
        REQUIRE(pair.bob.Find(sent.id).has_value());
    }
}
TEST_CASE("MessageLifecycle - Incoming edge cases", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair(configuration::MessengerConfig::Default(), false);
    interfaces::WireMessage wire;
    wire.id = "msg_external";
    wire.conversation_id = kConversation;
    wire.sender_id = "dev_alice";
    wire.sent_at = pair.clock.Now();
    SECTION("Undecryptable envelope is kept with empty text") {
        const auto junk = crypto::SodiumInterop::GetRandomBytes(48);
        wire.payload = "ENC2_" + crypto::SodiumInterop::ToBase64(junk, crypto::Base64Variant::UrlSafeNoPadding);
        auto received = pair.bob.engine->OnIncoming(wire);
        REQUIRE(received.IsOk());
        REQUIRE(received.Unwrap().authenticity == models::MessageAuthenticity::Undecryptable);
        REQUIRE(received.Unwrap().text.empty());
        REQUIRE(pair.bob.Find("msg_external").has_value());
    }
    SECTION("Legacy envelope is marked unauthenticated") {
        const std::string legacy = "old style:junk";
        wire.payload = "ENC_" + crypto::SodiumInterop::ToBase64(
            std::vector<uint8_t>(legacy.begin(), legacy.end()), crypto::Base64Variant::Standard);
        auto received = pair.bob.engine->OnIncoming(wire).Unwrap();
        REQUIRE(received.text == "old style");
        REQUIRE(received.authenticity == models::MessageAuthenticity::LegacyUnauthenticated);
    }
    SECTION("Plaintext is marked as such") {
        wire.encrypted = false;
        wire.payload = "system notice";
        REQUIRE(pair.bob.engine->OnIncoming(wire).Unwrap().authenticity == models::MessageAuthenticity::Plaintext);
    }
    SECTION("Redelivery is stored once") {
        wire.encrypted = false;
        wire.payload = "twice";
        REQUIRE(pair.bob.engine->OnIncoming(wire).IsOk());
        REQUIRE(pair.bob.engine->OnIncoming(wire).IsOk());
        REQUIRE(pair.bob.ledger->MessagesFor(kConversation).size() == 1);
        REQUIRE(pair.bob.recorder->Received().size() == 1);
    }
    SECTION("Own echo and strangers are refused") {
        wire.sender_id = "dev_bob";
        REQUIRE(pair.bob.engine->OnIncoming(wire).UnwrapErr().Is(TetherFailureType::InvalidInput));
        wire.sender_id = "dev_alice";
        wire.conversation_id = "conv_unknown";
        REQUIRE(pair.bob.engine->OnIncoming(wire).UnwrapErr().Is(TetherFailureType::NotFound));
    }
}
TEST_CASE("MessageLifecycle - Attachments", "[lifecycle][attachment]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair;
    const auto blob = crypto::SodiumInterop::GetRandomBytes(2048);
    crypto::AttachmentDescriptor descriptor;
    descriptor.type = models::AttachmentType::Photo;
    descriptor.file_name = "ferry.png";
    descriptor.mime_type = "image/png";
    SECTION("Peer opens what was sent") {
        auto sent = pair.alice.engine->SendAttachment("dev_bob", blob, descriptor);
        REQUIRE(sent.IsOk());
        REQUIRE(sent.Unwrap().attachment->owner_id == "dev_alice");
        REQUIRE(pair.bob.engine->OpenAttachment(sent.Unwrap().id).Unwrap() == blob);
        REQUIRE(pair.alice.engine->OpenAttachment(sent.Unwrap().id).Unwrap() == blob);
    }
    SECTION("Incoming attachment is unverified until it opens") {
        const auto sent = pair.alice.engine->SendAttachment("dev_bob", blob, descriptor).Unwrap();
        REQUIRE(pair.bob.Find(sent.id)->authenticity == models::MessageAuthenticity::Unverified);
        REQUIRE(pair.alice.Find(sent.id)->authenticity == models::MessageAuthenticity::Authenticated);
        REQUIRE(pair.bob.engine->OpenAttachment(sent.id).IsOk());
        REQUIRE(pair.bob.Find(sent.id)->authenticity == models::MessageAuthenticity::Authenticated);
        REQUIRE(pair.bob.recorder->StateChanges().back().id == sent.id);
    }
    SECTION("Forged envelopes never touch another message's payload") {
        const auto sent = pair.alice.engine->SendAttachment("dev_bob", blob, descriptor).Unwrap();
        const auto original_ref = sent.attachment->payload_ref;
        const auto stored = pair.bob.ledger->LoadAttachmentPayload(original_ref).Unwrap();

        interfaces::WireMessage wire;
        wire.conversation_id = kConversation;
        wire.sender_id = "dev_alice";
        wire.sent_at = pair.clock.Now();

        crypto::EncryptedAttachment forged{*sent.attachment, std::vector<uint8_t>(stored.size(), 0x41)};
        forged.metadata.id = "att_forged";
        wire.id = "msg_foreign_ref";
        wire.payload = crypto::AttachmentCipher::PackForWire(forged).Unwrap();
        REQUIRE(pair.bob.engine->OnIncoming(wire).Unwrap().authenticity == models::MessageAuthenticity::Undecryptable);

        forged.metadata = *sent.attachment;
        wire.id = "msg_reused_id";
        wire.payload = crypto::AttachmentCipher::PackForWire(forged).Unwrap();
        const auto reused = pair.bob.engine->OnIncoming(wire).Unwrap();
        REQUIRE(reused.authenticity == models::MessageAuthenticity::Undecryptable);
        REQUIRE_FALSE(reused.attachment.has_value());

        REQUIRE(pair.bob.ledger->LoadAttachmentPayload(original_ref).Unwrap() == stored);
        REQUIRE(pair.bob.engine->OpenAttachment(sent.id).Unwrap() == blob);
        REQUIRE(pair.bob.engine->DeleteForMe("msg_reused_id").IsOk());
        REQUIRE(pair.bob.engine->OpenAttachment(sent.id).Unwrap() == blob);
    }
    SECTION("An attachment that fails to open is marked undecryptable") {
        const auto sent = pair.alice.engine->SendAttachment("dev_bob", blob, descriptor).Unwrap();
        const auto stored = pair.bob.ledger->LoadAttachmentPayload(sent.attachment->payload_ref).Unwrap();
        crypto::EncryptedAttachment renamed{*sent.attachment, stored};
        renamed.metadata.id = "att_renamed";
        renamed.metadata.payload_ref = std::string(LedgerConstants::ATTACHMENT_PAYLOAD_PREFIX) + "att_renamed";

        interfaces::WireMessage wire;
        wire.id = "msg_renamed";
        wire.conversation_id = kConversation;
        wire.sender_id = "dev_alice";
        wire.sent_at = pair.clock.Now();
        wire.payload = crypto::AttachmentCipher::PackForWire(renamed).Unwrap();
        REQUIRE(pair.bob.engine->OnIncoming(wire).Unwrap().authenticity == models::MessageAuthenticity::Unverified);
        REQUIRE(pair.bob.engine->OpenAttachment("msg_renamed").UnwrapErr().Is(TetherFailureType::DecryptionFailed));
        REQUIRE(pair.bob.Find("msg_renamed")->authenticity == models::MessageAuthenticity::Undecryptable);
    }
    SECTION("Deleting the message drops the payload") {
        auto sent = pair.alice.engine->SendAttachment("dev_bob", blob, descriptor).Unwrap();
        REQUIRE(pair.bob.engine->DeleteForMe(sent.id).IsOk());
        REQUIRE_FALSE(pair.bob.store.Contains(sent.attachment->payload_ref));
        REQUIRE(pair.bob.engine->OpenAttachment(sent.id).UnwrapErr().Is(TetherFailureType::NotFound));
    }
    SECTION("Privacy can refuse attachments") {
        models::PrivacySettings privacy;
        privacy.allow_attachments = false;
        REQUIRE(pair.alice.ledger->UpdateContactPrivacy("dev_bob", privacy).IsOk());
        REQUIRE(pair.alice.engine->SendAttachment("dev_bob", blob, descriptor).UnwrapErr().Is(TetherFailureType::NotPermitted));
    }
    SECTION("Text messages have nothing to open") {
        auto sent = pair.alice.engine->SendText("dev_bob", "no file").Unwrap();
        REQUIRE(pair.alice.engine->OpenAttachment(sent.id).UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
}
TEST_CASE("MessageLifecycle - Background sweeper", "[lifecycle]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Pair pair;
    REQUIRE_FALSE(pair.alice.engine->IsSweeperRunning());
    pair.alice.engine->StartSweeper();
    pair.alice.engine->StartSweeper();
    REQUIRE(pair.alice.engine->IsSweeperRunning());
    pair.alice.engine->StopSweeper();
    REQUIRE_FALSE(pair.alice.engine->IsSweeperRunning());
    pair.alice.engine->StopSweeper();
}
