/**
 * @file pairing_example.cpp
 * @brief Two devices pair through a QR invite and exchange a timed message
 */

#include "tether/backend/loopback_backend.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/interfaces/i_clock.hpp"
#include "tether/storage/in_memory_key_value_store.hpp"
#include "tether/system/messenger_system.hpp"

#include <fmt/core.h>
#include <iostream>

using namespace tether;
using namespace tether::crypto;

namespace {

class PrintingHandler final : public interfaces::IMessengerEventHandler {
public:
    explicit PrintingHandler(std::string owner) : owner_(std::move(owner)) {}

    void OnMessageReceived(const models::Message& message) override {
        std::cout << fmt::format("   [{}] received \"{}\"", owner_, message.text) << std::endl;
    }
    void OnMessageStateChanged(const models::Message& message) override {
        std::cout << fmt::format("   [{}] {} -> {}", owner_, message.id, models::MessageStatusName(message.status))
                  << std::endl;
    }
    void OnMessageDeleted(const std::string&, const std::string& message_id) override {
        std::cout << fmt::format("   [{}] deleted {}", owner_, message_id) << std::endl;
    }
    void OnContactUpdated(const models::Contact& contact) override {
        std::cout << fmt::format("   [{}] contact {} ({})", owner_, contact.name, contact.conversation_id) << std::endl;
    }
    void OnInviteRotated(const models::Invite& invite) override {
        std::cout << fmt::format("   [{}] new invite {}", owner_, invite.GetCode()) << std::endl;
    }

private:
    std::string owner_;
};

template<typename T>
bool Report(const Result<T, TetherFailure>& result, std::string_view step) {
    if (result.IsErr()) {
        std::cerr << fmt::format("{} failed: {}", step, result.UnwrapErr().ToString()) << std::endl;
        return false;
    }
    return true;
}

}

int main() {
    std::cout << "=== Tether - Pairing Example ===" << std::endl << std::endl;

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize: " << init.UnwrapErr().message << std::endl;
        return 1;
    }

    interfaces::SystemClock clock;
    backend::LoopbackBackend relay(clock);
    storage::InMemoryKeyValueStore alice_store;
    storage::InMemoryKeyValueStore bob_store;

    std::cout << "1. Creating devices..." << std::endl;
    auto alice_result = system::MessengerSystem::Create(alice_store, relay, clock, "Alice");
    auto bob_result = system::MessengerSystem::Create(bob_store, relay, clock, "Bob");
    if (!Report(alice_result, "Alice") || !Report(bob_result, "Bob")) {
        return 1;
    }
    auto alice = std::move(alice_result).Unwrap();
    auto bob = std::move(bob_result).Unwrap();
    alice->AddEventHandler(std::make_shared<PrintingHandler>("alice"));
    bob->AddEventHandler(std::make_shared<PrintingHandler>("bob"));
    std::cout << "   Alice is " << alice->GetDeviceId() << std::endl;
    std::cout << "   Bob is   " << bob->GetDeviceId() << std::endl << std::endl;

    std::cout << "2. Alice shows an invite QR..." << std::endl;
    auto invite = alice->IssuePersonalInvite();
    if (!Report(invite, "IssuePersonalInvite")) {
        return 1;
    }
    auto qr = alice->EncodeInvite(invite.Unwrap());
    if (!Report(qr, "EncodeInvite")) {
        return 1;
    }
    std::cout << "   " << qr.Unwrap() << std::endl << std::endl;

    std::cout << "3. Bob scans it..." << std::endl;
    auto alice_contact = bob->RedeemInvite(qr.Unwrap());
    if (!Report(alice_contact, "RedeemInvite")) {
        return 1;
    }
    std::cout << std::endl;

    std::cout << "4. Scanning the same code again..." << std::endl;
    if (auto again = bob->RedeemInvite(qr.Unwrap()); again.IsErr()) {
        std::cout << "   rejected: " << again.UnwrapErr().ToString() << std::endl << std::endl;
    }

    std::cout << "5. Bob sends a message that disappears a minute after it is seen..." << std::endl;
    auto sent = bob->SendText(alice_contact.Unwrap().id, "see you at noon", 1);
    if (!Report(sent, "SendText")) {
        return 1;
    }
    const auto& conversation_id = alice_contact.Unwrap().conversation_id;
    auto viewed = alice->MarkConversationViewed(conversation_id);
    if (!Report(viewed, "MarkConversationViewed")) {
        return 1;
    }
    for (const auto& message : bob->Conversation(conversation_id)) {
        std::cout << fmt::format("   bob's copy of {} is {}{}", message.id, models::MessageStatusName(message.status),
                                 message.delete_at.has_value() ? ", deletion scheduled" : "")
                  << std::endl;
    }
    std::cout << std::endl;

    std::cout << "=== Done ===" << std::endl;
    return 0;
}
