#include <catch2/catch_test_macros.hpp>
#include "tether/crypto/attachment_cipher.hpp"
#include "tether/crypto/message_cipher.hpp"
#include "tether/crypto/shared_secret_deriver.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include "helpers/manual_clock.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace tether;
using namespace tether::crypto;

namespace {
    const std::string kAliceHex(64, '3');
    const std::string kBobHex(64, '4');
    const std::string kCarolHex(64, '5');

    SecureMemoryHandle PairKey(const std::string& own_hex, const std::string& peer_hex) {
        return SharedSecretDeriver::DeriveSharedKey("tpriv_" + own_hex, "tpub_" + peer_hex).Unwrap();
    }

    std::vector<uint8_t> EnvelopeBytes(const std::string& envelope) {
        return SodiumInterop::FromBase64(envelope.substr(5), Base64Variant::UrlSafeNoPadding).Unwrap();
    }

    std::string ToEnvelope(const std::vector<uint8_t>& bytes) {
        return "ENC2_" + SodiumInterop::ToBase64(bytes, Base64Variant::UrlSafeNoPadding);
    }
}

TEST_CASE("Envelope Tampering - Every flipped bit is rejected", "[security][envelope][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = PairKey(kAliceHex, kBobHex);
    const auto envelope = MessageCipher::Encrypt("meet at the north gate", key).Unwrap();
    const auto bytes = EnvelopeBytes(envelope);
    REQUIRE(bytes.size() == Constants::AES_GCM_NONCE_SIZE + 22 + Constants::AES_GCM_TAG_SIZE);

    SECTION("Nonce, ciphertext and tag are all covered") {
        for (size_t position = 0; position < bytes.size(); ++position) {
            for (int bit = 0; bit < 8; bit += 3) {
                auto tampered = bytes;
                tampered[position] ^= static_cast<uint8_t>(1U << bit);
                auto opened = MessageCipher::Decrypt(ToEnvelope(tampered), key);
                REQUIRE(opened.IsErr());
                REQUIRE(opened.UnwrapErr().reason == DecryptionFailureReason::AuthenticationFailed);
            }
        }
    }

    SECTION("Truncation at any length is rejected") {
        for (size_t length = 0; length < bytes.size(); ++length) {
            std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length));
            auto opened = MessageCipher::Decrypt(ToEnvelope(truncated), key);
            REQUIRE(opened.IsErr());
            REQUIRE(opened.UnwrapErr().Is(TetherFailureType::DecryptionFailed));
        }
    }

    SECTION("Appended bytes are rejected") {
        auto extended = bytes;
        extended.push_back(0x00);
        REQUIRE(MessageCipher::Decrypt(ToEnvelope(extended), key).IsErr());
    }

    SECTION("The untouched envelope still opens") {
        REQUIRE(MessageCipher::Decrypt(ToEnvelope(bytes), key).Unwrap().text == "meet at the north gate");
    }
}

TEST_CASE("Envelope Tampering - Conversation isolation", "[security][envelope]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("A third party's key cannot open a pair's envelope") {
        const auto alice_bob = PairKey(kAliceHex, kBobHex);
        const auto alice_carol = PairKey(kAliceHex, kCarolHex);
        const auto envelope = MessageCipher::Encrypt("for bob only", alice_bob).Unwrap();
        auto opened = MessageCipher::Decrypt(envelope, alice_carol);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().reason == DecryptionFailureReason::AuthenticationFailed);
    }

    SECTION("Both ends of a pair derive the same key") {
        const auto from_alice = PairKey(kAliceHex, kBobHex);
        const auto from_bob = PairKey(kBobHex, kAliceHex);
        const auto envelope = MessageCipher::Encrypt("symmetric", from_alice).Unwrap();
        REQUIRE(MessageCipher::Decrypt(envelope, from_bob).Unwrap().text == "symmetric");
    }

    SECTION("Spliced envelopes fail") {
        const auto key = PairKey(kAliceHex, kBobHex);
        const auto first = EnvelopeBytes(MessageCipher::Encrypt("first message body", key).Unwrap());
        const auto second = EnvelopeBytes(MessageCipher::Encrypt("other message body", key).Unwrap());
        auto spliced = first;
        std::copy(second.begin(), second.begin() + Constants::AES_GCM_NONCE_SIZE, spliced.begin());
        REQUIRE(MessageCipher::Decrypt(ToEnvelope(spliced), key).IsErr());
    }
}

TEST_CASE("Envelope Tampering - Attachments", "[security][attachment][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    test::ManualClock clock;
    const auto key = AttachmentCipher::DeriveAttachmentKey("dev_alice", "dev_bob").Unwrap();
    AttachmentDescriptor descriptor;
    descriptor.type = models::AttachmentType::Voice;
    descriptor.file_name = "note.ogg";
    descriptor.mime_type = "audio/ogg";
    descriptor.owner_id = "dev_alice";
    const auto blob = SodiumInterop::GetRandomBytes(512);
    const auto sealed = AttachmentCipher::Encrypt(blob, descriptor, key, clock.Now()).Unwrap();

    SECTION("Flipped ciphertext bytes") {
        for (size_t position = 0; position < sealed.ciphertext.size(); position += 37) {
            auto tampered = sealed.ciphertext;
            tampered[position] ^= 0x01;
            auto opened = AttachmentCipher::Decrypt(sealed.metadata, tampered, key);
            REQUIRE(opened.IsErr());
            REQUIRE(opened.UnwrapErr().reason == DecryptionFailureReason::CorruptCiphertext);
        }
    }

    SECTION("Altered IV") {
        auto metadata = sealed.metadata;
        metadata.iv[0] ^= 0x80;
        REQUIRE(AttachmentCipher::Decrypt(metadata, sealed.ciphertext, key).UnwrapErr().reason
                == DecryptionFailureReason::CorruptCiphertext);
    }

    SECTION("Payload moved under another attachment id") {
        const auto other = AttachmentCipher::Encrypt(blob, descriptor, key, clock.Now()).Unwrap();
        REQUIRE(AttachmentCipher::Decrypt(other.metadata, sealed.ciphertext, key).UnwrapErr().reason
                == DecryptionFailureReason::CorruptCiphertext);
    }

    SECTION("Key check rejects a foreign key before decryption") {
        const auto foreign = AttachmentCipher::DeriveAttachmentKey("dev_alice", "dev_carol").Unwrap();
        REQUIRE(AttachmentCipher::Decrypt(sealed.metadata, sealed.ciphertext, foreign).UnwrapErr().reason
                == DecryptionFailureReason::WrongKey);
    }

    SECTION("Forged key check still fails authentication") {
        const auto foreign = AttachmentCipher::DeriveAttachmentKey("dev_alice", "dev_carol").Unwrap();
        const auto forged = AttachmentCipher::Encrypt(blob, descriptor, foreign, clock.Now()).Unwrap();
        auto metadata = sealed.metadata;
        metadata.key_check = forged.metadata.key_check;
        REQUIRE(AttachmentCipher::Decrypt(metadata, sealed.ciphertext, foreign).UnwrapErr().reason
                == DecryptionFailureReason::CorruptCiphertext);
    }

    SECTION("Mangled wire envelope") {
        auto wire = AttachmentCipher::PackForWire(sealed).Unwrap();
        REQUIRE(AttachmentCipher::UnpackFromWire(wire.substr(0, 12)).IsErr());
        REQUIRE(AttachmentCipher::UnpackFromWire("ATT1_%%%%").UnwrapErr().reason == DecryptionFailureReason::Malformed);
    }
}
