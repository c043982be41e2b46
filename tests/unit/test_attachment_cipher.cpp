#include <catch2/catch_test_macros.hpp>
#include "tether/crypto/attachment_cipher.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include "helpers/manual_clock.hpp"
#include <string>
#include <vector>
using namespace tether;
using namespace tether::crypto;
namespace {
AttachmentDescriptor Photo(std::string owner = "dev_alice") {
    AttachmentDescriptor descriptor;
    descriptor.type = models::AttachmentType::Photo;
    descriptor.file_name = "harbour.jpg";
    descriptor.mime_type = "image/jpeg";
    descriptor.owner_id = std::move(owner);
    return descriptor;
}
}
TEST_CASE("AttachmentCipher - Encrypt and decrypt", "[attachment]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    test::ManualClock clock;
    auto key = AttachmentCipher::DeriveAttachmentKey("dev_alice", "dev_bob").Unwrap();
    const auto blob = SodiumInterop::GetRandomBytes(4096);
    auto encrypted = AttachmentCipher::Encrypt(blob, Photo(), key, clock.Now());
    REQUIRE(encrypted.IsOk());
    const auto& metadata = encrypted.Unwrap().metadata;
    SECTION("Metadata describes the blob") {
        REQUIRE(metadata.id.starts_with("att_"));
        REQUIRE(metadata.file_size == blob.size());
        REQUIRE(metadata.file_name == "harbour.jpg");
        REQUIRE(metadata.mime_type == "image/jpeg");
        REQUIRE(metadata.type == models::AttachmentType::Photo);
        REQUIRE(metadata.owner_id == "dev_alice");
        REQUIRE(metadata.iv.size() == Constants::AES_GCM_NONCE_SIZE);
        REQUIRE(metadata.key_check.size() == Constants::KEY_CHECK_SIZE);
        REQUIRE(metadata.payload_ref == "tether.attachment." + metadata.id);
        REQUIRE(metadata.uploaded_at == clock.Now());
        REQUIRE(encrypted.Unwrap().ciphertext.size() == blob.size() + Constants::AES_GCM_TAG_SIZE);
    }
    SECTION("Peer derives the same key and opens it") {
        auto peer_key = AttachmentCipher::DeriveAttachmentKey("dev_bob", "dev_alice").Unwrap();
        auto opened = AttachmentCipher::Decrypt(metadata, encrypted.Unwrap().ciphertext, peer_key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == blob);
    }
    SECTION("Third party key is detected before decryption") {
        auto stranger = AttachmentCipher::DeriveAttachmentKey("dev_alice", "dev_mallory").Unwrap();
        auto opened = AttachmentCipher::Decrypt(metadata, encrypted.Unwrap().ciphertext, stranger);
        REQUIRE(opened.UnwrapErr().reason == DecryptionFailureReason::WrongKey);
    }
    SECTION("Ciphertext corruption is reported as such") {
        auto corrupted = encrypted.Unwrap().ciphertext;
        corrupted[corrupted.size() / 2] ^= 0x10;
        auto opened = AttachmentCipher::Decrypt(metadata, corrupted, key);
        REQUIRE(opened.UnwrapErr().reason == DecryptionFailureReason::CorruptCiphertext);
    }
    SECTION("Metadata is bound to the ciphertext through its id") {
        auto relabelled = metadata;
        relabelled.id = "att_000000000000000000000000";
        auto opened = AttachmentCipher::Decrypt(relabelled, encrypted.Unwrap().ciphertext, key);
        REQUIRE(opened.UnwrapErr().reason == DecryptionFailureReason::CorruptCiphertext);
    }
}
TEST_CASE("AttachmentCipher - Input validation", "[attachment]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    test::ManualClock clock;
    auto key = AttachmentCipher::DeriveAttachmentKey("dev_alice", "dev_bob").Unwrap();
    SECTION("Owner is required") {
        const std::vector<uint8_t> blob{1, 2, 3};
        auto result = AttachmentCipher::Encrypt(blob, Photo(""), key, clock.Now());
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Oversized blob is rejected") {
        const std::vector<uint8_t> blob(Constants::MAX_ATTACHMENT_SIZE + 1, 0);
        auto result = AttachmentCipher::Encrypt(blob, Photo(), key, clock.Now());
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Empty blob is allowed") {
        auto result = AttachmentCipher::Encrypt({}, Photo(), key, clock.Now());
        REQUIRE(result.IsOk());
        REQUIRE(AttachmentCipher::Decrypt(result.Unwrap().metadata, result.Unwrap().ciphertext, key).Unwrap().empty());
    }
}
TEST_CASE("AttachmentCipher - Wire packing", "[attachment]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    test::ManualClock clock;
    auto key = AttachmentCipher::DeriveAttachmentKey("dev_alice", "dev_bob").Unwrap();
    const std::vector<uint8_t> blob{'v', 'o', 'i', 'c', 'e'};
    auto descriptor = Photo();
    descriptor.type = models::AttachmentType::Voice;
    auto encrypted = AttachmentCipher::Encrypt(blob, descriptor, key, clock.Now()).Unwrap();
    auto wire = AttachmentCipher::PackForWire(encrypted);
    REQUIRE(wire.IsOk());
    REQUIRE(AttachmentCipher::IsWireAttachment(wire.Unwrap()));
    auto unpacked = AttachmentCipher::UnpackFromWire(wire.Unwrap());
    REQUIRE(unpacked.IsOk());
    REQUIRE(unpacked.Unwrap().metadata.id == encrypted.metadata.id);
    REQUIRE(unpacked.Unwrap().metadata.type == models::AttachmentType::Voice);
    REQUIRE(AttachmentCipher::Decrypt(unpacked.Unwrap().metadata, unpacked.Unwrap().ciphertext, key).Unwrap() == blob);
    SECTION("Foreign prefix") {
        REQUIRE(AttachmentCipher::UnpackFromWire("ENC2_abc").UnwrapErr().reason == DecryptionFailureReason::UnsupportedFormat);
    }
    SECTION("Broken body") {
        REQUIRE(AttachmentCipher::UnpackFromWire("ATT1_***").UnwrapErr().reason == DecryptionFailureReason::Malformed);
    }
    SECTION("Payload reference must follow the id") {
        auto redirected = encrypted;
        redirected.metadata.payload_ref = "tether.attachment.att_someone_else";
        const auto packed = AttachmentCipher::PackForWire(redirected).Unwrap();
        REQUIRE(AttachmentCipher::UnpackFromWire(packed).UnwrapErr().reason == DecryptionFailureReason::Malformed);
    }
}
