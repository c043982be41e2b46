#include <catch2/catch_test_macros.hpp>
#include "tether/crypto/message_cipher.hpp"
#include "tether/crypto/shared_secret_deriver.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include <string>
using namespace tether;
using namespace tether::crypto;
namespace {
SecureMemoryHandle RandomKey() {
    return SecureMemoryHandle::FromBytes(SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE)).Unwrap();
}
std::string LegacyEnvelope(const std::string& joined) {
    const std::vector<uint8_t> bytes(joined.begin(), joined.end());
    return "ENC_" + SodiumInterop::ToBase64(bytes, Base64Variant::Standard);
}
}
TEST_CASE("MessageCipher - Current envelope", "[message_cipher]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    SECTION("Round-trip is authenticated") {
        auto envelope = MessageCipher::Encrypt("lunch at 12?", key);
        REQUIRE(envelope.IsOk());
        REQUIRE(envelope.Unwrap().starts_with("ENC2_"));
        auto opened = MessageCipher::Decrypt(envelope.Unwrap(), key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().text == "lunch at 12?");
        REQUIRE(opened.Unwrap().authenticated);
    }
    SECTION("Fresh nonce per encryption") {
        REQUIRE(MessageCipher::Encrypt("same", key).Unwrap() != MessageCipher::Encrypt("same", key).Unwrap());
    }
    SECTION("Empty and multi-byte text survive") {
        REQUIRE(MessageCipher::Decrypt(MessageCipher::Encrypt("", key).Unwrap(), key).Unwrap().text.empty());
        const std::string unicode = "\xd0\x9f\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82 \xf0\x9f\x91\x8b";
        REQUIRE(MessageCipher::Decrypt(MessageCipher::Encrypt(unicode, key).Unwrap(), key).Unwrap().text == unicode);
    }
    SECTION("Wrong key fails authentication") {
        const auto other = RandomKey();
        auto result = MessageCipher::Decrypt(MessageCipher::Encrypt("secret", key).Unwrap(), other);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::DecryptionFailed));
        REQUIRE(result.UnwrapErr().reason == DecryptionFailureReason::AuthenticationFailed);
    }
    SECTION("Both peers open each other's envelopes") {
        const std::string a(64, 'a');
        const std::string b(64, 'b');
        auto alice = SharedSecretDeriver::DeriveSharedKey("tpriv_" + a, "tpub_" + b).Unwrap();
        auto bob = SharedSecretDeriver::DeriveSharedKey("tpriv_" + b, "tpub_" + a).Unwrap();
        REQUIRE(MessageCipher::Decrypt(MessageCipher::Encrypt("hi bob", alice).Unwrap(), bob).Unwrap().text == "hi bob");
    }
}
TEST_CASE("MessageCipher - Malformed input", "[message_cipher]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    SECTION("Body that is not base64url") {
        auto result = MessageCipher::Decrypt("ENC2_!!!", key);
        REQUIRE(result.UnwrapErr().reason == DecryptionFailureReason::Malformed);
    }
    SECTION("Body shorter than nonce plus tag") {
        const std::vector<uint8_t> short_body(Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE - 1, 7);
        auto result = MessageCipher::Decrypt(
            "ENC2_" + SodiumInterop::ToBase64(short_body, Base64Variant::UrlSafeNoPadding), key);
        REQUIRE(result.UnwrapErr().reason == DecryptionFailureReason::Malformed);
    }
    SECTION("Unknown tag") {
        auto result = MessageCipher::Decrypt("ENC9_abcd", key);
        REQUIRE(result.UnwrapErr().reason == DecryptionFailureReason::UnsupportedFormat);
        REQUIRE(MessageCipher::Decrypt("plain text", key).UnwrapErr().reason == DecryptionFailureReason::UnsupportedFormat);
    }
}
TEST_CASE("MessageCipher - Legacy envelope", "[message_cipher]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    SECTION("Junk suffix after the last separator is dropped") {
        auto opened = MessageCipher::Decrypt(LegacyEnvelope("see you: at 5:x8Qz"), key);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().text == "see you: at 5");
        REQUIRE_FALSE(opened.Unwrap().authenticated);
    }
    SECTION("No separator keeps the whole body") {
        REQUIRE(MessageCipher::Decrypt(LegacyEnvelope("hello"), key).Unwrap().text == "hello");
    }
    SECTION("Invalid base64") {
        REQUIRE(MessageCipher::Decrypt("ENC_%%%", key).UnwrapErr().reason == DecryptionFailureReason::Malformed);
    }
}
TEST_CASE("MessageCipher - Envelope detection", "[message_cipher]") {
    REQUIRE(MessageCipher::IsEnvelope("ENC2_abc"));
    REQUIRE(MessageCipher::IsEnvelope("ENC_abc"));
    REQUIRE_FALSE(MessageCipher::IsEnvelope("ATT1_abc"));
    REQUIRE_FALSE(MessageCipher::IsEnvelope("hello"));
}
