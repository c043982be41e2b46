#include <catch2/catch_test_macros.hpp>
#include "tether/crypto/aes_gcm.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include <string>
#include <vector>
using namespace tether;
using namespace tether::crypto;
namespace {
std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}
}
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    const auto plaintext = Bytes("meet me by the north gate");
    SECTION("Encrypt and decrypt round-trip") {
        auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(ciphertext.Unwrap().size() == plaintext.size() + Constants::AES_GCM_TAG_SIZE);
        auto decrypted = AesGcm::Decrypt(key, nonce, ciphertext.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields a bare tag") {
        auto ciphertext = AesGcm::Encrypt(key, nonce, {});
        REQUIRE(ciphertext.Unwrap().size() == Constants::AES_GCM_TAG_SIZE);
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext.Unwrap()).Unwrap().empty());
    }
    SECTION("Associated data must match") {
        const auto ad = Bytes("att_0001");
        auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext, ad).Unwrap();
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext, ad).IsOk());
        auto wrong_ad = AesGcm::Decrypt(key, nonce, ciphertext, Bytes("att_0002"));
        REQUIRE(wrong_ad.IsErr());
        REQUIRE(wrong_ad.UnwrapErr().reason == DecryptionFailureReason::AuthenticationFailed);
    }
}
TEST_CASE("AES-GCM - Parameter validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    const auto plaintext = Bytes("payload");
    SECTION("Short key is rejected") {
        const auto short_key = SodiumInterop::GetRandomBytes(16);
        auto result = AesGcm::Encrypt(short_key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Wrong nonce size is rejected") {
        const auto long_nonce = SodiumInterop::GetRandomBytes(24);
        REQUIRE(AesGcm::Encrypt(key, long_nonce, plaintext).UnwrapErr().Is(TetherFailureType::InvalidInput));
        REQUIRE(AesGcm::Decrypt(key, long_nonce, plaintext).UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Ciphertext shorter than a tag is malformed") {
        const std::vector<uint8_t> truncated(Constants::AES_GCM_TAG_SIZE - 1, 0);
        auto result = AesGcm::Decrypt(key, nonce, truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::DecryptionFailed));
        REQUIRE(result.UnwrapErr().reason == DecryptionFailureReason::Malformed);
    }
}
TEST_CASE("AES-GCM - Authentication", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto ciphertext = AesGcm::Encrypt(key, nonce, Bytes("authenticated")).Unwrap();
    SECTION("Flipped ciphertext bit fails") {
        ciphertext[0] ^= 0x01;
        auto result = AesGcm::Decrypt(key, nonce, ciphertext);
        REQUIRE(result.UnwrapErr().reason == DecryptionFailureReason::AuthenticationFailed);
    }
    SECTION("Flipped tag bit fails") {
        ciphertext.back() ^= 0x80;
        REQUIRE(AesGcm::Decrypt(key, nonce, ciphertext).IsErr());
    }
    SECTION("Different key fails") {
        const auto other = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
        REQUIRE(AesGcm::Decrypt(other, nonce, ciphertext).IsErr());
    }
    SECTION("Different nonce fails") {
        const auto other = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
        REQUIRE(AesGcm::Decrypt(key, other, ciphertext).IsErr());
    }
}
