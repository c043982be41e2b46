#include <catch2/catch_test_macros.hpp>
#include "tether/crypto/shared_secret_deriver.hpp"
#include "tether/crypto/pbkdf2.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include <string>
using namespace tether;
using namespace tether::crypto;
namespace {
const std::string kAliceHex = "1111111111111111111111111111111111111111111111111111111111111111";
const std::string kBobHex = "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
std::vector<uint8_t> KeyBytes(const SecureMemoryHandle& handle) {
    return handle.CopyOut().Unwrap();
}
}
TEST_CASE("SharedSecretDeriver - Key role stripping", "[kdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SharedSecretDeriver::StripKeyRole("tpub_" + kAliceHex).Unwrap() == kAliceHex);
    REQUIRE(SharedSecretDeriver::StripKeyRole("tpriv_" + kAliceHex).Unwrap() == kAliceHex);
    REQUIRE(SharedSecretDeriver::StripKeyRole(kAliceHex).Unwrap() == kAliceHex);
    SECTION("Wrong length") {
        auto result = SharedSecretDeriver::StripKeyRole("tpub_abcd");
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::InvalidKeyFormat));
    }
    SECTION("Non-hex body") {
        std::string bad = kAliceHex;
        bad[10] = 'g';
        REQUIRE(SharedSecretDeriver::StripKeyRole("tpub_" + bad).UnwrapErr().Is(TetherFailureType::InvalidKeyFormat));
    }
}
TEST_CASE("SharedSecretDeriver - Both sides derive the same key", "[kdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice_side = SharedSecretDeriver::DeriveSharedKey("tpriv_" + kAliceHex, "tpub_" + kBobHex);
    auto bob_side = SharedSecretDeriver::DeriveSharedKey("tpriv_" + kBobHex, "tpub_" + kAliceHex);
    REQUIRE(alice_side.IsOk());
    REQUIRE(bob_side.IsOk());
    REQUIRE(alice_side.Unwrap().Size() == Constants::AES_KEY_SIZE);
    REQUIRE(KeyBytes(alice_side.Unwrap()) == KeyBytes(bob_side.Unwrap()));
    SECTION("Matches PBKDF2 over the sorted joined keys") {
        const std::string joined = kAliceHex + "|" + kBobHex;
        const std::string salt(KeyDerivationConstants::CONVERSATION_SALT);
        auto expected = Pbkdf2::DeriveKeyBytes(
            std::span(reinterpret_cast<const uint8_t*>(joined.data()), joined.size()),
            std::span(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
            KeyDerivationConstants::PBKDF2_ITERATIONS,
            Constants::AES_KEY_SIZE);
        REQUIRE(KeyBytes(alice_side.Unwrap()) == expected.Unwrap());
    }
    SECTION("A different peer yields a different key") {
        const std::string carol(64, 'c');
        auto other = SharedSecretDeriver::DeriveSharedKey("tpriv_" + kAliceHex, "tpub_" + carol);
        REQUIRE(KeyBytes(other.Unwrap()) != KeyBytes(alice_side.Unwrap()));
    }
    SECTION("Malformed peer key is rejected") {
        auto result = SharedSecretDeriver::DeriveSharedKey("tpriv_" + kAliceHex, "tpub_short");
        REQUIRE(result.UnwrapErr().Is(TetherFailureType::InvalidKeyFormat));
    }
}
TEST_CASE("SharedSecretDeriver - Sorted pair derivation", "[kdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto ab = SharedSecretDeriver::DeriveFromSortedPair("dev_a", "dev_b", KeyDerivationConstants::ATTACHMENT_SALT);
    auto ba = SharedSecretDeriver::DeriveFromSortedPair("dev_b", "dev_a", KeyDerivationConstants::ATTACHMENT_SALT);
    auto other_salt = SharedSecretDeriver::DeriveFromSortedPair("dev_a", "dev_b", KeyDerivationConstants::CONVERSATION_SALT);
    REQUIRE(KeyBytes(ab.Unwrap()) == KeyBytes(ba.Unwrap()));
    REQUIRE(KeyBytes(ab.Unwrap()) != KeyBytes(other_salt.Unwrap()));
    REQUIRE(SharedSecretDeriver::DeriveFromSortedPair("", "dev_b", "salt").UnwrapErr().Is(TetherFailureType::InvalidInput));
}
