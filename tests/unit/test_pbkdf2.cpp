#include <catch2/catch_test_macros.hpp>
#include "tether/crypto/pbkdf2.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include <string>
#include <vector>
using namespace tether;
using namespace tether::crypto;
namespace {
std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}
}
TEST_CASE("PBKDF2 - Known answer", "[pbkdf2]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    // RFC 7914 section 11, PBKDF2-HMAC-SHA256 with c = 1.
    auto derived = Pbkdf2::DeriveKeyBytes(Bytes("passwd"), Bytes("salt"), 1, 32);
    REQUIRE(derived.IsOk());
    REQUIRE(SodiumInterop::ToHex(derived.Unwrap()) ==
            "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc");
}
TEST_CASE("PBKDF2 - Determinism and separation", "[pbkdf2]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto a = Pbkdf2::DeriveKeyBytes(Bytes("a|b"), Bytes("tether-conversation-key-v1"), 1000, 32).Unwrap();
    const auto b = Pbkdf2::DeriveKeyBytes(Bytes("a|b"), Bytes("tether-conversation-key-v1"), 1000, 32).Unwrap();
    const auto other_salt = Pbkdf2::DeriveKeyBytes(Bytes("a|b"), Bytes("tether-attachment-key-v1"), 1000, 32).Unwrap();
    const auto other_rounds = Pbkdf2::DeriveKeyBytes(Bytes("a|b"), Bytes("tether-conversation-key-v1"), 1001, 32).Unwrap();
    REQUIRE(a == b);
    REQUIRE(a != other_salt);
    REQUIRE(a != other_rounds);
    SECTION("DeriveKey fills a caller buffer") {
        std::vector<uint8_t> out(32);
        REQUIRE(Pbkdf2::DeriveKey(Bytes("a|b"), Bytes("tether-conversation-key-v1"), 1000, out).IsOk());
        REQUIRE(out == a);
    }
}
TEST_CASE("PBKDF2 - Parameter validation", "[pbkdf2]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Empty output") {
        std::vector<uint8_t> out;
        REQUIRE(Pbkdf2::DeriveKey(Bytes("pw"), Bytes("salt"), 1, out).UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Output above the cap") {
        REQUIRE(Pbkdf2::DeriveKeyBytes(Bytes("pw"), Bytes("salt"), 1, Pbkdf2::MAX_OUTPUT_LEN + 1).IsErr());
    }
    SECTION("Empty password") {
        REQUIRE(Pbkdf2::DeriveKeyBytes({}, Bytes("salt"), 1, 32).UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("Zero iterations") {
        REQUIRE(Pbkdf2::DeriveKeyBytes(Bytes("pw"), Bytes("salt"), 0, 32).UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
}
