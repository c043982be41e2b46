#include <catch2/catch_test_macros.hpp>
#include "tether/identity/identity_store.hpp"
#include "tether/crypto/sodium_interop.hpp"
#include "tether/core/constants.hpp"
#include "tether/storage/in_memory_key_value_store.hpp"
#include <algorithm>
#include <set>
using namespace tether;
using namespace tether::identity;
using namespace tether::crypto;
TEST_CASE("IdentityStore - Identifier formats", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Device id is dev_ plus 32 hex characters") {
        const auto id = IdentityStore::GenerateDeviceId();
        REQUIRE(id.starts_with("dev_"));
        REQUIRE(id.size() == 4 + 32);
        REQUIRE(SodiumInterop::FromHex(id.substr(4)).IsOk());
    }
    SECTION("User id is TU- plus 8 unambiguous symbols") {
        for (int i = 0; i < 50; ++i) {
            const auto id = IdentityStore::GenerateUserId();
            REQUIRE(id.starts_with("TU-"));
            REQUIRE(id.size() == 3 + 8);
            for (const char c : id.substr(3)) {
                REQUIRE(IdentityConstants::USER_ID_ALPHABET.find(c) != std::string_view::npos);
            }
        }
    }
    SECTION("Fresh ids do not collide") {
        std::set<std::string> ids;
        for (int i = 0; i < 100; ++i) {
            ids.insert(IdentityStore::GenerateDeviceId());
        }
        REQUIRE(ids.size() == 100);
    }
}
TEST_CASE("IdentityStore - Persistence", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    storage::InMemoryKeyValueStore kv;
    IdentityStore store(kv);
    SECTION("GetOrCreate is idempotent") {
        const auto first = store.GetOrCreateIdentity().Unwrap();
        const auto second = store.GetOrCreateIdentity().Unwrap();
        REQUIRE(first.device_id == second.device_id);
        REQUIRE(first.user_id == second.user_id);
        REQUIRE(first.key_pair.public_key == second.key_pair.public_key);
    }
    SECTION("A second store over the same records sees the same identity") {
        const auto first = store.GetOrCreateIdentity().Unwrap();
        IdentityStore reopened(kv);
        REQUIRE(reopened.GetOrCreateDeviceId().Unwrap() == first.device_id);
        REQUIRE(reopened.GetOrCreateKeyPair().Unwrap().private_key == first.key_pair.private_key);
    }
    SECTION("Key pair halves carry the same secret under different tags") {
        const auto pair = store.GetOrCreateKeyPair().Unwrap();
        REQUIRE(pair.public_key.starts_with("tpub_"));
        REQUIRE(pair.private_key.starts_with("tpriv_"));
        REQUIRE(pair.public_key.substr(5) == pair.private_key.substr(6));
        REQUIRE(pair.public_key.size() == 5 + 64);
    }
    SECTION("Stored values are returned as is") {
        REQUIRE(kv.Set(IdentityConstants::KEY_DEVICE_ID, "dev_fixed").IsOk());
        REQUIRE(store.GetOrCreateDeviceId().Unwrap() == "dev_fixed");
    }
}
TEST_CASE("IdentityStore - Login binding", "[identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    storage::InMemoryKeyValueStore kv;
    IdentityStore store(kv);
    const auto original = store.GetOrCreateDeviceId().Unwrap();
    SECTION("Empty email is rejected") {
        REQUIRE(store.BindLoginEmail("").UnwrapErr().Is(TetherFailureType::InvalidInput));
    }
    SECTION("First binding keeps the device id") {
        REQUIRE(store.BindLoginEmail("ana@example.org").Unwrap() == original);
        REQUIRE(store.BindLoginEmail("ana@example.org").Unwrap() == original);
    }
    SECTION("Switching accounts rotates the device id") {
        REQUIRE(store.BindLoginEmail("ana@example.org").Unwrap() == original);
        const auto rotated = store.BindLoginEmail("ben@example.org").Unwrap();
        REQUIRE(rotated != original);
        REQUIRE(store.GetOrCreateDeviceId().Unwrap() == rotated);
    }
}
