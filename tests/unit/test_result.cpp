#include <catch2/catch_test_macros.hpp>
#include "tether/core/result.hpp"
#include "tether/core/failures.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
using namespace tether;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, TetherFailure>::Ok(unit);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == unit);
    }
    SECTION("Move-only values") {
        auto result = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
        auto owned = std::move(result).Unwrap();
        REQUIRE(*owned == 7);
    }
}
TEST_CASE("Result<T, E> - Unwrapping the wrong side", "[result][core]") {
    SECTION("Unwrap on Err throws logic_error") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("UnwrapErr on Ok throws logic_error") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::logic_error);
    }
}
TEST_CASE("Result<T, E> - Copies and moves", "[result][core]") {
    SECTION("Copies are independent") {
        auto original = Result<std::string, std::string>::Ok("alpha");
        auto copy = original;
        copy.Unwrap() = "beta";
        REQUIRE(original.Unwrap() == "alpha");
        REQUIRE(copy.Unwrap() == "beta");
    }
    SECTION("Moving the error out") {
        auto result = Result<int, TetherFailure>::Err(TetherFailure::NotFound("no contact dev_x"));
        const TetherFailure failure = std::move(result).UnwrapErr();
        REQUIRE(failure.Is(TetherFailureType::NotFound));
        REQUIRE(failure.message == "no contact dev_x");
    }
}
TEST_CASE("TetherFailure - Converting sodium failures", "[result][core]") {
    const auto converted = TetherFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("no memory"));
    REQUIRE(converted.Is(TetherFailureType::Generic));
    REQUIRE(converted.message == "no memory");
}
TEST_CASE("TetherFailure - Rendering", "[result][core]") {
    SECTION("ToString names the failure type") {
        const auto failure = TetherFailure::GroupFull("Group grp_1 already has 3 members");
        REQUIRE(failure.ToString().find("GroupFull") != std::string::npos);
        REQUIRE(failure.ToString().find("grp_1") != std::string::npos);
    }
    SECTION("Decryption failures keep their reason") {
        const auto failure = TetherFailure::DecryptionFailed(DecryptionFailureReason::WrongKey, "wrong key");
        REQUIRE(failure.Is(TetherFailureType::DecryptionFailed));
        REQUIRE(failure.reason == DecryptionFailureReason::WrongKey);
    }
    SECTION("Every type has a name") {
        REQUIRE(FailureTypeName(TetherFailureType::SelfPairingRejected) == "SelfPairingRejected");
        REQUIRE(FailureTypeName(TetherFailureType::ContactWasDeleted) == "ContactWasDeleted");
    }
}
