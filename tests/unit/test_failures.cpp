#include <catch2/catch_test_macros.hpp>
#include "bbs/core/failures.hpp"
using namespace bbs::signatures;
TEST_CASE("BbsFailure - Codes", "[failures][core]") {
    SECTION("Local failures carry code 0") {
        REQUIRE(BbsFailure::InvalidInput("x").code == BbsFailure::LOCAL_FAILURE_CODE);
        REQUIRE(BbsFailure::InvalidState("x").code == 0);
        REQUIRE(BbsFailure::UnmappedStatus("x").code == 0);
        REQUIRE(BbsFailure::Allocation("x").code == 0);
        REQUIRE(BbsFailure::SecureMemory("x").code == 0);
        REQUIRE(BbsFailure::InvalidInput("x").IsLocal());
    }
    SECTION("Native failures keep code and message verbatim") {
        const auto failure = BbsFailure::NativeProtocol(7, "native said no");
        REQUIRE(failure.IsNative());
        REQUIRE(failure.type == BbsFailureType::NativeProtocol);
        REQUIRE(failure.code == 7);
        REQUIRE(failure.message == "native said no");
    }
}
TEST_CASE("BbsFailure - Sodium mapping", "[failures][core]") {
    SECTION("Allocation failures map to Allocation") {
        const auto failure = BbsFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom"));
        REQUIRE(failure.type == BbsFailureType::Allocation);
        REQUIRE(failure.message == "oom");
    }
    SECTION("Everything else maps to SecureMemory") {
        const auto failure = BbsFailure::FromSodiumFailure(SodiumFailure::InitializationFailed("init"));
        REQUIRE(failure.type == BbsFailureType::SecureMemory);
        REQUIRE(failure.code == 0);
    }
}
