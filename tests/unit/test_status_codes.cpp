#include <catch2/catch_test_macros.hpp>
#include "secnego/enums/sec_status_code.hpp"
#include "secnego/enums/context_flags.hpp"
#include "secnego/enums/data_representation.hpp"
#include <string_view>
using namespace secnego::auth::enums;

TEST_CASE("SecStatusCode - Native values", "[enums][status]") {
    REQUIRE(ToNative(SecStatusCode::Ok) == 0x00000000);
    REQUIRE(ToNative(SecStatusCode::ContinueNeeded) == 0x00090312);
    REQUIRE(ToNative(SecStatusCode::CompleteNeeded) == 0x00090313);
    REQUIRE(ToNative(SecStatusCode::CompleteAndContinue) == 0x00090314);
    REQUIRE(static_cast<uint32_t>(ToNative(SecStatusCode::BufferTooSmall)) == 0x80090321u);
}

TEST_CASE("SecStatusCode - Classification", "[enums][status]") {
    SECTION("Success set") {
        REQUIRE(Classify(SecStatusCode::Ok) == StatusDisposition::Ok);
        REQUIRE(Classify(SecStatusCode::ContinueNeeded) == StatusDisposition::Continue);
        REQUIRE(Classify(SecStatusCode::CompleteNeeded) == StatusDisposition::CompleteNeeded);
        REQUIRE(Classify(SecStatusCode::CompleteAndContinue) == StatusDisposition::CompleteAndContinue);
    }
    SECTION("Everything else is an error") {
        REQUIRE(Classify(SecStatusCode::LogonDenied) == StatusDisposition::Error);
        REQUIRE(Classify(SecStatusCode::InvalidToken) == StatusDisposition::Error);
        REQUIRE(Classify(static_cast<SecStatusCode>(0x12345)) == StatusDisposition::Error);
        REQUIRE_FALSE(IsSuccess(SecStatusCode::InternalError));
    }
    SECTION("Completion and done signals") {
        REQUIRE(RequiresCompletion(SecStatusCode::CompleteNeeded));
        REQUIRE(RequiresCompletion(SecStatusCode::CompleteAndContinue));
        REQUIRE_FALSE(RequiresCompletion(SecStatusCode::Ok));
        REQUIRE_FALSE(RequiresCompletion(SecStatusCode::ContinueNeeded));
        REQUIRE(SignalsDone(SecStatusCode::Ok));
        REQUIRE(SignalsDone(SecStatusCode::CompleteNeeded));
        REQUIRE_FALSE(SignalsDone(SecStatusCode::ContinueNeeded));
        REQUIRE_FALSE(SignalsDone(SecStatusCode::CompleteAndContinue));
    }
    SECTION("Names") {
        REQUIRE(std::string_view(ToString(SecStatusCode::ContinueNeeded)) == "SEC_I_CONTINUE_NEEDED");
        REQUIRE(std::string_view(ToString(static_cast<SecStatusCode>(0x12345))) == "UNKNOWN");
    }
}

TEST_CASE("Context flags - Bitwise operators", "[enums][flags]") {
    SECTION("Request bits use the ASC_REQ layout") {
        REQUIRE(ToNative(AcceptContextReqFlags::Delegate) == 0x1u);
        REQUIRE(ToNative(AcceptContextReqFlags::AllocateMemory) == 0x100u);
        REQUIRE(ToNative(AcceptContextReqFlags::Connection) == 0x800u);
    }
    SECTION("Combine, test and clear") {
        auto flags = AcceptContextReqFlags::Connection | AcceptContextReqFlags::AllocateMemory;
        REQUIRE(HasFlag(flags, AcceptContextReqFlags::AllocateMemory));
        flags &= ~AcceptContextReqFlags::AllocateMemory;
        REQUIRE_FALSE(HasFlag(flags, AcceptContextReqFlags::AllocateMemory));
        REQUIRE(HasFlag(flags, AcceptContextReqFlags::Connection));
        flags |= AcceptContextReqFlags::Integrity;
        REQUIRE(ToNative(flags) == (0x800u | 0x20000u));
    }
    SECTION("Return flags combine independently") {
        auto ret = AcceptContextRetFlags::Connection | AcceptContextRetFlags::Integrity;
        REQUIRE(HasFlag(ret, AcceptContextRetFlags::Integrity));
        REQUIRE((ret & AcceptContextRetFlags::Delegate) == AcceptContextRetFlags::None);
    }
}

TEST_CASE("DataRepresentation - Values", "[enums]") {
    REQUIRE(static_cast<uint32_t>(DataRepresentation::Network) == 0x00u);
    REQUIRE(static_cast<uint32_t>(DataRepresentation::Native) == 0x10u);
}
