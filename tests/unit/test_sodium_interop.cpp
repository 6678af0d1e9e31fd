#include <catch2/catch_test_macros.hpp>
#include "secnego/crypto/sodium_interop.hpp"
#include "secnego/core/constants.hpp"
#include <algorithm>
#include <vector>
using namespace secnego::auth;
using namespace secnego::auth::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Wipe small buffer") {
        std::vector<uint8_t> buffer(Constants::SMALL_BUFFER_THRESHOLD, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe large buffer") {
        std::vector<uint8_t> buffer(Constants::DEFAULT_OUTPUT_TOKEN_BUFFER_SIZE, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("SodiumInterop - Secure Fill", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Fill sets every byte") {
        std::vector<uint8_t> buffer(64, 0x00);
        REQUIRE(SodiumInterop::SecureFill(std::span<uint8_t>(buffer), 0x5A).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0x5A; }));
    }
    SECTION("Fill with zero wipes") {
        std::vector<uint8_t> buffer(64, 0x77);
        REQUIRE(SodiumInterop::SecureFill(std::span<uint8_t>(buffer), 0).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == true);
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap() == false);
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap() == false);
    }
    SECTION("Two empty buffers are equal") {
        std::vector<uint8_t> a;
        std::vector<uint8_t> b;
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap() == true);
    }
}
