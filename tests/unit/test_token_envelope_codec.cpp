#include <catch2/catch_test_macros.hpp>
#include "secnego/utilities/token_envelope_codec.hpp"
#include "secnego/core/constants.hpp"
#include "negotiation/token_envelope.pb.h"
#include <string>
#include <vector>
using namespace secnego::auth;
using namespace secnego::auth::utilities;

namespace {

std::vector<uint8_t> Serialize(const secnego::proto::negotiation::TokenEnvelope& envelope) {
    const std::string bytes = envelope.SerializeAsString();
    return {bytes.begin(), bytes.end()};
}

}

TEST_CASE("TokenEnvelopeCodec - Encode and Decode", "[envelope][codec]") {
    SECTION("Intermediate reply keeps round and token") {
        TokenEnvelopeFrame frame;
        frame.round = 1;
        frame.token = AuthenticationToken(std::vector<uint8_t>{0x60, 0x82, 0x01, 0x0A});
        auto encoded = TokenEnvelopeCodec::Encode(frame);
        REQUIRE(encoded.IsOk());

        auto decoded = TokenEnvelopeCodec::Decode(encoded.Unwrap());
        REQUIRE(decoded.IsOk());
        const auto& out = decoded.Unwrap();
        REQUIRE(out.round == 1);
        REQUIRE(out.token == frame.token);
        REQUIRE_FALSE(out.is_final);
        REQUIRE_FALSE(out.status_code.has_value());
    }
    SECTION("Failure frame carries the native status") {
        auto failure = AuthenticationFailure::Provider("denied", static_cast<int32_t>(0x8009030C));
        auto frame = TokenEnvelopeCodec::FailureFrame(2, failure);
        REQUIRE(frame.is_final);
        REQUIRE(frame.token.IsEmpty());

        auto decoded = TokenEnvelopeCodec::Decode(TokenEnvelopeCodec::Encode(frame).Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().status_code.has_value());
        REQUIRE(*decoded.Unwrap().status_code == static_cast<int32_t>(0x8009030C));
        REQUIRE(decoded.Unwrap().round == 2);
    }
    SECTION("Failure without a native status leaves status_code unset") {
        auto frame = TokenEnvelopeCodec::FailureFrame(1, AuthenticationFailure::Sequence("late"));
        auto decoded = TokenEnvelopeCodec::Decode(TokenEnvelopeCodec::Encode(frame).Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE_FALSE(decoded.Unwrap().status_code.has_value());
    }
}

TEST_CASE("TokenEnvelopeCodec - Rejects bad input", "[envelope][codec]") {
    SECTION("Garbage bytes fail to decode") {
        std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
        auto result = TokenEnvelopeCodec::Decode(garbage);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(AuthenticationFailureType::Decode));
    }
    SECTION("Unknown version is rejected") {
        secnego::proto::negotiation::TokenEnvelope envelope;
        envelope.set_version(EnvelopeConstants::VERSION + 1);
        envelope.set_round(1);
        auto result = TokenEnvelopeCodec::Decode(Serialize(envelope));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(AuthenticationFailureType::Decode));
    }
    SECTION("Oversized token is rejected on encode") {
        TokenEnvelopeFrame frame;
        frame.token = AuthenticationToken(std::vector<uint8_t>(EnvelopeConstants::MAX_TOKEN_SIZE + 1, 0x01));
        auto result = TokenEnvelopeCodec::Encode(frame);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(AuthenticationFailureType::InvalidInput));
    }
    SECTION("Oversized token is rejected on decode") {
        secnego::proto::negotiation::TokenEnvelope envelope;
        envelope.set_version(EnvelopeConstants::VERSION);
        envelope.set_token(std::string(EnvelopeConstants::MAX_TOKEN_SIZE + 1, 'x'));
        auto result = TokenEnvelopeCodec::Decode(Serialize(envelope));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().Is(AuthenticationFailureType::InvalidInput));
    }
}
