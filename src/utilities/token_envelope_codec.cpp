#include "secnego/utilities/token_envelope_codec.hpp"
#include "secnego/server/server_authentication_context.hpp"
#include "secnego/core/constants.hpp"
#include "negotiation/token_envelope.pb.h"

#include <fmt/core.h>

#include <exception>
#include <limits>

namespace secnego::auth::utilities {
    Result<std::vector<uint8_t>, AuthenticationFailure>
    TokenEnvelopeCodec::Encode(const TokenEnvelopeFrame &frame) {
        if (frame.token.Size() > EnvelopeConstants::MAX_TOKEN_SIZE) {
            return Result<std::vector<uint8_t>, AuthenticationFailure>::Err(
                AuthenticationFailure::InvalidInput(
                    fmt::format("Token of {} bytes exceeds the {} byte envelope limit",
                                frame.token.Size(), EnvelopeConstants::MAX_TOKEN_SIZE)));
        }
        try {
            proto::negotiation::TokenEnvelope envelope;
            envelope.set_version(EnvelopeConstants::VERSION);
            envelope.set_round(frame.round);
            const auto token = frame.token.Bytes();
            envelope.set_token(token.data(), token.size());
            envelope.set_is_final(frame.is_final);
            if (frame.status_code.has_value()) {
                envelope.set_status_code(*frame.status_code);
            }
            const size_t size = envelope.ByteSizeLong();
            std::vector<uint8_t> bytes(size);
            if (!envelope.SerializeToArray(bytes.data(), static_cast<int>(size))) {
                return Result<std::vector<uint8_t>, AuthenticationFailure>::Err(
                    AuthenticationFailure::Encode("Failed to serialize TokenEnvelope to protobuf"));
            }
            return Result<std::vector<uint8_t>, AuthenticationFailure>::Ok(std::move(bytes));
        } catch (const std::exception &ex) {
            return Result<std::vector<uint8_t>, AuthenticationFailure>::Err(
                AuthenticationFailure::Encode(
                    fmt::format("Exception during envelope encoding: {}", ex.what())));
        }
    }

    Result<TokenEnvelopeFrame, AuthenticationFailure>
    TokenEnvelopeCodec::Decode(const std::span<const uint8_t> data) {
        if (data.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return Result<TokenEnvelopeFrame, AuthenticationFailure>::Err(
                AuthenticationFailure::InvalidInput("Envelope is too large to parse"));
        }
        try {
            proto::negotiation::TokenEnvelope envelope;
            if (!envelope.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
                return Result<TokenEnvelopeFrame, AuthenticationFailure>::Err(
                    AuthenticationFailure::Decode("Failed to parse TokenEnvelope from protobuf"));
            }
            if (envelope.version() != EnvelopeConstants::VERSION) {
                return Result<TokenEnvelopeFrame, AuthenticationFailure>::Err(
                    AuthenticationFailure::Decode(
                        fmt::format("Unsupported envelope version {} (expected {})",
                                    envelope.version(), EnvelopeConstants::VERSION)));
            }
            const std::string &token = envelope.token();
            if (token.size() > EnvelopeConstants::MAX_TOKEN_SIZE) {
                return Result<TokenEnvelopeFrame, AuthenticationFailure>::Err(
                    AuthenticationFailure::InvalidInput(
                        fmt::format("Token of {} bytes exceeds the {} byte envelope limit",
                                    token.size(), EnvelopeConstants::MAX_TOKEN_SIZE)));
            }
            TokenEnvelopeFrame frame;
            frame.round = envelope.round();
            frame.token = AuthenticationToken(std::vector<uint8_t>(token.begin(), token.end()));
            frame.is_final = envelope.is_final();
            if (envelope.has_status_code()) {
                frame.status_code = envelope.status_code();
            }
            return Result<TokenEnvelopeFrame, AuthenticationFailure>::Ok(std::move(frame));
        } catch (const std::exception &ex) {
            return Result<TokenEnvelopeFrame, AuthenticationFailure>::Err(
                AuthenticationFailure::Decode(
                    fmt::format("Exception during envelope decoding: {}", ex.what())));
        }
    }

    TokenEnvelopeFrame TokenEnvelopeCodec::ReplyFrame(const server::ServerAuthenticationContext &context) {
        TokenEnvelopeFrame frame;
        frame.round = context.Round();
        frame.token = context.Token();
        frame.is_final = context.Done();
        return frame;
    }

    TokenEnvelopeFrame TokenEnvelopeCodec::FailureFrame(const uint32_t round, const AuthenticationFailure &failure) {
        TokenEnvelopeFrame frame;
        frame.round = round;
        frame.is_final = true;
        frame.status_code = failure.native_status;
        return frame;
    }
}
