#pragma once
#include "secnego/core/result.hpp"
#include "secnego/core/failures.hpp"
#include "secnego/tokens/authentication_token.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace secnego::auth::server {
    class ServerAuthenticationContext;
}
namespace secnego::auth::utilities {
using tokens::AuthenticationToken;

/// Decoded contents of a TokenEnvelope.
struct TokenEnvelopeFrame {
    uint32_t round = 0;
    AuthenticationToken token;
    bool is_final = false;
    std::optional<int32_t> status_code;
};

/**
 * @brief Wire framing for handshake tokens exchanged with the peer
 *
 * Wraps a token in the protobuf TokenEnvelope with the envelope version,
 * the round it belongs to and whether it ends the handshake.
 */
class TokenEnvelopeCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, AuthenticationFailure>
    Encode(const TokenEnvelopeFrame& frame);

    /**
     * @return Err(Decode) for malformed bytes or an unknown version,
     *         Err(InvalidInput) for a token above the maximum size
     */
    [[nodiscard]] static Result<TokenEnvelopeFrame, AuthenticationFailure>
    Decode(std::span<const uint8_t> data);

    /// Frame carrying the context's latest outbound token.
    [[nodiscard]] static TokenEnvelopeFrame
    ReplyFrame(const server::ServerAuthenticationContext& context);

    /// Frame reporting a failed round to the peer, with the native status if any.
    [[nodiscard]] static TokenEnvelopeFrame
    FailureFrame(uint32_t round, const AuthenticationFailure& failure);

private:
    TokenEnvelopeCodec() = delete;
};
}
