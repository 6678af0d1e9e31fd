#pragma once

#include "secnego/core/constants.hpp"
#include "secnego/core/failures.hpp"
#include "secnego/core/result.hpp"
#include "secnego/enums/context_flags.hpp"
#include "secnego/enums/data_representation.hpp"

#include <fmt/core.h>

#include <cstddef>

namespace secnego::auth::configuration {

using enums::AcceptContextReqFlags;
using enums::DataRepresentation;

/**
 * @brief Per-engine negotiation settings
 *
 * Bundles the requested context attributes, the data representation passed
 * to the provider and the fixed capacity of the per-round output buffer.
 *
 * **Presets**:
 * - Default: no requested attributes, 64 KiB output buffer
 * - Connection: connection-oriented session with confidentiality,
 *   integrity, replay and sequence detection
 * - Delegation: Connection plus credential delegation
 * - Datagram: message-oriented session
 *
 * **Usage Example**:
 * ```cpp
 * auto config = NegotiationConfig::Connection().WithOutputTokenCapacity(16 * 1024);
 * if (auto valid = config.Validate(); valid.IsErr()) {
 *     return valid.UnwrapErr();
 * }
 * auto context = ServerAuthenticationContext::Create(provider, credentials, config);
 * ```
 */
class NegotiationConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr NegotiationConfig Default() noexcept {
        return NegotiationConfig(AcceptContextReqFlags::None);
    }

    [[nodiscard]] static constexpr NegotiationConfig Connection() noexcept {
        return NegotiationConfig(
            AcceptContextReqFlags::Connection |
            AcceptContextReqFlags::Confidentiality |
            AcceptContextReqFlags::Integrity |
            AcceptContextReqFlags::ReplayDetect |
            AcceptContextReqFlags::SequenceDetect);
    }

    [[nodiscard]] static constexpr NegotiationConfig Delegation() noexcept {
        return NegotiationConfig(
            Connection().RequestedFlags() | AcceptContextReqFlags::Delegate);
    }

    [[nodiscard]] static constexpr NegotiationConfig Datagram() noexcept {
        return NegotiationConfig(
            AcceptContextReqFlags::Datagram |
            AcceptContextReqFlags::Integrity |
            AcceptContextReqFlags::ReplayDetect);
    }

    // =========================================================================
    // Modifiers
    // =========================================================================

    [[nodiscard]] constexpr NegotiationConfig WithRequestedFlags(
        const AcceptContextReqFlags flags) const noexcept {
        NegotiationConfig copy = *this;
        copy.requested_flags_ = flags;
        return copy;
    }

    [[nodiscard]] constexpr NegotiationConfig WithDataRepresentation(
        const DataRepresentation representation) const noexcept {
        NegotiationConfig copy = *this;
        copy.data_representation_ = representation;
        return copy;
    }

    [[nodiscard]] constexpr NegotiationConfig WithOutputTokenCapacity(
        const size_t capacity) const noexcept {
        NegotiationConfig copy = *this;
        copy.output_token_capacity_ = capacity;
        return copy;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr AcceptContextReqFlags RequestedFlags() const noexcept {
        return requested_flags_;
    }

    [[nodiscard]] constexpr DataRepresentation GetDataRepresentation() const noexcept {
        return data_representation_;
    }

    [[nodiscard]] constexpr size_t OutputTokenCapacity() const noexcept {
        return output_token_capacity_;
    }

    /**
     * @brief Check the output capacity against the accepted range
     *
     * @return Err(InvalidInput) if the capacity is outside
     *         [MIN_OUTPUT_TOKEN_BUFFER_SIZE, MAX_OUTPUT_TOKEN_BUFFER_SIZE]
     */
    [[nodiscard]] Result<Unit, AuthenticationFailure> Validate() const {
        if (output_token_capacity_ < Constants::MIN_OUTPUT_TOKEN_BUFFER_SIZE ||
            output_token_capacity_ > Constants::MAX_OUTPUT_TOKEN_BUFFER_SIZE) {
            return Result<Unit, AuthenticationFailure>::Err(
                AuthenticationFailure::InvalidInput(
                    fmt::format("Output token capacity {} is outside [{}, {}]",
                                output_token_capacity_,
                                Constants::MIN_OUTPUT_TOKEN_BUFFER_SIZE,
                                Constants::MAX_OUTPUT_TOKEN_BUFFER_SIZE)));
        }
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }

    [[nodiscard]] constexpr bool operator==(const NegotiationConfig& other) const noexcept {
        return requested_flags_ == other.requested_flags_ &&
               data_representation_ == other.data_representation_ &&
               output_token_capacity_ == other.output_token_capacity_;
    }

private:
    explicit constexpr NegotiationConfig(const AcceptContextReqFlags flags) noexcept
        : requested_flags_(flags) {}

    AcceptContextReqFlags requested_flags_;
    DataRepresentation data_representation_ = DataRepresentation::Native;
    size_t output_token_capacity_ = Constants::DEFAULT_OUTPUT_TOKEN_BUFFER_SIZE;
};

} // namespace secnego::auth::configuration
