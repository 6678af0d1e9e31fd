#pragma once
#include "secnego/buffers/security_buffer_desc.hpp"
#include "secnego/enums/context_flags.hpp"
#include "secnego/enums/data_representation.hpp"
#include "secnego/enums/sec_status_code.hpp"
#include "secnego/handles/credential_handle.hpp"
#include "secnego/handles/sec_handle.hpp"
#include <cstdint>
#include <string>
namespace secnego::auth::interfaces {
using buffers::SecurityBufferDesc;
using enums::AcceptContextReqFlags;
using enums::AcceptContextRetFlags;
using enums::DataRepresentation;
using enums::SecStatusCode;
using handles::CredentialHandle;
using handles::NativeTokenHandle;
using handles::SecHandle;

/// Inputs of one accept round. `previous_context` is null on the first round.
struct AcceptRequest {
    const CredentialHandle& credentials;
    const SecHandle* previous_context;
    const SecurityBufferDesc& input;
    AcceptContextReqFlags requested_flags;
    DataRepresentation data_representation;
};

/// Everything an accept round reports besides the output token bytes.
struct AcceptResponse {
    SecStatusCode status = SecStatusCode::InternalError;
    SecHandle context{};
    AcceptContextRetFlags flags = AcceptContextRetFlags::None;
    int64_t expiry = 0;
};

struct QueryTokenResponse {
    SecStatusCode status = SecStatusCode::InternalError;
    NativeTokenHandle token = handles::kInvalidTokenHandle;
    std::string principal_name;
};

/**
 * @brief Call contract of the mechanism that actually authenticates a peer
 *
 * Implementations wrap SSPI, GSSAPI or a test double. Calls are blocking and
 * are never made concurrently for the same context handle.
 */
class ISecurityProvider {
public:
    virtual ~ISecurityProvider() = default;

    /// Advance the handshake; output token bytes go into the first buffer of `output`.
    [[nodiscard]] virtual AcceptResponse AcceptSecurityContext(
        const AcceptRequest& request,
        SecurityBufferDesc& output) = 0;

    /// Finalize output buffers after CompleteNeeded / CompleteAndContinue.
    [[nodiscard]] virtual SecStatusCode CompleteAuthToken(
        const SecHandle& context,
        SecurityBufferDesc& output) = 0;

    [[nodiscard]] virtual QueryTokenResponse QuerySecurityContextToken(const SecHandle& context) = 0;

    [[nodiscard]] virtual SecStatusCode ImpersonateSecurityContext(const SecHandle& context) = 0;

    [[nodiscard]] virtual SecStatusCode RevertSecurityContext(const SecHandle& context) = 0;

    [[nodiscard]] virtual SecStatusCode DeleteSecurityContext(const SecHandle& context) = 0;

    [[nodiscard]] virtual SecStatusCode CloseAccessToken(NativeTokenHandle token) = 0;
};
}
