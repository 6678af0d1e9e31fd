#pragma once

#include <cstdint>

namespace secnego::auth::enums {

/**
 * @brief Native status returned by a security provider call
 *
 * Values follow the SSPI SECURITY_STATUS layout. The set of error codes is
 * open: a provider may return any negative value, and the engine carries it
 * through unchanged in the resulting failure. Only the four non-error codes
 * below drive the negotiation state machine.
 */
enum class SecStatusCode : int32_t {
    Ok = 0x00000000,
    ContinueNeeded = 0x00090312,
    CompleteNeeded = 0x00090313,
    CompleteAndContinue = 0x00090314,

    InsufficientMemory = static_cast<int32_t>(0x80090300u),
    InvalidHandle = static_cast<int32_t>(0x80090301u),
    UnsupportedFunction = static_cast<int32_t>(0x80090302u),
    InternalError = static_cast<int32_t>(0x80090304u),
    InvalidToken = static_cast<int32_t>(0x80090308u),
    LogonDenied = static_cast<int32_t>(0x8009030Cu),
    NoCredentials = static_cast<int32_t>(0x8009030Eu),
    ContextExpired = static_cast<int32_t>(0x80090317u),
    IncompleteMessage = static_cast<int32_t>(0x80090318u),
    BufferTooSmall = static_cast<int32_t>(0x80090321u),
    WrongPrincipal = static_cast<int32_t>(0x80090322u)
};

/**
 * @brief What a status code means for the current negotiation round
 */
enum class StatusDisposition : uint8_t {
    Ok,
    Continue,
    CompleteNeeded,
    CompleteAndContinue,
    Error
};

constexpr StatusDisposition Classify(const SecStatusCode status) noexcept {
    switch (status) {
        case SecStatusCode::Ok:
            return StatusDisposition::Ok;
        case SecStatusCode::ContinueNeeded:
            return StatusDisposition::Continue;
        case SecStatusCode::CompleteNeeded:
            return StatusDisposition::CompleteNeeded;
        case SecStatusCode::CompleteAndContinue:
            return StatusDisposition::CompleteAndContinue;
        default:
            return StatusDisposition::Error;
    }
}

constexpr bool IsSuccess(const SecStatusCode status) noexcept {
    return Classify(status) != StatusDisposition::Error;
}

/// The output buffers must be finalized with CompleteAuthToken before use.
constexpr bool RequiresCompletion(const SecStatusCode status) noexcept {
    const auto disposition = Classify(status);
    return disposition == StatusDisposition::CompleteNeeded ||
           disposition == StatusDisposition::CompleteAndContinue;
}

/// No further rounds are expected from the peer.
constexpr bool SignalsDone(const SecStatusCode status) noexcept {
    const auto disposition = Classify(status);
    return disposition == StatusDisposition::Ok ||
           disposition == StatusDisposition::CompleteNeeded;
}

constexpr int32_t ToNative(const SecStatusCode status) noexcept {
    return static_cast<int32_t>(status);
}

constexpr const char* ToString(const SecStatusCode status) noexcept {
    switch (status) {
        case SecStatusCode::Ok:
            return "SEC_E_OK";
        case SecStatusCode::ContinueNeeded:
            return "SEC_I_CONTINUE_NEEDED";
        case SecStatusCode::CompleteNeeded:
            return "SEC_I_COMPLETE_NEEDED";
        case SecStatusCode::CompleteAndContinue:
            return "SEC_I_COMPLETE_AND_CONTINUE";
        case SecStatusCode::InsufficientMemory:
            return "SEC_E_INSUFFICIENT_MEMORY";
        case SecStatusCode::InvalidHandle:
            return "SEC_E_INVALID_HANDLE";
        case SecStatusCode::UnsupportedFunction:
            return "SEC_E_UNSUPPORTED_FUNCTION";
        case SecStatusCode::InternalError:
            return "SEC_E_INTERNAL_ERROR";
        case SecStatusCode::InvalidToken:
            return "SEC_E_INVALID_TOKEN";
        case SecStatusCode::LogonDenied:
            return "SEC_E_LOGON_DENIED";
        case SecStatusCode::NoCredentials:
            return "SEC_E_NO_CREDENTIALS";
        case SecStatusCode::ContextExpired:
            return "SEC_E_CONTEXT_EXPIRED";
        case SecStatusCode::IncompleteMessage:
            return "SEC_E_INCOMPLETE_MESSAGE";
        case SecStatusCode::BufferTooSmall:
            return "SEC_E_BUFFER_TOO_SMALL";
        case SecStatusCode::WrongPrincipal:
            return "SEC_E_WRONG_PRINCIPAL";
        default:
            return "UNKNOWN";
    }
}

} // namespace secnego::auth::enums
