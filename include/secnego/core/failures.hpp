#pragma once
#include <cstdint>
#include <string>
#include <optional>
namespace secnego::auth {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class AuthenticationFailureType {
    Generic,
    Provider,
    Sequence,
    Capacity,
    Disposed,
    InvalidInput,
    Allocation,
    Decode,
    Encode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
/// Failure reported by every public negotiation operation.
///
/// `native_status` holds the provider's raw status code when the failure
/// originated in a provider call, so callers can diagnose the mechanism error.
class AuthenticationFailure {
public:
    AuthenticationFailureType type;
    std::string message;
    std::optional<int32_t> native_status;
    AuthenticationFailure(const AuthenticationFailureType t, std::string msg,
                          std::optional<int32_t> status = std::nullopt)
        : type(t), message(std::move(msg)), native_status(status) {}
    static AuthenticationFailure Generic(std::string msg) {
        return {AuthenticationFailureType::Generic, std::move(msg)};
    }
    static AuthenticationFailure Provider(std::string msg, const int32_t status) {
        return {AuthenticationFailureType::Provider, std::move(msg), status};
    }
    static AuthenticationFailure Sequence(std::string msg) {
        return {AuthenticationFailureType::Sequence, std::move(msg)};
    }
    static AuthenticationFailure Capacity(std::string msg) {
        return {AuthenticationFailureType::Capacity, std::move(msg)};
    }
    static AuthenticationFailure Disposed(std::string msg) {
        return {AuthenticationFailureType::Disposed, std::move(msg)};
    }
    static AuthenticationFailure InvalidInput(std::string msg) {
        return {AuthenticationFailureType::InvalidInput, std::move(msg)};
    }
    static AuthenticationFailure Allocation(std::string msg) {
        return {AuthenticationFailureType::Allocation, std::move(msg)};
    }
    static AuthenticationFailure Decode(std::string msg) {
        return {AuthenticationFailureType::Decode, std::move(msg)};
    }
    static AuthenticationFailure Encode(std::string msg) {
        return {AuthenticationFailureType::Encode, std::move(msg)};
    }
    static AuthenticationFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::BufferTooSmall) {
            return Capacity(sf.message);
        }
        return Allocation(sf.message);
    }
    [[nodiscard]] bool Is(const AuthenticationFailureType t) const noexcept {
        return type == t;
    }
};
}
