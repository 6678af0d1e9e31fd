#include "secnego/buffers/buffer_utils.hpp"
#include "secnego/crypto/sodium_interop.hpp"

namespace secnego::auth::buffers {
    using crypto::SodiumInterop;

    Result<Unit, SodiumFailure> ZeroBuffer(SecurityBuffer& buffer) {
        return SodiumInterop::SecureWipe(buffer.WritableView());
    }

    Result<Unit, SodiumFailure> FillBuffer(SecurityBuffer& buffer, const uint8_t value) {
        return SodiumInterop::SecureFill(buffer.WritableView(), value);
    }

    Result<SecurityBuffer, SodiumFailure> ToTokenBuffer(const std::span<const uint8_t> token) {
        return SecurityBuffer::FromBytes(SecurityBufferType::Token, token);
    }

    Result<SecurityBuffer, SodiumFailure> AllocateTokenBuffer(const size_t capacity) {
        return SecurityBuffer::Allocate(SecurityBufferType::Token, capacity);
    }
}
