#pragma once
#include "secnego/buffers/security_buffer.hpp"
#include "secnego/core/failures.hpp"
#include "secnego/core/result.hpp"
#include <cstdint>
#include <span>
namespace secnego::auth::buffers {
/// Wipe the whole capacity of @p buffer; its length is left unchanged.
Result<Unit, SodiumFailure> ZeroBuffer(SecurityBuffer& buffer);

/// Set every byte of the capacity of @p buffer to @p value.
Result<Unit, SodiumFailure> FillBuffer(SecurityBuffer& buffer, uint8_t value);

/// Wrap a peer token in a Token-typed buffer.
Result<SecurityBuffer, SodiumFailure> ToTokenBuffer(std::span<const uint8_t> token);

/// Allocate an empty Token-typed buffer of @p capacity bytes for provider output.
Result<SecurityBuffer, SodiumFailure> AllocateTokenBuffer(size_t capacity);
}
