#pragma once

#include "secnego/core/result.hpp"
#include "secnego/core/failures.hpp"
#include "secnego/crypto/secure_memory_handle.hpp"
#include "secnego/enums/security_buffer_type.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace secnego::auth::buffers {

using crypto::SecureMemoryHandle;
using enums::SecurityBufferType;

/**
 * @brief One typed segment handed to a security provider
 *
 * A buffer has a fixed capacity chosen at allocation and a current length,
 * which the provider sets when it writes output. Writes beyond the capacity
 * are refused and remembered, so the caller can tell an oversized token
 * from a provider failure.
 */
class SecurityBuffer {
public:
    /**
     * @brief Allocate an empty buffer of @p capacity bytes for provider output
     */
    [[nodiscard]] static Result<SecurityBuffer, SodiumFailure> Allocate(
        SecurityBufferType type,
        size_t capacity);

    /**
     * @brief Copy @p data into a new buffer whose length equals its capacity
     *
     * An empty span yields a zero-capacity buffer without allocating.
     */
    [[nodiscard]] static Result<SecurityBuffer, SodiumFailure> FromBytes(
        SecurityBufferType type,
        std::span<const uint8_t> data);

    SecurityBuffer(SecurityBuffer&&) noexcept = default;
    SecurityBuffer& operator=(SecurityBuffer&&) noexcept = default;
    SecurityBuffer(const SecurityBuffer&) = delete;
    SecurityBuffer& operator=(const SecurityBuffer&) = delete;
    ~SecurityBuffer() = default;

    [[nodiscard]] SecurityBufferType Type() const noexcept { return type_; }

    [[nodiscard]] size_t Capacity() const noexcept { return memory_.Size(); }
    [[nodiscard]] size_t Length() const noexcept { return length_; }
    [[nodiscard]] bool Overflowed() const noexcept { return requested_length_ > Capacity(); }
    [[nodiscard]] size_t RequestedLength() const noexcept { return requested_length_; }

    /**
     * @brief Replace the contents with @p data and set the length
     *
     * @return Err(BufferTooSmall) if @p data does not fit; the buffer is left
     *         empty and Overflowed() reports true
     */
    Result<Unit, SodiumFailure> Assign(std::span<const uint8_t> data);

    /**
     * @brief Set the valid length after writing through WritableView()
     */
    Result<Unit, SodiumFailure> SetLength(size_t length);

    /// First Length() bytes.
    [[nodiscard]] std::span<const uint8_t> View() const noexcept;

    /// Whole capacity, for providers that write in place.
    [[nodiscard]] std::span<uint8_t> WritableView() noexcept;

    [[nodiscard]] Result<std::vector<uint8_t>, SodiumFailure> ToArray() const;

    /// Length back to zero and the contents wiped.
    Result<Unit, SodiumFailure> Clear();

private:
    SecurityBuffer(SecurityBufferType type, SecureMemoryHandle memory, size_t length) noexcept
        : type_(type), memory_(std::move(memory)), length_(length), requested_length_(length) {}

    SecurityBufferType type_;
    SecureMemoryHandle memory_;
    size_t length_;
    size_t requested_length_;
};

} // namespace secnego::auth::buffers
