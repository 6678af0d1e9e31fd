#pragma once

#include "secnego/core/result.hpp"
#include "secnego/core/failures.hpp"

#include <fmt/core.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <vector>

namespace secnego::auth::crypto {

/**
 * @brief RAII wrapper for a libsodium guarded memory region
 *
 * Backing store for every byte region the negotiation engine hands to a
 * provider. Memory comes from sodium_malloc, so it sits between guard pages
 * and is zeroed when freed.
 *
 * Move-only; the destructor always frees. A moved-from or default handle is
 * invalid and every operation on it fails with InvalidOperation.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::Allocate(64 * 1024).Unwrap();
 * handle.WriteAt<uint32_t>(0, 0x10);
 * auto bytes = handle.ReadBytes(4).Unwrap();
 * @endcode
 */
class SecureMemoryHandle {
public:
    // ========================================================================
    // Construction / Destruction
    // ========================================================================

    /**
     * @brief Allocate a guarded region of @p size bytes
     *
     * @return Ok(SecureMemoryHandle) or Err on zero size / allocation failure
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    // ========================================================================
    // Memory Operations
    // ========================================================================

    /**
     * @brief Copy @p data to the start of the region, zeroing the remainder
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole region into @p output (must be >= Size())
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Copy the first @p size bytes into a new vector
     */
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    Result<Unit, SodiumFailure> Zero();

    Result<Unit, SodiumFailure> Fill(uint8_t value);

    /**
     * @brief Write a trivially copyable value at a byte offset
     */
    template<typename T>
    Result<Unit, SodiumFailure> WriteAt(size_t offset, const T& value) {
        static_assert(std::is_trivially_copyable_v<T>, "WriteAt requires a trivially copyable type");
        if (auto check = CheckRange(offset, sizeof(T)); check.IsErr()) {
            return check;
        }
        std::memcpy(static_cast<uint8_t*>(ptr_) + offset, &value, sizeof(T));
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    /**
     * @brief Read a trivially copyable value from a byte offset
     */
    template<typename T>
    Result<T, SodiumFailure> ReadAt(size_t offset) const {
        static_assert(std::is_trivially_copyable_v<T>, "ReadAt requires a trivially copyable type");
        if (auto check = CheckRange(offset, sizeof(T)); check.IsErr()) {
            return Result<T, SodiumFailure>::Err(check.UnwrapErr());
        }
        T value{};
        std::memcpy(&value, static_cast<const uint8_t*>(ptr_) + offset, sizeof(T));
        return Result<T, SodiumFailure>::Ok(value);
    }

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<uint8_t> secure_span(static_cast<uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    // ========================================================================
    // State Queries
    // ========================================================================

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    Result<Unit, SodiumFailure> CheckRange(size_t offset, size_t length) const {
        if (IsInvalid()) {
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        if (offset > size_ || length > size_ - offset) {
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::BufferTooSmall(
                    fmt::format("Access of {} bytes at offset {} exceeds buffer of {} bytes",
                                length, offset, size_)));
        }
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace secnego::auth::crypto
