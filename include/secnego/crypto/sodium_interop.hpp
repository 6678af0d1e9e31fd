#pragma once

#include "secnego/core/result.hpp"
#include "secnego/core/failures.hpp"
#include "secnego/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>

namespace secnego::auth::crypto {

/**
 * @brief Interop layer for libsodium memory primitives
 *
 * Backs the buffer library used by the negotiation engine: guarded
 * allocations for token buffers, secure wiping and constant-time
 * comparison. Call Initialize() once before allocating.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones
     * with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Fill a buffer with a single byte value
     */
    static Result<Unit, SodiumFailure> SecureFill(std::span<uint8_t> buffer, uint8_t value);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guarded memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    /**
     * @brief Free memory allocated by AllocateSecure (zeroed by libsodium)
     */
    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace secnego::auth::crypto
