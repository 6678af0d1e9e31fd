#include "secnego/crypto/sodium_interop.hpp"

#include <fmt/core.h>
#include <cstring>
#include <string>

namespace secnego::auth::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > Constants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Buffer size {} exceeds maximum {}",
                            buffer.size(), Constants::MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureFill(std::span<uint8_t> buffer, const uint8_t value) {
    if (value == SodiumConstants::SECURE_WIPE_PATTERN) {
        return SecureWipe(buffer);
    }
    if (buffer.size() > Constants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Buffer size {} exceeds maximum {}",
                            buffer.size(), Constants::MAX_BUFFER_SIZE)));
    }
    if (!buffer.empty()) {
        std::memset(buffer.data(), value, buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = SodiumConstants::SECURE_WIPE_PATTERN;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace secnego::auth::crypto
