#include "secnego/crypto/secure_memory_handle.hpp"
#include "secnego/crypto/sodium_interop.hpp"
#include "secnego/core/constants.hpp"

#include <string>

namespace secnego::auth::crypto {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }

    if (size > Constants::MAX_BUFFER_SIZE) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                fmt::format("Requested {} bytes exceeds maximum {}", size, Constants::MAX_BUFFER_SIZE)));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                std::string(ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY) +
                std::to_string(size) + " bytes"));
    }

    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(ptr, size));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

// ============================================================================
// Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("{} (data: {}, buffer: {})",
                            ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }

    if (!data.empty()) {
        std::memcpy(ptr_, data.data(), data.size());
    }
    if (data.size() < size_) {
        return SodiumInterop::SecureWipe(
            std::span<uint8_t>(static_cast<uint8_t*>(ptr_) + data.size(), size_ - data.size()));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("Output buffer too small (requested: {}, provided: {})",
                            size_, output.size())));
    }

    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                fmt::format("{}{} of {} bytes exceeds allocation",
                            ErrorMessages::FAILED_TO_READ_SECURE_MEMORY, size, size_)));
    }

    std::vector<uint8_t> result(size);
    if (size > 0) {
        std::memcpy(result.data(), ptr_, size);
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(result));
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Zero() {
    return Fill(SodiumConstants::SECURE_WIPE_PATTERN);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Fill(const uint8_t value) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    return SodiumInterop::SecureFill(std::span<uint8_t>(static_cast<uint8_t*>(ptr_), size_), value);
}

} // namespace secnego::auth::crypto
