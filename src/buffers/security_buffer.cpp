#include "secnego/buffers/security_buffer.hpp"

#include <fmt/core.h>

namespace secnego::auth::buffers {

    Result<SecurityBuffer, SodiumFailure> SecurityBuffer::Allocate(
        const SecurityBufferType type,
        const size_t capacity) {
        auto memory_result = SecureMemoryHandle::Allocate(capacity);
        if (memory_result.IsErr()) {
            return Result<SecurityBuffer, SodiumFailure>::Err(memory_result.UnwrapErr());
        }
        return Result<SecurityBuffer, SodiumFailure>::Ok(
            SecurityBuffer(type, std::move(memory_result).Unwrap(), 0));
    }

    Result<SecurityBuffer, SodiumFailure> SecurityBuffer::FromBytes(
        const SecurityBufferType type,
        const std::span<const uint8_t> data) {
        if (data.empty()) {
            return Result<SecurityBuffer, SodiumFailure>::Ok(
                SecurityBuffer(type, SecureMemoryHandle(), 0));
        }
        auto memory_result = SecureMemoryHandle::Allocate(data.size());
        if (memory_result.IsErr()) {
            return Result<SecurityBuffer, SodiumFailure>::Err(memory_result.UnwrapErr());
        }
        auto memory = std::move(memory_result).Unwrap();
        if (auto write_result = memory.Write(data); write_result.IsErr()) {
            return Result<SecurityBuffer, SodiumFailure>::Err(write_result.UnwrapErr());
        }
        return Result<SecurityBuffer, SodiumFailure>::Ok(
            SecurityBuffer(type, std::move(memory), data.size()));
    }

    Result<Unit, SodiumFailure> SecurityBuffer::Assign(const std::span<const uint8_t> data) {
        requested_length_ = data.size();
        if (data.size() > Capacity()) {
            length_ = 0;
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::BufferTooSmall(
                    fmt::format("Token of {} bytes exceeds {} buffer capacity of {} bytes",
                                data.size(), enums::ToString(type_), Capacity())));
        }
        if (Capacity() == 0) {
            length_ = 0;
            return Result<Unit, SodiumFailure>::Ok(unit);
        }
        if (auto write_result = memory_.Write(data); write_result.IsErr()) {
            length_ = 0;
            return write_result;
        }
        length_ = data.size();
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    Result<Unit, SodiumFailure> SecurityBuffer::SetLength(const size_t length) {
        requested_length_ = length;
        if (length > Capacity()) {
            length_ = 0;
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::BufferTooSmall(
                    fmt::format("Length {} exceeds buffer capacity of {} bytes", length, Capacity())));
        }
        length_ = length;
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    std::span<const uint8_t> SecurityBuffer::View() const noexcept {
        if (memory_.IsInvalid() || length_ == 0) {
            return {};
        }
        auto view_result = memory_.WithReadAccess([this](std::span<const uint8_t> region) {
            return region.first(length_);
        });
        if (view_result.IsErr()) {
            return {};
        }
        return view_result.Unwrap();
    }

    std::span<uint8_t> SecurityBuffer::WritableView() noexcept {
        if (memory_.IsInvalid()) {
            return {};
        }
        auto view_result = memory_.WithWriteAccess([](std::span<uint8_t> region) {
            return region;
        });
        if (view_result.IsErr()) {
            return {};
        }
        return view_result.Unwrap();
    }

    Result<std::vector<uint8_t>, SodiumFailure> SecurityBuffer::ToArray() const {
        if (length_ == 0) {
            return Result<std::vector<uint8_t>, SodiumFailure>::Ok({});
        }
        return memory_.ReadBytes(length_);
    }

    Result<Unit, SodiumFailure> SecurityBuffer::Clear() {
        length_ = 0;
        requested_length_ = 0;
        if (memory_.IsInvalid()) {
            return Result<Unit, SodiumFailure>::Ok(unit);
        }
        return memory_.Zero();
    }

}
