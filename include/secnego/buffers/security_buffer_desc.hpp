#pragma once
#include "secnego/buffers/security_buffer.hpp"
#include <cstddef>
#include <initializer_list>
#include <vector>
namespace secnego::auth::buffers {
/**
 * @brief Ordered list of buffers passed to a provider as one argument
 *
 * Does not own the buffers; they must outlive the descriptor.
 */
class SecurityBufferDesc {
public:
    SecurityBufferDesc(std::initializer_list<SecurityBuffer*> buffers)
        : buffers_(buffers) {}

    [[nodiscard]] size_t Count() const noexcept { return buffers_.size(); }

    [[nodiscard]] SecurityBuffer* At(const size_t index) noexcept {
        return index < buffers_.size() ? buffers_[index] : nullptr;
    }

    [[nodiscard]] const SecurityBuffer* At(const size_t index) const noexcept {
        return index < buffers_.size() ? buffers_[index] : nullptr;
    }

    /// First buffer of @p type, or nullptr.
    [[nodiscard]] SecurityBuffer* Find(const SecurityBufferType type) noexcept {
        for (auto* buffer : buffers_) {
            if (buffer != nullptr && buffer->Type() == type) {
                return buffer;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const SecurityBuffer* Find(const SecurityBufferType type) const noexcept {
        for (const auto* buffer : buffers_) {
            if (buffer != nullptr && buffer->Type() == type) {
                return buffer;
            }
        }
        return nullptr;
    }

private:
    std::vector<SecurityBuffer*> buffers_;
};
}
