#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace secnego::auth::tokens {

/**
 * @brief One opaque protocol message exchanged during a handshake
 *
 * Immutable; owns its bytes. Equality compares contents in constant time.
 */
class AuthenticationToken {
public:
    AuthenticationToken() = default;

    explicit AuthenticationToken(std::vector<uint8_t> data)
        : data_(std::move(data)) {}

    /// Copy @p data into a new token.
    [[nodiscard]] static AuthenticationToken Parse(std::span<const uint8_t> data) {
        return AuthenticationToken(std::vector<uint8_t>(data.begin(), data.end()));
    }

    [[nodiscard]] std::span<const uint8_t> Bytes() const noexcept { return data_; }
    [[nodiscard]] std::vector<uint8_t> ToArray() const { return data_; }
    [[nodiscard]] size_t Size() const noexcept { return data_.size(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return data_.empty(); }

    [[nodiscard]] bool operator==(const AuthenticationToken& other) const noexcept;
    [[nodiscard]] bool operator!=(const AuthenticationToken& other) const noexcept {
        return !(*this == other);
    }

private:
    std::vector<uint8_t> data_;
};

} // namespace secnego::auth::tokens
