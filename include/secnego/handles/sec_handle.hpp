#pragma once
#include <cstdint>
namespace secnego::auth::handles {
/// Opaque two-word native handle, as issued by a security provider.
struct SecHandle {
    uintptr_t lower = 0;
    uintptr_t upper = 0;
    [[nodiscard]] constexpr bool IsEmpty() const noexcept {
        return lower == 0 && upper == 0;
    }
    constexpr bool operator==(const SecHandle&) const noexcept = default;
};
using NativeTokenHandle = uintptr_t;
inline constexpr NativeTokenHandle kInvalidTokenHandle = 0;
}
