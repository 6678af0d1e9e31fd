#pragma once
#include "secnego/core/failures.hpp"
#include "secnego/enums/sec_status_code.hpp"

#include <fmt/core.h>

#include <string_view>

namespace secnego::auth {
/// Provider failure for a call that returned @p status, keeping the native code.
inline AuthenticationFailure ProviderFailure(const std::string_view call, const enums::SecStatusCode status) {
    return AuthenticationFailure::Provider(
        fmt::format("{} failed with {} (0x{:08X})",
                    call,
                    enums::ToString(status),
                    static_cast<uint32_t>(enums::ToNative(status))),
        enums::ToNative(status));
}
}
