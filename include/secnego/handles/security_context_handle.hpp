#pragma once
#include "secnego/core/failures.hpp"
#include "secnego/core/result.hpp"
#include "secnego/handles/sec_handle.hpp"

namespace secnego::auth::interfaces {
class ISecurityProvider;
}

namespace secnego::auth::handles {

/**
 * @brief Owned wrapper for the native negotiation state
 *
 * Starts out not created. The first successful accept round adopts the
 * provider's handle; later rounds update it in place. Release() deletes the
 * native context exactly once, and only if it was ever created.
 */
class SecurityContextHandle {
public:
    SecurityContextHandle() = default;

    SecurityContextHandle(SecurityContextHandle&& other) noexcept;
    SecurityContextHandle& operator=(SecurityContextHandle&& other) noexcept;
    SecurityContextHandle(const SecurityContextHandle&) = delete;
    SecurityContextHandle& operator=(const SecurityContextHandle&) = delete;
    ~SecurityContextHandle() = default;

    /// Adopt (first round) or update (later rounds) the native handle.
    Result<Unit, AuthenticationFailure> Assign(const SecHandle& native);

    /// Handle to pass as the previous context, or nullptr before the first round.
    [[nodiscard]] const SecHandle* Previous() const noexcept;

    [[nodiscard]] const SecHandle& Native() const noexcept { return native_; }
    [[nodiscard]] bool IsCreated() const noexcept { return created_; }
    [[nodiscard]] bool IsReleased() const noexcept { return released_; }

    /**
     * @brief Delete the native context through @p provider
     *
     * Later calls succeed without effect. A handle that was never created is
     * marked released without calling the provider.
     */
    Result<Unit, AuthenticationFailure> Release(interfaces::ISecurityProvider& provider);

private:
    SecHandle native_{};
    bool created_ = false;
    bool released_ = false;
};

}
