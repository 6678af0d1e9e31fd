#pragma once
#include "secnego/core/result.hpp"
#include "secnego/core/failures.hpp"
#include "secnego/handles/sec_handle.hpp"
#include "secnego/interfaces/i_security_provider.hpp"
#include <memory>
#include <mutex>

namespace secnego::auth::server {
    class ServerAuthenticationContext;

    /// Revert state shared between a scope and the context that issued it.
    struct ImpersonationState {
        std::shared_ptr<interfaces::ISecurityProvider> provider;
        handles::SecHandle context;
        bool active = true;
        std::mutex lock;

        /// Revert once; later calls succeed without effect.
        Result<Unit, AuthenticationFailure> Revert();
    };

    /**
     * @brief Scope during which the calling thread acts as the authenticated peer
     *
     * Obtained only from a completed ServerAuthenticationContext. The original
     * identity is restored exactly once: by Revert(), on destruction, or by
     * the issuing context when it is disposed first.
     */
    class ImpersonationContext {
    public:
        ImpersonationContext(ImpersonationContext &&other) noexcept;
        ImpersonationContext &operator=(ImpersonationContext &&other) noexcept;
        ImpersonationContext(const ImpersonationContext &) = delete;
        ImpersonationContext &operator=(const ImpersonationContext &) = delete;
        ~ImpersonationContext();

        /// Restore the original identity. Later calls succeed without effect.
        Result<Unit, AuthenticationFailure> Revert();

        [[nodiscard]] bool IsActive() const;

    private:
        friend class ServerAuthenticationContext;

        explicit ImpersonationContext(std::shared_ptr<ImpersonationState> state) noexcept;

        std::shared_ptr<ImpersonationState> state_;
    };
}
