#include "secnego/handles/security_context_handle.hpp"
#include "secnego/interfaces/i_security_provider.hpp"
#include "secnego/core/constants.hpp"
#include "secnego/core/provider_failure.hpp"
#include "secnego/debug/negotiation_logger.hpp"

namespace secnego::auth::handles {
    SecurityContextHandle::SecurityContextHandle(SecurityContextHandle&& other) noexcept
        : native_(other.native_)
          , created_(other.created_)
          , released_(other.released_) {
        other.native_ = SecHandle{};
        other.created_ = false;
        other.released_ = true;
    }

    SecurityContextHandle& SecurityContextHandle::operator=(SecurityContextHandle&& other) noexcept {
        if (this != &other) {
            native_ = other.native_;
            created_ = other.created_;
            released_ = other.released_;
            other.native_ = SecHandle{};
            other.created_ = false;
            other.released_ = true;
        }
        return *this;
    }

    Result<Unit, AuthenticationFailure> SecurityContextHandle::Assign(const SecHandle& native) {
        if (released_) {
            return Result<Unit, AuthenticationFailure>::Err(
                AuthenticationFailure::Disposed(std::string(ErrorMessages::HANDLE_DISPOSED)));
        }
        native_ = native;
        created_ = true;
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }

    const SecHandle* SecurityContextHandle::Previous() const noexcept {
        if (!created_ || released_) {
            return nullptr;
        }
        return &native_;
    }

    Result<Unit, AuthenticationFailure> SecurityContextHandle::Release(
        interfaces::ISecurityProvider& provider) {
        if (released_) {
            return Result<Unit, AuthenticationFailure>::Ok(unit);
        }
        released_ = true;
        if (!created_) {
            return Result<Unit, AuthenticationFailure>::Ok(unit);
        }
        const auto status = provider.DeleteSecurityContext(native_);
        SECNEGO_LOG_STATUS("CONTEXT", "DeleteSecurityContext", status);
        native_ = SecHandle{};
        if (!enums::IsSuccess(status)) {
            return Result<Unit, AuthenticationFailure>::Err(
                ProviderFailure("DeleteSecurityContext", status));
        }
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }
}
