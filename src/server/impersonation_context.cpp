#include "secnego/server/impersonation_context.hpp"
#include "secnego/core/provider_failure.hpp"
#include "secnego/debug/negotiation_logger.hpp"

namespace secnego::auth::server {
    Result<Unit, AuthenticationFailure> ImpersonationState::Revert() {
        std::lock_guard<std::mutex> guard(lock);
        if (!active) {
            return Result<Unit, AuthenticationFailure>::Ok(unit);
        }
        active = false;
        const auto status = provider->RevertSecurityContext(context);
        SECNEGO_LOG_STATUS("IMPERSONATE", "RevertSecurityContext", status);
        if (!enums::IsSuccess(status)) {
            return Result<Unit, AuthenticationFailure>::Err(
                ProviderFailure("RevertSecurityContext", status));
        }
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }

    ImpersonationContext::ImpersonationContext(std::shared_ptr<ImpersonationState> state) noexcept
        : state_(std::move(state)) {
    }

    ImpersonationContext::ImpersonationContext(ImpersonationContext &&other) noexcept
        : state_(std::move(other.state_)) {
    }

    ImpersonationContext &ImpersonationContext::operator=(ImpersonationContext &&other) noexcept {
        if (this != &other) {
            auto revert_result = Revert();
            if (revert_result.IsErr()) {
                SECNEGO_LOG_MSG("IMPERSONATE", revert_result.UnwrapErr().message.c_str());
            }
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ImpersonationContext::~ImpersonationContext() {
        auto revert_result = Revert();
        if (revert_result.IsErr()) {
            SECNEGO_LOG_MSG("IMPERSONATE", revert_result.UnwrapErr().message.c_str());
        }
    }

    Result<Unit, AuthenticationFailure> ImpersonationContext::Revert() {
        if (!state_) {
            return Result<Unit, AuthenticationFailure>::Ok(unit);
        }
        return state_->Revert();
    }

    bool ImpersonationContext::IsActive() const {
        if (!state_) {
            return false;
        }
        std::lock_guard<std::mutex> guard(state_->lock);
        return state_->active;
    }
}
