#include "secnego/tokens/access_token.hpp"
#include "secnego/core/provider_failure.hpp"
#include "secnego/debug/negotiation_logger.hpp"

namespace secnego::auth::tokens {
    using enums::SecStatusCode;

    AccessToken::AccessToken(
        std::shared_ptr<ISecurityProvider> provider,
        const NativeTokenHandle handle,
        std::string principal_name)
        : provider_(std::move(provider))
          , handle_(handle)
          , principal_name_(std::move(principal_name)) {
    }

    AccessToken::AccessToken(AccessToken&& other) noexcept
        : provider_(std::move(other.provider_))
          , handle_(other.handle_)
          , principal_name_(std::move(other.principal_name_)) {
        other.handle_ = handles::kInvalidTokenHandle;
    }

    AccessToken& AccessToken::operator=(AccessToken&& other) noexcept {
        if (this != &other) {
            auto close_result = Close();
            if (close_result.IsErr()) {
                SECNEGO_LOG_MSG("ACCESS_TOKEN", close_result.UnwrapErr().message.c_str());
            }
            provider_ = std::move(other.provider_);
            handle_ = other.handle_;
            principal_name_ = std::move(other.principal_name_);
            other.handle_ = handles::kInvalidTokenHandle;
        }
        return *this;
    }

    AccessToken::~AccessToken() {
        auto close_result = Close();
        if (close_result.IsErr()) {
            SECNEGO_LOG_MSG("ACCESS_TOKEN", close_result.UnwrapErr().message.c_str());
        }
    }

    Result<Unit, AuthenticationFailure> AccessToken::Close() {
        if (IsClosed() || !provider_) {
            handle_ = handles::kInvalidTokenHandle;
            return Result<Unit, AuthenticationFailure>::Ok(unit);
        }
        const auto handle = handle_;
        handle_ = handles::kInvalidTokenHandle;
        const SecStatusCode status = provider_->CloseAccessToken(handle);
        SECNEGO_LOG_STATUS("ACCESS_TOKEN", "CloseAccessToken", status);
        if (!enums::IsSuccess(status)) {
            return Result<Unit, AuthenticationFailure>::Err(
                ProviderFailure("CloseAccessToken", status));
        }
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }
}
