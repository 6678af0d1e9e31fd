#include "secnego/server/server_authentication_context.hpp"
#include "secnego/buffers/buffer_utils.hpp"
#include "secnego/buffers/disposable_list.hpp"
#include "secnego/buffers/security_buffer_desc.hpp"
#include "secnego/core/constants.hpp"
#include "secnego/core/provider_failure.hpp"
#include "secnego/crypto/sodium_interop.hpp"
#include "secnego/debug/negotiation_logger.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>

namespace secnego::auth::server {
    using buffers::DisposableList;
    using buffers::SecurityBuffer;
    using buffers::SecurityBufferDesc;
    using enums::SecStatusCode;
    using enums::StatusDisposition;
    using interfaces::AcceptRequest;
    using interfaces::AcceptResponse;

    namespace {
        AuthenticationFailure CapacityFailure(const size_t requested, const size_t capacity,
                                              std::optional<int32_t> native_status = std::nullopt) {
            // A provider may refuse the buffer without reporting the size it needed.
            std::string message = requested > capacity
                                      ? fmt::format("Output token of {} bytes exceeds the {} byte output buffer",
                                                    requested, capacity)
                                      : fmt::format("Output token does not fit the {} byte output buffer",
                                                    capacity);
            return AuthenticationFailure(AuthenticationFailureType::Capacity, std::move(message), native_status);
        }
    }

    ServerAuthenticationContext::ServerAuthenticationContext(
        std::shared_ptr<ISecurityProvider> provider,
        const CredentialHandle &credentials,
        const AcceptContextReqFlags requested_flags,
        const enums::DataRepresentation data_representation,
        const size_t output_token_capacity)
        : provider_(std::move(provider))
          , credentials_(credentials)
          , requested_flags_(requested_flags & ~AcceptContextReqFlags::AllocateMemory)
          , data_representation_(data_representation)
          , output_token_capacity_(output_token_capacity) {
    }

    Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure> ServerAuthenticationContext::Create(
        std::shared_ptr<ISecurityProvider> provider,
        const CredentialHandle &credentials) {
        return Create(std::move(provider), credentials, NegotiationConfig::Default());
    }

    Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure> ServerAuthenticationContext::Create(
        std::shared_ptr<ISecurityProvider> provider,
        const CredentialHandle &credentials,
        const AcceptContextReqFlags requested_flags,
        const enums::DataRepresentation data_representation) {
        return Create(std::move(provider), credentials,
                      NegotiationConfig::Default()
                      .WithRequestedFlags(requested_flags)
                      .WithDataRepresentation(data_representation));
    }

    Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure> ServerAuthenticationContext::Create(
        std::shared_ptr<ISecurityProvider> provider,
        const CredentialHandle &credentials,
        const NegotiationConfig &config) {
        if (!provider) {
            return Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure>::Err(
                AuthenticationFailure::InvalidInput(std::string(ErrorMessages::PROVIDER_REQUIRED)));
        }
        if (!credentials.IsValid()) {
            return Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure>::Err(
                AuthenticationFailure::InvalidInput("Credential handle is empty"));
        }
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure>::Err(
                std::move(valid).UnwrapErr());
        }
        if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure>::Err(
                AuthenticationFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        auto context = std::unique_ptr<ServerAuthenticationContext>(
            new ServerAuthenticationContext(
                std::move(provider),
                credentials,
                config.RequestedFlags(),
                config.GetDataRepresentation(),
                config.OutputTokenCapacity()));
        return Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure>::Ok(std::move(context));
    }

    ServerAuthenticationContext::~ServerAuthenticationContext() {
        auto dispose_result = Dispose();
        if (dispose_result.IsErr()) {
            SECNEGO_LOG_MSG("CONTEXT", dispose_result.UnwrapErr().message.c_str());
        }
    }

    Result<Unit, AuthenticationFailure> ServerAuthenticationContext::CheckCanContinue() const {
        switch (state_) {
            case NegotiationState::Disposed:
                return Result<Unit, AuthenticationFailure>::Err(
                    AuthenticationFailure::Disposed(std::string(ErrorMessages::CONTEXT_DISPOSED)));
            case NegotiationState::Completed:
                return Result<Unit, AuthenticationFailure>::Err(
                    AuthenticationFailure::Sequence(std::string(ErrorMessages::CONTEXT_ALREADY_DONE)));
            case NegotiationState::Failed:
                return Result<Unit, AuthenticationFailure>::Err(
                    AuthenticationFailure::Sequence(std::string(ErrorMessages::CONTEXT_FAILED)));
            case NegotiationState::Uninitialized:
            case NegotiationState::Negotiating:
                break;
        }
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }

    Result<Unit, AuthenticationFailure> ServerAuthenticationContext::CheckCompleted() const {
        if (state_ == NegotiationState::Disposed) {
            return Result<Unit, AuthenticationFailure>::Err(
                AuthenticationFailure::Disposed(std::string(ErrorMessages::CONTEXT_DISPOSED)));
        }
        if (!done_) {
            return Result<Unit, AuthenticationFailure>::Err(
                AuthenticationFailure::Sequence(std::string(ErrorMessages::CONTEXT_NOT_DONE)));
        }
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }

    Result<Unit, AuthenticationFailure> ServerAuthenticationContext::Continue(
        const AuthenticationToken &inbound_token) {
        std::lock_guard<std::mutex> guard(lock_);
        if (auto check = CheckCanContinue(); check.IsErr()) {
            return check;
        }

        // Buffers are registered before the descriptors that point at them.
        DisposableList scope;
        auto output_result = buffers::AllocateTokenBuffer(output_token_capacity_);
        if (output_result.IsErr()) {
            return Result<Unit, AuthenticationFailure>::Err(
                AuthenticationFailure::FromSodiumFailure(output_result.UnwrapErr()));
        }
        auto &output_buffer = scope.AddResource(std::move(output_result).Unwrap());

        auto input_result = buffers::ToTokenBuffer(inbound_token.Bytes());
        if (input_result.IsErr()) {
            return Result<Unit, AuthenticationFailure>::Err(
                AuthenticationFailure::FromSodiumFailure(input_result.UnwrapErr()));
        }
        auto &input_buffer = scope.AddResource(std::move(input_result).Unwrap());

        auto &output_desc = scope.AddResource(SecurityBufferDesc{&output_buffer});
        const auto &input_desc = scope.AddResource(SecurityBufferDesc{&input_buffer});

        const AcceptRequest request{
            credentials_,
            context_.Previous(),
            input_desc,
            requested_flags_,
            data_representation_
        };
        debug::LogRoundStart(round_ + 1, request.previous_context != nullptr, inbound_token.Bytes());

        const AcceptResponse response = provider_->AcceptSecurityContext(request, output_desc);
        SECNEGO_LOG_STATUS("ROUND", "AcceptSecurityContext", response.status);

        ++round_;
        returned_flags_ = response.flags;
        expiry_ = response.expiry;

        const StatusDisposition disposition = enums::Classify(response.status);
        if (disposition == StatusDisposition::Error) {
            state_ = NegotiationState::Failed;
            if (response.status == SecStatusCode::BufferTooSmall) {
                return Result<Unit, AuthenticationFailure>::Err(
                    CapacityFailure(output_buffer.RequestedLength(), output_buffer.Capacity(),
                                    enums::ToNative(response.status)));
            }
            return Result<Unit, AuthenticationFailure>::Err(
                ProviderFailure("AcceptSecurityContext", response.status));
        }

        if (auto assign = context_.Assign(response.context); assign.IsErr()) {
            state_ = NegotiationState::Failed;
            return assign;
        }

        if (enums::RequiresCompletion(response.status)) {
            const SecStatusCode complete_status = provider_->CompleteAuthToken(context_.Native(), output_desc);
            SECNEGO_LOG_STATUS("ROUND", "CompleteAuthToken", complete_status);
            if (!enums::IsSuccess(complete_status)) {
                state_ = NegotiationState::Failed;
                if (complete_status == SecStatusCode::BufferTooSmall) {
                    return Result<Unit, AuthenticationFailure>::Err(
                        CapacityFailure(output_buffer.RequestedLength(), output_buffer.Capacity(),
                                        enums::ToNative(complete_status)));
                }
                return Result<Unit, AuthenticationFailure>::Err(
                    ProviderFailure("CompleteAuthToken", complete_status));
            }
        }

        const SecurityBuffer *token_segment = output_desc.At(Constants::TOKEN_SEGMENT_INDEX);
        if (token_segment->Overflowed()) {
            state_ = NegotiationState::Failed;
            return Result<Unit, AuthenticationFailure>::Err(
                CapacityFailure(token_segment->RequestedLength(), token_segment->Capacity()));
        }
        token_ = AuthenticationToken::Parse(token_segment->View());

        done_ = disposition != StatusDisposition::Continue &&
                disposition != StatusDisposition::CompleteAndContinue;
        state_ = done_ ? NegotiationState::Completed : NegotiationState::Negotiating;

        debug::LogRoundResult(round_, returned_flags_, expiry_, token_.Bytes(), done_);
        return Result<Unit, AuthenticationFailure>::Ok(unit);
    }

    Result<AccessToken, AuthenticationFailure> ServerAuthenticationContext::GetAccessToken() {
        std::lock_guard<std::mutex> guard(lock_);
        if (auto check = CheckCompleted(); check.IsErr()) {
            return Result<AccessToken, AuthenticationFailure>::Err(std::move(check).UnwrapErr());
        }
        auto response = provider_->QuerySecurityContextToken(context_.Native());
        SECNEGO_LOG_STATUS("CONTEXT", "QuerySecurityContextToken", response.status);
        if (!enums::IsSuccess(response.status)) {
            return Result<AccessToken, AuthenticationFailure>::Err(
                ProviderFailure("QuerySecurityContextToken", response.status));
        }
        return Result<AccessToken, AuthenticationFailure>::Ok(
            AccessToken(provider_, response.token, std::move(response.principal_name)));
    }

    Result<ImpersonationContext, AuthenticationFailure> ServerAuthenticationContext::Impersonate() {
        std::lock_guard<std::mutex> guard(lock_);
        if (auto check = CheckCompleted(); check.IsErr()) {
            return Result<ImpersonationContext, AuthenticationFailure>::Err(std::move(check).UnwrapErr());
        }
        const SecStatusCode status = provider_->ImpersonateSecurityContext(context_.Native());
        SECNEGO_LOG_STATUS("IMPERSONATE", "ImpersonateSecurityContext", status);
        if (!enums::IsSuccess(status)) {
            return Result<ImpersonationContext, AuthenticationFailure>::Err(
                ProviderFailure("ImpersonateSecurityContext", status));
        }
        std::erase_if(scopes_, [](const std::weak_ptr<ImpersonationState> &scope) {
            return scope.expired();
        });
        auto state = std::make_shared<ImpersonationState>();
        state->provider = provider_;
        state->context = context_.Native();
        scopes_.push_back(state);
        return Result<ImpersonationContext, AuthenticationFailure>::Ok(
            ImpersonationContext(std::move(state)));
    }

    Result<Unit, AuthenticationFailure> ServerAuthenticationContext::Dispose() {
        std::lock_guard<std::mutex> guard(lock_);
        return DisposeLocked();
    }

    Result<Unit, AuthenticationFailure> ServerAuthenticationContext::DisposeLocked() {
        if (state_ == NegotiationState::Disposed) {
            return Result<Unit, AuthenticationFailure>::Ok(unit);
        }
        state_ = NegotiationState::Disposed;
        token_ = AuthenticationToken();

        // Scopes still open are reverted while the context handle is valid.
        std::optional<AuthenticationFailure> revert_failure;
        for (const auto &weak_scope : scopes_) {
            if (const auto scope = weak_scope.lock()) {
                if (auto reverted = scope->Revert(); reverted.IsErr() && !revert_failure.has_value()) {
                    revert_failure = std::move(reverted).UnwrapErr();
                }
            }
        }
        scopes_.clear();

        auto released = context_.Release(*provider_);
        if (revert_failure.has_value()) {
            return Result<Unit, AuthenticationFailure>::Err(std::move(*revert_failure));
        }
        return released;
    }

    AuthenticationToken ServerAuthenticationContext::Token() const {
        std::lock_guard<std::mutex> guard(lock_);
        return token_;
    }

    bool ServerAuthenticationContext::Done() const {
        std::lock_guard<std::mutex> guard(lock_);
        return done_;
    }

    AcceptContextRetFlags ServerAuthenticationContext::Flags() const {
        std::lock_guard<std::mutex> guard(lock_);
        return returned_flags_;
    }

    int64_t ServerAuthenticationContext::Expiry() const {
        std::lock_guard<std::mutex> guard(lock_);
        return expiry_;
    }

    uint32_t ServerAuthenticationContext::Round() const {
        std::lock_guard<std::mutex> guard(lock_);
        return round_;
    }

    NegotiationState ServerAuthenticationContext::State() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_;
    }

    bool ServerAuthenticationContext::IsDisposed() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_ == NegotiationState::Disposed;
    }
}
