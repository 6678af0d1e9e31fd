#pragma once
#include "secnego/core/result.hpp"
#include "secnego/core/failures.hpp"
#include "secnego/configuration/negotiation_config.hpp"
#include "secnego/enums/context_flags.hpp"
#include "secnego/enums/data_representation.hpp"
#include "secnego/handles/credential_handle.hpp"
#include "secnego/handles/security_context_handle.hpp"
#include "secnego/interfaces/i_security_provider.hpp"
#include "secnego/server/impersonation_context.hpp"
#include "secnego/tokens/access_token.hpp"
#include "secnego/tokens/authentication_token.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace secnego::auth::server {
    using configuration::NegotiationConfig;
    using enums::AcceptContextReqFlags;
    using enums::AcceptContextRetFlags;
    using handles::CredentialHandle;
    using handles::SecurityContextHandle;
    using interfaces::ISecurityProvider;
    using tokens::AccessToken;
    using tokens::AuthenticationToken;

    enum class NegotiationState : uint8_t {
        Uninitialized,
        Negotiating,
        Completed,
        Failed,
        Disposed
    };

    /**
     * @brief Server-side acceptor for a multi-round token handshake
     *
     * Each Continue() call feeds one inbound peer token to the provider and
     * stores the outbound token to send back. The handshake is complete when
     * Done() reports true; from then on the identity can be queried or
     * impersonated. A provider error ends the handshake for this instance.
     *
     * The credential handle is borrowed and must outlive the context. The
     * security context handle is owned and deleted once by Dispose().
     */
    class ServerAuthenticationContext {
    public:
        /// No requested attributes, native data representation.
        [[nodiscard]] static Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure> Create(
            std::shared_ptr<ISecurityProvider> provider,
            const CredentialHandle &credentials);

        [[nodiscard]] static Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure> Create(
            std::shared_ptr<ISecurityProvider> provider,
            const CredentialHandle &credentials,
            AcceptContextReqFlags requested_flags,
            enums::DataRepresentation data_representation);

        [[nodiscard]] static Result<std::unique_ptr<ServerAuthenticationContext>, AuthenticationFailure> Create(
            std::shared_ptr<ISecurityProvider> provider,
            const CredentialHandle &credentials,
            const NegotiationConfig &config);

        /**
         * @brief Run one accept round with the peer's latest token
         *
         * On success Token() holds the reply for the peer (possibly empty) and
         * Done() tells whether another round is expected. Returned flags and
         * expiry are recorded even when the provider reports an error.
         *
         * @return Err(Sequence) after completion or failure,
         *         Err(Disposed) after Dispose(),
         *         Err(Provider) with the native status on a provider error,
         *         Err(Capacity) if the reply does not fit the output buffer
         */
        [[nodiscard]] Result<Unit, AuthenticationFailure> Continue(const AuthenticationToken &inbound_token);

        /// Identity of the authenticated peer. Requires Done().
        [[nodiscard]] Result<AccessToken, AuthenticationFailure> GetAccessToken();

        /// Assume the peer's identity on the calling thread. Requires Done().
        [[nodiscard]] Result<ImpersonationContext, AuthenticationFailure> Impersonate();

        /**
         * @brief Delete the security context if one was created
         *
         * Impersonation scopes still active are reverted before the delete.
         * Reports the first revert or delete failure on the first call; later
         * calls succeed without effect.
         */
        Result<Unit, AuthenticationFailure> Dispose();

        [[nodiscard]] AuthenticationToken Token() const;

        [[nodiscard]] bool Done() const;

        [[nodiscard]] AcceptContextRetFlags Flags() const;

        [[nodiscard]] int64_t Expiry() const;

        [[nodiscard]] AcceptContextReqFlags RequestedFlags() const noexcept { return requested_flags_; }

        [[nodiscard]] enums::DataRepresentation DataRepresentation() const noexcept { return data_representation_; }

        [[nodiscard]] size_t OutputTokenCapacity() const noexcept { return output_token_capacity_; }

        [[nodiscard]] uint32_t Round() const;

        [[nodiscard]] NegotiationState State() const;

        [[nodiscard]] bool IsDisposed() const;

        ServerAuthenticationContext(const ServerAuthenticationContext &) = delete;
        ServerAuthenticationContext &operator=(const ServerAuthenticationContext &) = delete;
        ServerAuthenticationContext(ServerAuthenticationContext &&) = delete;
        ServerAuthenticationContext &operator=(ServerAuthenticationContext &&) = delete;

        ~ServerAuthenticationContext();

    private:
        ServerAuthenticationContext(
            std::shared_ptr<ISecurityProvider> provider,
            const CredentialHandle &credentials,
            AcceptContextReqFlags requested_flags,
            enums::DataRepresentation data_representation,
            size_t output_token_capacity);

        [[nodiscard]] Result<Unit, AuthenticationFailure> CheckCanContinue() const;

        [[nodiscard]] Result<Unit, AuthenticationFailure> CheckCompleted() const;

        Result<Unit, AuthenticationFailure> DisposeLocked();

        std::shared_ptr<ISecurityProvider> provider_;
        CredentialHandle credentials_;
        AcceptContextReqFlags requested_flags_;
        enums::DataRepresentation data_representation_;
        size_t output_token_capacity_;
        SecurityContextHandle context_;
        NegotiationState state_ = NegotiationState::Uninitialized;
        AcceptContextRetFlags returned_flags_ = AcceptContextRetFlags::None;
        int64_t expiry_ = 0;
        AuthenticationToken token_;
        uint32_t round_ = 0;
        bool done_ = false;
        std::vector<std::weak_ptr<ImpersonationState>> scopes_;
        mutable std::mutex lock_;
    };
}
