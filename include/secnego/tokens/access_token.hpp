#pragma once
#include "secnego/core/failures.hpp"
#include "secnego/core/result.hpp"
#include "secnego/interfaces/i_security_provider.hpp"
#include <memory>
#include <string>
namespace secnego::auth::tokens {
using interfaces::ISecurityProvider;
using handles::NativeTokenHandle;

/**
 * @brief Identity of the authenticated peer, as issued by the provider
 *
 * Owns the native token handle and closes it exactly once, either through
 * Close() or on destruction.
 */
class AccessToken {
public:
    AccessToken(std::shared_ptr<ISecurityProvider> provider,
                NativeTokenHandle handle,
                std::string principal_name);

    AccessToken(AccessToken&& other) noexcept;
    AccessToken& operator=(AccessToken&& other) noexcept;
    AccessToken(const AccessToken&) = delete;
    AccessToken& operator=(const AccessToken&) = delete;
    ~AccessToken();

    [[nodiscard]] NativeTokenHandle Native() const noexcept { return handle_; }
    [[nodiscard]] const std::string& PrincipalName() const noexcept { return principal_name_; }
    [[nodiscard]] bool IsClosed() const noexcept { return handle_ == handles::kInvalidTokenHandle; }

    /// Close the native handle. Later calls succeed without effect.
    Result<Unit, AuthenticationFailure> Close();

private:
    std::shared_ptr<ISecurityProvider> provider_;
    NativeTokenHandle handle_;
    std::string principal_name_;
};
}
