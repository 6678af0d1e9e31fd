#include "secnego/tokens/authentication_token.hpp"
#include "secnego/crypto/sodium_interop.hpp"

namespace secnego::auth::tokens {
    bool AuthenticationToken::operator==(const AuthenticationToken& other) const noexcept {
        auto compare_result = crypto::SodiumInterop::ConstantTimeEquals(data_, other.data_);
        return compare_result.IsOk() && compare_result.Unwrap();
    }
}
