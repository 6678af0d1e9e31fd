/**
 * @file loopback_negotiation.cpp
 * @brief Drives a full accept handshake against an in-process provider
 */

#include "secnego/server/server_authentication_context.hpp"
#include "secnego/configuration/negotiation_config.hpp"
#include "secnego/utilities/token_envelope_codec.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace secnego::auth;
using namespace secnego::auth::interfaces;

namespace {

std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

/// Three-message handshake: NEGOTIATE -> CHALLENGE, AUTHENTICATE -> done.
class LoopbackProvider final : public ISecurityProvider {
public:
    AcceptResponse AcceptSecurityContext(const AcceptRequest& request, SecurityBufferDesc& output) override {
        AcceptResponse response;
        const auto inbound = request.input.At(0)->View();
        const std::string message(inbound.begin(), inbound.end());

        if (request.previous_context == nullptr && message == "NEGOTIATE") {
            response.context = SecHandle{0x1001, 0x2002};
            response.status = Write(output, Bytes("CHALLENGE"), SecStatusCode::ContinueNeeded);
            response.flags = enums::AcceptContextRetFlags::Connection;
        } else if (request.previous_context != nullptr && message == "AUTHENTICATE") {
            response.context = *request.previous_context;
            response.status = SecStatusCode::Ok;
            response.flags = enums::AcceptContextRetFlags::Connection |
                             enums::AcceptContextRetFlags::Integrity;
            response.expiry = 0x7FFFFFFFFFFFFFFF;
        } else {
            response.status = SecStatusCode::InvalidToken;
        }
        return response;
    }

    SecStatusCode CompleteAuthToken(const SecHandle&, SecurityBufferDesc&) override {
        return SecStatusCode::Ok;
    }

    QueryTokenResponse QuerySecurityContextToken(const SecHandle&) override {
        return {SecStatusCode::Ok, 0x42, "LOOPBACK\\example-user"};
    }

    SecStatusCode ImpersonateSecurityContext(const SecHandle&) override {
        std::cout << "   -> impersonating peer" << std::endl;
        return SecStatusCode::Ok;
    }

    SecStatusCode RevertSecurityContext(const SecHandle&) override {
        std::cout << "   <- reverted to service identity" << std::endl;
        return SecStatusCode::Ok;
    }

    SecStatusCode DeleteSecurityContext(const SecHandle&) override {
        std::cout << "   context deleted" << std::endl;
        return SecStatusCode::Ok;
    }

    SecStatusCode CloseAccessToken(NativeTokenHandle) override {
        std::cout << "   access token closed" << std::endl;
        return SecStatusCode::Ok;
    }

private:
    static SecStatusCode Write(SecurityBufferDesc& output, const std::vector<uint8_t>& token,
                               const SecStatusCode on_success) {
        auto* buffer = output.At(0);
        if (buffer == nullptr || buffer->Assign(token).IsErr()) {
            return SecStatusCode::BufferTooSmall;
        }
        return on_success;
    }
};

} // namespace

int main() {
    std::cout << "=== SecNego - Loopback Negotiation Example ===" << std::endl;
    std::cout << std::endl;

    auto provider = std::make_shared<LoopbackProvider>();
    const handles::CredentialHandle credentials(SecHandle{0xC0, 0xDE}, "Loopback");

    std::cout << "1. Creating acceptor context..." << std::endl;
    auto context_result = server::ServerAuthenticationContext::Create(
        provider, credentials, configuration::NegotiationConfig::Connection());
    if (context_result.IsErr()) {
        std::cerr << "Failed to create context: "
                  << context_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto context = std::move(context_result).Unwrap();
    std::cout << "   requested flags: 0x" << std::hex
              << enums::ToNative(context->RequestedFlags()) << std::dec << std::endl;
    std::cout << std::endl;

    std::cout << "2. Running handshake..." << std::endl;
    const std::vector<std::string> peer_messages = {"NEGOTIATE", "AUTHENTICATE"};
    for (const auto& message : peer_messages) {
        auto continue_result = context->Continue(tokens::AuthenticationToken(Bytes(message)));
        if (continue_result.IsErr()) {
            std::cerr << "Round failed: " << continue_result.UnwrapErr().message << std::endl;
            return 1;
        }

        auto frame = utilities::TokenEnvelopeCodec::ReplyFrame(*context);
        auto encoded = utilities::TokenEnvelopeCodec::Encode(frame);
        if (encoded.IsErr()) {
            std::cerr << "Failed to encode reply: " << encoded.UnwrapErr().message << std::endl;
            return 1;
        }
        std::cout << "   round " << context->Round() << ": received '" << message
                  << "', reply " << context->Token().Size() << " bytes ("
                  << encoded.Unwrap().size() << " bytes framed), done="
                  << (context->Done() ? "yes" : "no") << std::endl;
        if (context->Done()) {
            break;
        }
    }
    std::cout << std::endl;

    std::cout << "3. Querying peer identity..." << std::endl;
    {
        auto token_result = context->GetAccessToken();
        if (token_result.IsErr()) {
            std::cerr << "Failed to query identity: " << token_result.UnwrapErr().message << std::endl;
            return 1;
        }
        const auto& access_token = token_result.Unwrap();
        std::cout << "   principal: " << access_token.PrincipalName() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "4. Impersonating peer..." << std::endl;
    {
        auto scope_result = context->Impersonate();
        if (scope_result.IsErr()) {
            std::cerr << "Failed to impersonate: " << scope_result.UnwrapErr().message << std::endl;
            return 1;
        }
        auto scope = std::move(scope_result).Unwrap();
        std::cout << "   doing work as the peer" << std::endl;
    }
    std::cout << std::endl;

    std::cout << "5. Disposing context..." << std::endl;
    if (auto dispose_result = context->Dispose(); dispose_result.IsErr()) {
        std::cerr << "Failed to dispose: " << dispose_result.UnwrapErr().message << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
