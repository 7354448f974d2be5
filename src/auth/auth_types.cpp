#include "geni/auth/auth_types.hpp"

#include <nlohmann/json.hpp>

#include "geni/auth/srp_utils.hpp"
#include "geni/common/log.hpp"

namespace geni::auth
{
    bool AuthTokens::is_expired(const std::chrono::system_clock::time_point now) const
    {
        return now >= expires_at - TOKEN_EXPIRY_BUFFER;
    }

    std::string auth_state_to_string(const AuthState state)
    {
        switch (state)
        {
        case AuthState::UNAUTHENTICATED:
            return "UNAUTHENTICATED";
        case AuthState::SRP_INITIATED:
            return "SRP_INITIATED";
        case AuthState::AWAITING_PASSWORD_VERIFIER_RESULT:
            return "AWAITING_PASSWORD_VERIFIER_RESULT";
        case AuthState::NEW_PASSWORD_REQUIRED:
            return "NEW_PASSWORD_REQUIRED";
        case AuthState::AUTHENTICATED:
            return "AUTHENTICATED";
        case AuthState::LOGGED_OUT:
            return "LOGGED_OUT";
        default:
            return "UNKNOWN";
        }
    }

    IdTokenClaims decode_id_token(const std::string& id_token)
    {
        // header.payload.signature
        const auto first = id_token.find('.');
        if (first == std::string::npos)
            return {};
        const auto second = id_token.find('.', first + 1);
        if (second == std::string::npos)
            return {};

        try
        {
            const auto payload_bytes = SRPUtils::base64url_to_bytes(id_token.substr(first + 1, second - first - 1));
            const auto payload       = nlohmann::json::parse(payload_bytes.begin(), payload_bytes.end());
            if (!payload.is_object())
                return {};

            IdTokenClaims claims;
            if (auto it = payload.find("sub"); it != payload.end() && it->is_string())
                claims.subject = it->get<std::string>();
            if (auto it = payload.find("email"); it != payload.end() && it->is_string())
                claims.email = it->get<std::string>();
            return claims;
        }
        catch (const std::exception& e)
        {
            GENI_LOG_DEBUG("Could not decode identity token payload: " << e.what());
            return {};
        }
    }
} // namespace geni::auth
