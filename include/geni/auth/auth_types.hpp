#pragma once

#include <chrono>
#include <string>
#include <variant>

namespace geni::auth
{
    // tokens are treated as expired this long before their real expiry
    inline constexpr std::chrono::minutes TOKEN_EXPIRY_BUFFER{5};

    /**
     * Credential bundle produced by a successful login, password change or
     * refresh. Expiry is an absolute UTC instant.
     */
    struct AuthTokens
    {
        std::string access_token;
        std::string id_token;
        std::string refresh_token;
        std::chrono::system_clock::time_point expires_at;
        std::string user_id;
        std::string email;

        // true once now is within TOKEN_EXPIRY_BUFFER of expires_at (inclusive)
        [[nodiscard]] bool is_expired(
            std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

        bool operator==(const AuthTokens&) const = default;
    };

    // NEW_PASSWORD_REQUIRED after a successful verifier step
    struct PasswordChangeRequired
    {
        std::string session;
        std::string user_id;

        bool operator==(const PasswordChangeRequired&) const = default;
    };

    using LoginResult = std::variant<AuthTokens, PasswordChangeRequired>;

    enum class AuthState
    {
        UNAUTHENTICATED,
        SRP_INITIATED,
        AWAITING_PASSWORD_VERIFIER_RESULT,
        NEW_PASSWORD_REQUIRED,
        AUTHENTICATED,
        LOGGED_OUT
    };

    std::string auth_state_to_string(AuthState state);

    // claims read from the identity token payload, unverified
    struct IdTokenClaims
    {
        std::string subject;
        std::string email;
    };

    // empty claims when the token cannot be decoded
    IdTokenClaims decode_id_token(const std::string& id_token);
} // namespace geni::auth
