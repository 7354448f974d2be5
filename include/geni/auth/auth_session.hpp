#pragma once

#include <memory>
#include <optional>
#include <string>

#include "geni/auth/auth_types.hpp"
#include "geni/net/identity_provider.hpp"
#include "geni/storage/token_store.hpp"

namespace geni::auth
{
    inline constexpr const char* PASSWORD_POLICY_MESSAGE =
        "Invalid password. Password must be at least 12 characters "
        "and include uppercase, lowercase, and numbers.";

    /**
     * Drives the SRP login against the identity provider and keeps the
     * resulting credential bundle in the token store
     *
     * Every failure surfaces as AuthenticationError (or one of its
     * subclasses) and returns the session to UNAUTHENTICATED.
     * A required password change is a normal login outcome, not an error.
     */
    class AuthSession
    {
    public:
        // pool_name is the segment of the user pool id after '_'
        AuthSession(std::string pool_name,
                    std::shared_ptr<net::IdentityProvider> provider,
                    std::shared_ptr<storage::TokenStore> store);

        AuthSession(const AuthSession&)            = delete;
        AuthSession& operator=(const AuthSession&) = delete;

        LoginResult login(const std::string& identifier, const std::string& password);

        AuthTokens complete_password_change(
            const std::string& session,
            const std::string& user_id,
            const std::string& new_password,
            const std::string& email);

        AuthTokens refresh(const std::string& refresh_token);

        // local only, the provider is not contacted
        void logout();

        // stored tokens, refreshed when expired; nullopt when absent or the refresh fails
        std::optional<AuthTokens> get_current_tokens();

        bool is_authenticated();

        // "Bearer <id token>" for the current tokens
        std::optional<std::string> authorization_header();

        [[nodiscard]] AuthState state() const { return state_; }

    private:
        net::AuthResponse initiate(const std::string& context, const std::string& auth_flow,
                                   const net::ParameterMap& parameters);

        net::AuthResponse respond(const std::string& context, const std::string& challenge_name,
                                  const net::ParameterMap& responses,
                                  const std::optional<std::string>& session);

        LoginResult run_login(const std::string& identifier, const std::string& password);

        static AuthTokens make_tokens(const net::AuthenticationResult& result,
                                      std::string refresh_token,
                                      std::string user_id,
                                      std::string email);

        std::string pool_name_;
        std::shared_ptr<net::IdentityProvider> provider_;
        std::shared_ptr<storage::TokenStore> store_;
        AuthState state_{AuthState::UNAUTHENTICATED};
    };
} // namespace geni::auth
