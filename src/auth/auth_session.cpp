#include "geni/auth/auth_session.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include "geni/auth/srp_client.hpp"
#include "geni/common/errors.hpp"
#include "geni/common/log.hpp"

namespace geni::auth
{
    namespace
    {
        // longest token lifetime accepted from the provider
        constexpr std::chrono::seconds MAX_EXPIRES_IN{std::chrono::hours(24 * 365 * 10)};

        [[noreturn]] void throw_provider_failure(const std::string& context, const net::ProviderError& e)
        {
            const auto& code = e.code();

            if (code == "NotAuthorizedException")
            {
                if (context == "Authentication")
                    throw AuthenticationError(AuthFailure::InvalidCredentials, "Invalid username or password", e.what());
                throw AuthenticationError(AuthFailure::InvalidCredentials, context + " failed: " + e.what(), e.what());
            }
            if (code == "UserNotFoundException")
                throw AuthenticationError(AuthFailure::UserNotFound, "User not found", e.what());
            if (code == "UserNotConfirmedException")
                throw AuthenticationError(AuthFailure::UserNotConfirmed, "User account not confirmed", e.what());
            if (code == "InvalidPasswordException")
                throw PasswordPolicyError(PASSWORD_POLICY_MESSAGE, e.what());

            throw AuthenticationError(AuthFailure::ProviderError, context + " failed: " + code, e.what());
        }

        std::string required_parameter(const net::ParameterMap& parameters, const char* key)
        {
            const auto it = parameters.find(key);
            if (it == parameters.end() || it->second.empty())
                throw AuthenticationError(AuthFailure::MalformedResponse,
                                          "Authentication failed: challenge is missing " + std::string(key));
            return it->second;
        }
    }

    AuthSession::AuthSession(std::string pool_name,
                             std::shared_ptr<net::IdentityProvider> provider,
                             std::shared_ptr<storage::TokenStore> store)
        : pool_name_(std::move(pool_name))
          , provider_(std::move(provider))
          , store_(std::move(store))
    {
        if (pool_name_.empty())
            throw std::invalid_argument("AuthSession requires a pool name");
        if (!provider_ || !store_)
            throw std::invalid_argument("AuthSession requires a provider and a token store");
    }

    LoginResult AuthSession::login(const std::string& identifier, const std::string& password)
    {
        try
        {
            return run_login(identifier, password);
        }
        catch (const std::exception&)
        {
            state_ = AuthState::UNAUTHENTICATED;
            throw;
        }
    }

    LoginResult AuthSession::run_login(const std::string& identifier, const std::string& password)
    {
        // step 1: fresh ephemeral pair, InitiateAuth with A
        SRPClient srp(pool_name_);
        state_ = AuthState::SRP_INITIATED;

        const auto initiated = initiate("Authentication", net::AuthFlow::USER_SRP_AUTH, {
                                            {"USERNAME", identifier},
                                            {"SRP_A", srp.public_value_hex()}
                                        });

        if (initiated.challenge_name != net::Challenge::PASSWORD_VERIFIER)
        {
            const auto name = initiated.challenge_name.value_or("none");
            throw AuthenticationError(AuthFailure::UnexpectedChallenge, "Unexpected challenge: " + name);
        }

        const auto& parameters = initiated.challenge_parameters;
        const PasswordVerifierChallenge challenge{
            .user_id_for_srp = required_parameter(parameters, "USER_ID_FOR_SRP"),
            .salt_hex = required_parameter(parameters, "SALT"),
            .srp_b_hex = required_parameter(parameters, "SRP_B"),
            .secret_block = required_parameter(parameters, "SECRET_BLOCK")
        };

        // step 2: password claim signed with the derived key
        state_ = AuthState::AWAITING_PASSWORD_VERIFIER_RESULT;

        PasswordClaim claim;
        try
        {
            claim = srp.compute_claim(challenge, password,
                                      SRPClient::format_timestamp(std::chrono::system_clock::now()));
        }
        catch (const ValidationError& e)
        {
            throw AuthenticationError(AuthFailure::MalformedResponse,
                                      "Authentication failed: malformed challenge", e.what());
        }

        const auto verified = respond("Authentication", net::Challenge::PASSWORD_VERIFIER, {
                                          {"USERNAME", claim.user_id_for_srp},
                                          {"PASSWORD_CLAIM_SECRET_BLOCK", claim.secret_block},
                                          {"PASSWORD_CLAIM_SIGNATURE", claim.signature},
                                          {"TIMESTAMP", claim.timestamp}
                                      }, initiated.session);

        // step 3: new accounts must pick a password before tokens are issued
        if (verified.challenge_name == net::Challenge::NEW_PASSWORD_REQUIRED)
        {
            if (!verified.session)
                throw AuthenticationError(AuthFailure::MalformedResponse,
                                          "Authentication failed: password change challenge has no session");

            const auto it = verified.challenge_parameters.find("USER_ID_FOR_SRP");
            state_ = AuthState::NEW_PASSWORD_REQUIRED;
            GENI_LOG_INFO("Password change required for " << identifier);

            return PasswordChangeRequired{
                .session = *verified.session,
                .user_id = it != verified.challenge_parameters.end() ? it->second : identifier
            };
        }

        if (!verified.authentication_result)
        {
            const auto name = verified.challenge_name.value_or("none");
            throw AuthenticationError(AuthFailure::UnexpectedChallenge, "Authentication failed: unexpected challenge " + name);
        }

        const auto& result = *verified.authentication_result;
        if (!result.refresh_token)
            throw AuthenticationError(AuthFailure::MalformedResponse, "Authentication failed: no refresh token issued");

        auto tokens = make_tokens(result, *result.refresh_token,
                                  decode_id_token(result.id_token).subject, identifier);

        store_->store(tokens);
        state_ = AuthState::AUTHENTICATED;
        GENI_LOG_INFO("Logged in as " << identifier);

        return tokens;
    }

    AuthTokens AuthSession::complete_password_change(
        const std::string& session,
        const std::string& user_id,
        const std::string& new_password,
        const std::string& email)
    {
        try
        {
            const auto response = respond("Password change", net::Challenge::NEW_PASSWORD_REQUIRED, {
                                              {"USERNAME", user_id},
                                              {"NEW_PASSWORD", new_password}
                                          }, session);

            if (!response.authentication_result)
                throw AuthenticationError(AuthFailure::UnexpectedChallenge, "Password change failed");

            const auto& result = *response.authentication_result;
            if (!result.refresh_token)
                throw AuthenticationError(AuthFailure::MalformedResponse, "Password change failed: no refresh token issued");

            auto tokens = make_tokens(result, *result.refresh_token,
                                      decode_id_token(result.id_token).subject, email);

            store_->store(tokens);
            state_ = AuthState::AUTHENTICATED;
            GENI_LOG_INFO("Password changed for " << email);

            return tokens;
        }
        catch (const std::exception&)
        {
            state_ = AuthState::UNAUTHENTICATED;
            throw;
        }
    }

    AuthTokens AuthSession::refresh(const std::string& refresh_token)
    {
        try
        {
            const auto response = initiate("Token refresh", net::AuthFlow::REFRESH_TOKEN_AUTH, {
                                               {"REFRESH_TOKEN", refresh_token}
                                           });

            if (!response.authentication_result)
                throw AuthenticationError(AuthFailure::MalformedResponse, "Token refresh failed");

            const auto& result = *response.authentication_result;

            // identity fields are not part of the refresh reply
            const auto stored = store_->load();
            std::string user_id = stored ? stored->user_id : std::string{};
            std::string email   = stored ? stored->email : std::string{};
            if (user_id.empty())
                user_id = decode_id_token(result.id_token).subject;

            auto tokens = make_tokens(result, refresh_token, std::move(user_id), std::move(email));

            store_->store(tokens);
            state_ = AuthState::AUTHENTICATED;
            GENI_LOG_DEBUG("Tokens refreshed");

            return tokens;
        }
        catch (const std::exception&)
        {
            state_ = AuthState::UNAUTHENTICATED;
            throw;
        }
    }

    void AuthSession::logout()
    {
        store_->clear();
        state_ = AuthState::LOGGED_OUT;
        GENI_LOG_INFO("Logged out");
    }

    std::optional<AuthTokens> AuthSession::get_current_tokens()
    {
        auto tokens = store_->load();
        if (!tokens)
            return std::nullopt;

        if (tokens->is_expired())
        {
            GENI_LOG_DEBUG("Stored tokens expired, refreshing");
            try
            {
                tokens = refresh(tokens->refresh_token);
            }
            catch (const std::exception& e)
            {
                GENI_LOG_WARN("Token refresh failed: " << e.what());
                return std::nullopt;
            }
        }

        state_ = AuthState::AUTHENTICATED;
        return tokens;
    }

    bool AuthSession::is_authenticated()
    {
        return get_current_tokens().has_value();
    }

    std::optional<std::string> AuthSession::authorization_header()
    {
        const auto tokens = get_current_tokens();
        if (!tokens)
            return std::nullopt;
        return "Bearer " + tokens->id_token;
    }

    net::AuthResponse AuthSession::initiate(const std::string& context, const std::string& auth_flow,
                                            const net::ParameterMap& parameters)
    {
        try
        {
            return provider_->initiate_auth(auth_flow, parameters);
        }
        catch (const net::ProviderError& e)
        {
            throw_provider_failure(context, e);
        }
        catch (const net::NetworkError& e)
        {
            throw AuthenticationError(AuthFailure::Network, context + " failed: network error", e.what());
        }
        catch (const net::MalformedResponseError& e)
        {
            throw AuthenticationError(AuthFailure::MalformedResponse, context + " failed: malformed provider response",
                                      e.what());
        }
    }

    net::AuthResponse AuthSession::respond(const std::string& context, const std::string& challenge_name,
                                           const net::ParameterMap& responses,
                                           const std::optional<std::string>& session)
    {
        try
        {
            return provider_->respond_to_auth_challenge(challenge_name, responses, session);
        }
        catch (const net::ProviderError& e)
        {
            throw_provider_failure(context, e);
        }
        catch (const net::NetworkError& e)
        {
            throw AuthenticationError(AuthFailure::Network, context + " failed: network error", e.what());
        }
        catch (const net::MalformedResponseError& e)
        {
            throw AuthenticationError(AuthFailure::MalformedResponse, context + " failed: malformed provider response",
                                      e.what());
        }
    }

    AuthTokens AuthSession::make_tokens(const net::AuthenticationResult& result,
                                        std::string refresh_token,
                                        std::string user_id,
                                        std::string email)
    {
        if (result.expires_in > MAX_EXPIRES_IN.count())
            throw AuthenticationError(AuthFailure::MalformedResponse,
                                      "Provider returned an out of range token lifetime",
                                      std::to_string(result.expires_in));

        // whole seconds, the precision tokens are stored with
        const auto now      = std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
        const auto lifetime = std::chrono::seconds(std::max<int64_t>(result.expires_in, 0));

        return AuthTokens{
            .access_token = result.access_token,
            .id_token = result.id_token,
            .refresh_token = std::move(refresh_token),
            .expires_at = now + lifetime,
            .user_id = std::move(user_id),
            .email = std::move(email)
        };
    }
} // namespace geni::auth
