#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace geni::net
{
    using ParameterMap = std::map<std::string, std::string>;

    // auth flows and challenge names used on the wire
    namespace AuthFlow
    {
        inline constexpr const char* USER_SRP_AUTH      = "USER_SRP_AUTH";
        inline constexpr const char* REFRESH_TOKEN_AUTH = "REFRESH_TOKEN_AUTH";
    }

    namespace Challenge
    {
        inline constexpr const char* PASSWORD_VERIFIER     = "PASSWORD_VERIFIER";
        inline constexpr const char* NEW_PASSWORD_REQUIRED = "NEW_PASSWORD_REQUIRED";
    }

    struct AuthenticationResult
    {
        std::string access_token;
        std::string id_token;
        std::optional<std::string> refresh_token;
        int64_t expires_in{0};
        std::string token_type;
    };

    // either a challenge or a result, as returned by both provider calls
    struct AuthResponse
    {
        std::optional<std::string> challenge_name;
        ParameterMap challenge_parameters;
        std::optional<std::string> session;
        std::optional<AuthenticationResult> authentication_result;
    };

    // the provider answered with an error document
    class ProviderError : public std::runtime_error
    {
    public:
        ProviderError(std::string code, const std::string& message)
            : std::runtime_error(message), code_(std::move(code))
        {
        }

        // error name without its namespace prefix, e.g. NotAuthorizedException
        [[nodiscard]] const std::string& code() const noexcept { return code_; }

    private:
        std::string code_;
    };

    // connect, TLS or timeout
    class NetworkError : public std::runtime_error
    {
    public:
        explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
    };

    // a 2xx reply whose body is not the expected JSON shape
    class MalformedResponseError : public std::runtime_error
    {
    public:
        explicit MalformedResponseError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * Remote identity provider seam
     * Both calls block until the provider answers and throw ProviderError,
     * NetworkError or MalformedResponseError on failure
     */
    class IdentityProvider
    {
    public:
        virtual ~IdentityProvider() = default;

        virtual AuthResponse initiate_auth(const std::string& auth_flow, const ParameterMap& auth_parameters) = 0;

        virtual AuthResponse respond_to_auth_challenge(
            const std::string& challenge_name,
            const ParameterMap& challenge_responses,
            const std::optional<std::string>& session) = 0;
    };
} // namespace geni::net
