#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <gmock/gmock.h>

#include "geni/auth/srp_utils.hpp"
#include "geni/net/identity_provider.hpp"

namespace geni::test
{
    class MockIdentityProvider : public net::IdentityProvider
    {
    public:
        MOCK_METHOD(net::AuthResponse, initiate_auth,
                    (const std::string& auth_flow, const net::ParameterMap& auth_parameters),
                    (override));

        MOCK_METHOD(net::AuthResponse, respond_to_auth_challenge,
                    (const std::string& challenge_name, const net::ParameterMap& challenge_responses,
                        const std::optional<std::string>& session),
                    (override));
    };

    inline std::string base64url(const std::string& text)
    {
        auto encoded = auth::SRPUtils::bytes_to_base64(auth::SRPUtils::to_bytes(text));
        std::replace(encoded.begin(), encoded.end(), '+', '-');
        std::replace(encoded.begin(), encoded.end(), '/', '_');
        encoded.erase(std::remove(encoded.begin(), encoded.end(), '='), encoded.end());
        return encoded;
    }

    // unsigned JWT carrying only sub and email
    inline std::string make_id_token(const std::string& subject, const std::string& email)
    {
        return base64url(R"({"alg":"RS256"})") + "." +
               base64url(R"({"sub":")" + subject + R"(","email":")" + email + R"("})") + "." +
               base64url("signature");
    }

    inline net::AuthResponse result_response(const std::string& id_token,
                                             const std::optional<std::string>& refresh_token = "refresh-1",
                                             const std::string& access_token = "access-1",
                                             const int64_t expires_in = 3600)
    {
        net::AuthResponse response;
        response.authentication_result = net::AuthenticationResult{
            .access_token = access_token,
            .id_token = id_token,
            .refresh_token = refresh_token,
            .expires_in = expires_in,
            .token_type = "Bearer"
        };
        return response;
    }

    inline net::AuthResponse challenge_response(const std::string& name, net::ParameterMap parameters,
                                                std::optional<std::string> session = std::nullopt)
    {
        net::AuthResponse response;
        response.challenge_name       = name;
        response.challenge_parameters = std::move(parameters);
        response.session              = std::move(session);
        return response;
    }
} // namespace geni::test
