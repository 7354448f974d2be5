#pragma once

#include <memory>
#include <string>

#include "geni/net/https_client.hpp"
#include "geni/net/identity_provider.hpp"

namespace geni::net
{
    /**
     * IdentityProvider speaking the Cognito user pool JSON protocol
     * POST / on cognito-idp.<region>.amazonaws.com with an X-Amz-Target header
     */
    class CognitoClient : public IdentityProvider
    {
    public:
        CognitoClient(std::string host, std::string client_id, std::shared_ptr<HttpTransport> transport);

        AuthResponse initiate_auth(const std::string& auth_flow, const ParameterMap& auth_parameters) override;

        AuthResponse respond_to_auth_challenge(
            const std::string& challenge_name,
            const ParameterMap& challenge_responses,
            const std::optional<std::string>& session) override;

    private:
        AuthResponse call(const std::string& operation, const std::string& body);

        std::string host_;
        std::string client_id_;
        std::shared_ptr<HttpTransport> transport_;
    };
} // namespace geni::net
