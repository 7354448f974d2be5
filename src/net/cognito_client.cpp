#include "geni/net/cognito_client.hpp"

#include <stdexcept>
#include <utility>

#include "geni/common/log.hpp"
#include "geni/net/wire.hpp"

namespace geni::net
{
    CognitoClient::CognitoClient(std::string host, std::string client_id, std::shared_ptr<HttpTransport> transport)
        : host_(std::move(host))
          , client_id_(std::move(client_id))
          , transport_(std::move(transport))
    {
        if (!transport_)
            throw std::invalid_argument("CognitoClient requires a transport");
    }

    AuthResponse CognitoClient::initiate_auth(const std::string& auth_flow, const ParameterMap& auth_parameters)
    {
        return call(Wire::INITIATE_AUTH, Wire::encode_initiate_auth(client_id_, auth_flow, auth_parameters));
    }

    AuthResponse CognitoClient::respond_to_auth_challenge(
        const std::string& challenge_name,
        const ParameterMap& challenge_responses,
        const std::optional<std::string>& session)
    {
        return call(Wire::RESPOND_TO_AUTH_CHALLENGE,
                    Wire::encode_respond_to_auth_challenge(client_id_, challenge_name, challenge_responses, session));
    }

    AuthResponse CognitoClient::call(const std::string& operation, const std::string& body)
    {
        const HeaderMap headers{
            {"Content-Type", Wire::CONTENT_TYPE},
            {"X-Amz-Target", std::string(Wire::TARGET_PREFIX) + operation}
        };

        GENI_LOG_DEBUG("Calling " << operation);
        const auto response = transport_->post(host_, "/", headers, body);

        if (response.status < 200 || response.status >= 300)
        {
            auto error = Wire::decode_error(response.status, response.body);
            GENI_LOG_DEBUG(operation << " rejected: " << error.code());
            throw error;
        }

        return Wire::decode_auth_response(response.body);
    }
} // namespace geni::net
