#pragma once

#include <optional>
#include <string>

#include "geni/net/identity_provider.hpp"

namespace geni::net
{
    /**
     * JSON codec for the identity provider protocol
     * Requests are x-amz-json-1.1 documents, responses carry either a
     * challenge or an AuthenticationResult
     */
    class Wire
    {
    public:
        static constexpr const char* CONTENT_TYPE  = "application/x-amz-json-1.1";
        static constexpr const char* TARGET_PREFIX = "AWSCognitoIdentityProviderService.";

        static constexpr const char* INITIATE_AUTH             = "InitiateAuth";
        static constexpr const char* RESPOND_TO_AUTH_CHALLENGE = "RespondToAuthChallenge";

        static std::string encode_initiate_auth(
            const std::string& client_id,
            const std::string& auth_flow,
            const ParameterMap& auth_parameters);

        static std::string encode_respond_to_auth_challenge(
            const std::string& client_id,
            const std::string& challenge_name,
            const ParameterMap& challenge_responses,
            const std::optional<std::string>& session);

        // throws MalformedResponseError when the body is not a JSON object of the expected shape
        static AuthResponse decode_auth_response(const std::string& body);

        // builds the error for a non-2xx reply; falls back to the status when the body is unreadable
        static ProviderError decode_error(unsigned status, const std::string& body);

        // "prefix#Name" -> "Name"
        static std::string error_code_from_type(const std::string& type);
    };
} // namespace geni::net
