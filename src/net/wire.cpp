#include "geni/net/wire.hpp"

#include <nlohmann/json.hpp>

namespace geni::net
{
    using json = nlohmann::json;

    namespace
    {
        json parameters_to_json(const ParameterMap& parameters)
        {
            json object = json::object();
            for (const auto& [key, value] : parameters)
                object[key] = value;
            return object;
        }

        std::optional<std::string> optional_string(const json& object, const char* key)
        {
            const auto it = object.find(key);
            if (it == object.end() || it->is_null())
                return std::nullopt;
            if (!it->is_string())
                throw MalformedResponseError(std::string("Field '") + key + "' is not a string");
            return it->get<std::string>();
        }

        std::string required_string(const json& object, const char* key)
        {
            auto value = optional_string(object, key);
            if (!value)
                throw MalformedResponseError(std::string("Missing field '") + key + "'");
            return *value;
        }

        AuthenticationResult decode_result(const json& object)
        {
            if (!object.is_object())
                throw MalformedResponseError("AuthenticationResult is not an object");

            AuthenticationResult result;
            result.access_token  = required_string(object, "AccessToken");
            result.id_token      = required_string(object, "IdToken");
            result.refresh_token = optional_string(object, "RefreshToken");
            result.token_type    = optional_string(object, "TokenType").value_or("Bearer");

            const auto expires = object.find("ExpiresIn");
            if (expires == object.end() || !expires->is_number_integer())
                throw MalformedResponseError("Missing field 'ExpiresIn'");
            result.expires_in = expires->get<int64_t>();

            return result;
        }
    }

    std::string Wire::encode_initiate_auth(
        const std::string& client_id,
        const std::string& auth_flow,
        const ParameterMap& auth_parameters)
    {
        json request;
        request["AuthFlow"]       = auth_flow;
        request["ClientId"]       = client_id;
        request["AuthParameters"] = parameters_to_json(auth_parameters);
        return request.dump();
    }

    std::string Wire::encode_respond_to_auth_challenge(
        const std::string& client_id,
        const std::string& challenge_name,
        const ParameterMap& challenge_responses,
        const std::optional<std::string>& session)
    {
        json request;
        request["ChallengeName"]      = challenge_name;
        request["ClientId"]           = client_id;
        request["ChallengeResponses"] = parameters_to_json(challenge_responses);
        if (session)
            request["Session"] = *session;
        return request.dump();
    }

    AuthResponse Wire::decode_auth_response(const std::string& body)
    {
        const json document = json::parse(body, nullptr, false);
        if (document.is_discarded() || !document.is_object())
            throw MalformedResponseError("Provider response is not a JSON object");

        AuthResponse response;
        response.challenge_name = optional_string(document, "ChallengeName");
        response.session        = optional_string(document, "Session");

        if (const auto it = document.find("ChallengeParameters"); it != document.end() && !it->is_null())
        {
            if (!it->is_object())
                throw MalformedResponseError("ChallengeParameters is not an object");
            for (const auto& item : it->items())
            {
                // only string parameters are meaningful to the client
                if (item.value().is_string())
                    response.challenge_parameters[item.key()] = item.value().get<std::string>();
            }
        }

        if (const auto it = document.find("AuthenticationResult"); it != document.end() && !it->is_null())
            response.authentication_result = decode_result(*it);

        return response;
    }

    ProviderError Wire::decode_error(const unsigned status, const std::string& body)
    {
        const std::string fallback = "HTTP " + std::to_string(status);

        const json document = json::parse(body, nullptr, false);
        if (document.is_discarded() || !document.is_object())
            return ProviderError(fallback, fallback);

        std::string code = fallback;
        if (const auto it = document.find("__type"); it != document.end() && it->is_string())
            code = error_code_from_type(it->get<std::string>());

        std::string message = code;
        for (const char* key : {"message", "Message"})
        {
            if (const auto it = document.find(key); it != document.end() && it->is_string())
            {
                message = it->get<std::string>();
                break;
            }
        }

        return ProviderError(code, message);
    }

    std::string Wire::error_code_from_type(const std::string& type)
    {
        const auto pos = type.rfind('#');
        if (pos == std::string::npos)
            return type;
        return type.substr(pos + 1);
    }
} // namespace geni::net
