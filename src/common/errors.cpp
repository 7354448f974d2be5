#include "geni/common/errors.hpp"

namespace geni
{
    std::string auth_failure_to_string(const AuthFailure reason)
    {
        switch (reason)
        {
            case AuthFailure::InvalidCredentials: return "INVALID_CREDENTIALS";
            case AuthFailure::UserNotFound: return "USER_NOT_FOUND";
            case AuthFailure::UserNotConfirmed: return "USER_NOT_CONFIRMED";
            case AuthFailure::UnexpectedChallenge: return "UNEXPECTED_CHALLENGE";
            case AuthFailure::MalformedResponse: return "MALFORMED_RESPONSE";
            case AuthFailure::ProtocolViolation: return "PROTOCOL_VIOLATION";
            case AuthFailure::PasswordPolicy: return "PASSWORD_POLICY";
            case AuthFailure::Network: return "NETWORK";
            case AuthFailure::ProviderError: return "PROVIDER_ERROR";
            default: return "UNKNOWN";
        }
    }
} // namespace geni
