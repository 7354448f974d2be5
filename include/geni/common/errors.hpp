#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace geni
{
    // malformed hex/base64/numeric input
    class ValidationError : public std::invalid_argument
    {
    public:
        explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
    };

    enum class AuthFailure
    {
        InvalidCredentials,
        UserNotFound,
        UserNotConfirmed,
        UnexpectedChallenge,
        MalformedResponse,
        ProtocolViolation,
        PasswordPolicy,
        Network,
        ProviderError
    };

    std::string auth_failure_to_string(AuthFailure reason);

    /**
     * Terminal failure of one login, password change or refresh attempt.
     * what() is the short user-facing message, detail() keeps whatever the
     * provider or transport reported.
     */
    class AuthenticationError : public std::runtime_error
    {
    public:
        AuthenticationError(AuthFailure reason, const std::string& message, std::string detail = {})
            : std::runtime_error(message), reason_(reason), detail_(std::move(detail))
        {
        }

        [[nodiscard]] AuthFailure reason() const noexcept { return reason_; }
        [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    private:
        AuthFailure reason_;
        std::string detail_;
    };

    // u == 0 during the SRP exchange
    class SrpProtocolError : public AuthenticationError
    {
    public:
        explicit SrpProtocolError(const std::string& message)
            : AuthenticationError(AuthFailure::ProtocolViolation, message)
        {
        }
    };

    class PasswordPolicyError : public AuthenticationError
    {
    public:
        explicit PasswordPolicyError(const std::string& message, std::string detail = {})
            : AuthenticationError(AuthFailure::PasswordPolicy, message, std::move(detail))
        {
        }
    };

    // every storage backend failed
    class StorageError : public std::runtime_error
    {
    public:
        explicit StorageError(const std::string& what) : std::runtime_error(what) {}
    };
} // namespace geni
