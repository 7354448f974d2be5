#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

#include "geni/auth/auth_session.hpp"

namespace geni::client
{
    // minimum length the CLI accepts for a new password
    inline constexpr std::size_t MIN_PASSWORD_LENGTH = 12;

    enum class Command
    {
        LOGIN,
        LOGOUT,
        WHOAMI,
        TOKEN,
        HELP
    };

    struct Options
    {
        Command command{Command::HELP};
        bool verbose{false};
        bool use_keyring{true};
        std::optional<std::string> email;
    };

    // throws std::invalid_argument on unknown commands or flags
    Options parse_options(int argc, const char* const argv[]);

    std::string usage(const std::string& program);

    /**
     * Interactive front end over an AuthSession
     * Each command returns the process exit status
     */
    class Client
    {
    public:
        // hidden prompts disable terminal echo only when in is std::cin on a tty
        Client(auth::AuthSession& session, std::istream& in, std::ostream& out, std::ostream& err);

        int run(const Options& options);

        int login(const std::optional<std::string>& email);
        int logout();
        int whoami();
        int token();

    private:
        auth::AuthSession& session_;
        std::istream& in_;
        std::ostream& out_;
        std::ostream& err_;

        int change_password(const auth::PasswordChangeRequired& challenge, const std::string& email);

        std::optional<std::string> prompt(const std::string& message);
        std::optional<std::string> prompt_hidden(const std::string& message);

        void print_expiry(const auth::AuthTokens& tokens);
    };
} // namespace geni::client
