#include "geni/client/client.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <variant>

#include <termios.h>
#include <unistd.h>

#include "geni/common/errors.hpp"
#include "geni/common/log.hpp"

namespace geni::client
{
    namespace
    {
        // disables terminal echo for its lifetime
        class EchoGuard
        {
        public:
            EchoGuard()
            {
                if (tcgetattr(STDIN_FILENO, &saved_) != 0)
                    return;

                termios silent = saved_;
                silent.c_lflag &= ~ECHO;
                active_ = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
            }

            ~EchoGuard()
            {
                if (active_)
                    tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
            }

            EchoGuard(const EchoGuard&)            = delete;
            EchoGuard& operator=(const EchoGuard&) = delete;

        private:
            termios saved_{};
            bool active_{false};
        };

        std::string format_utc(const std::chrono::system_clock::time_point time)
        {
            const std::time_t time_t = std::chrono::system_clock::to_time_t(time);
            std::tm utc{};
            if (!gmtime_r(&time_t, &utc))
                return "unknown";

            std::ostringstream oss;
            oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << " UTC";
            return oss.str();
        }
    }

    Options parse_options(const int argc, const char* const argv[])
    {
        Options options;
        bool have_command = false;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];

            if (arg == "--verbose" || arg == "-v")
                options.verbose = true;
            else if (arg == "--no-keyring")
                options.use_keyring = false;
            else if (arg == "--email" || arg == "-e")
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument(arg + " requires a value");
                options.email = argv[++i];
            }
            else if (arg == "--help" || arg == "-h")
            {
                options.command = Command::HELP;
                have_command    = true;
            }
            else if (!arg.empty() && arg[0] == '-')
                throw std::invalid_argument("Unknown option: " + arg);
            else if (have_command)
                throw std::invalid_argument("Unexpected argument: " + arg);
            else
            {
                if (arg == "login")
                    options.command = Command::LOGIN;
                else if (arg == "logout")
                    options.command = Command::LOGOUT;
                else if (arg == "whoami")
                    options.command = Command::WHOAMI;
                else if (arg == "token")
                    options.command = Command::TOKEN;
                else
                    throw std::invalid_argument("Unknown command: " + arg);
                have_command = true;
            }
        }

        if (options.email && options.command != Command::LOGIN)
            throw std::invalid_argument("--email is only valid with login");

        return options;
    }

    std::string usage(const std::string& program)
    {
        std::ostringstream oss;
        oss << "Usage: " << program << " [--verbose] [--no-keyring] <command>\n"
            << "\n"
            << "Commands:\n"
            << "  login [--email <email>]  Authenticate and store tokens\n"
            << "  logout                   Remove stored tokens\n"
            << "  whoami                   Show the logged in user and session expiry\n"
            << "  token                    Print the identity token for other tools\n";
        return oss.str();
    }

    Client::Client(auth::AuthSession& session, std::istream& in, std::ostream& out, std::ostream& err)
        : session_(session)
          , in_(in)
          , out_(out)
          , err_(err)
    {
    }

    int Client::run(const Options& options)
    {
        switch (options.command)
        {
        case Command::LOGIN:
            return login(options.email);
        case Command::LOGOUT:
            return logout();
        case Command::WHOAMI:
            return whoami();
        case Command::TOKEN:
            return token();
        case Command::HELP:
        default:
            out_ << usage("geni");
            return EXIT_SUCCESS;
        }
    }

    int Client::login(const std::optional<std::string>& email)
    {
        std::string identifier;
        if (email && !email->empty())
            identifier = *email;
        else
        {
            auto entered = prompt("Email: ");
            if (!entered || entered->empty())
            {
                err_ << "Error: Email is required" << std::endl;
                return EXIT_FAILURE;
            }
            identifier = *entered;
        }

        const auto password = prompt_hidden("Password: ");
        if (!password || password->empty())
        {
            err_ << "Error: Password is required" << std::endl;
            return EXIT_FAILURE;
        }

        try
        {
            out_ << "Authenticating..." << std::endl;
            const auto result = session_.login(identifier, *password);

            if (const auto* challenge = std::get_if<auth::PasswordChangeRequired>(&result))
                return change_password(*challenge, identifier);

            const auto& tokens = std::get<auth::AuthTokens>(result);
            out_ << "Successfully logged in as " << identifier << std::endl;
            out_ << "Session expires: " << format_utc(tokens.expires_at) << std::endl;
            return EXIT_SUCCESS;
        }
        catch (const AuthenticationError& e)
        {
            GENI_LOG_DEBUG("Login failed (" << auth_failure_to_string(e.reason()) << "): " << e.detail());
            err_ << "Error: Authentication failed: " << e.what() << std::endl;
        }
        catch (const std::exception& e)
        {
            err_ << "Error: Login failed: " << e.what() << std::endl;
        }
        return EXIT_FAILURE;
    }

    int Client::change_password(const auth::PasswordChangeRequired& challenge, const std::string& email)
    {
        out_ << "Password change required for new account." << std::endl;
        out_ << "Requirements: min " << MIN_PASSWORD_LENGTH << " chars, uppercase, lowercase, numbers" << std::endl;

        std::string new_password;
        while (true)
        {
            const auto entered = prompt_hidden("New password: ");
            if (!entered)
            {
                err_ << "Error: Password change aborted" << std::endl;
                return EXIT_FAILURE;
            }
            if (entered->empty())
            {
                err_ << "Error: Password is required" << std::endl;
                continue;
            }
            if (entered->size() < MIN_PASSWORD_LENGTH)
            {
                err_ << "Error: Password must be at least " << MIN_PASSWORD_LENGTH << " characters" << std::endl;
                continue;
            }

            const auto confirmed = prompt_hidden("Confirm new password: ");
            if (!confirmed)
            {
                err_ << "Error: Password change aborted" << std::endl;
                return EXIT_FAILURE;
            }
            if (*confirmed != *entered)
            {
                err_ << "Error: Passwords do not match" << std::endl;
                continue;
            }

            new_password = *entered;
            break;
        }

        try
        {
            out_ << "Setting new password..." << std::endl;
            session_.complete_password_change(challenge.session, challenge.user_id, new_password, email);
            out_ << "Password changed successfully!" << std::endl;
            out_ << "Logged in as " << email << std::endl;
            return EXIT_SUCCESS;
        }
        catch (const std::exception& e)
        {
            err_ << "Error: Password change failed: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    int Client::logout()
    {
        try
        {
            const bool was_authenticated = session_.is_authenticated();

            // stale or expired entries are removed as well
            session_.logout();

            if (was_authenticated)
                out_ << "Successfully logged out" << std::endl;
            else
                out_ << "Not currently logged in" << std::endl;
            return EXIT_SUCCESS;
        }
        catch (const std::exception& e)
        {
            err_ << "Error: Logout failed: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    int Client::whoami()
    {
        const auto tokens = session_.get_current_tokens();
        if (!tokens)
        {
            out_ << "Not logged in" << std::endl;
            out_ << "Run 'geni login' to authenticate" << std::endl;
            return EXIT_FAILURE;
        }

        const auto claims = auth::decode_id_token(tokens->id_token);
        const auto& email   = !claims.email.empty() ? claims.email : tokens->email;
        const auto& user_id = !claims.subject.empty() ? claims.subject : tokens->user_id;

        out_ << "Email: " << (email.empty() ? "Unknown" : email) << std::endl;
        out_ << "User ID: " << (user_id.empty() ? "Unknown" : user_id) << std::endl;
        print_expiry(*tokens);
        return EXIT_SUCCESS;
    }

    int Client::token()
    {
        const auto tokens = session_.get_current_tokens();
        if (!tokens)
        {
            err_ << "Error: Not logged in" << std::endl;
            return EXIT_FAILURE;
        }

        out_ << tokens->id_token << std::endl;
        return EXIT_SUCCESS;
    }

    void Client::print_expiry(const auth::AuthTokens& tokens)
    {
        const auto now = std::chrono::system_clock::now();
        if (tokens.expires_at <= now)
        {
            out_ << "Session expired" << std::endl;
            return;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::minutes>(tokens.expires_at - now);
        const auto hours     = std::chrono::duration_cast<std::chrono::hours>(remaining);
        const auto minutes   = remaining - hours;

        out_ << "Session expires in: " << hours.count() << "h " << minutes.count() << "m" << std::endl;
        out_ << "(" << format_utc(tokens.expires_at) << ")" << std::endl;
    }

    std::optional<std::string> Client::prompt(const std::string& message)
    {
        out_ << message << std::flush;

        std::string line;
        if (!std::getline(in_, line))
            return std::nullopt;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }

    std::optional<std::string> Client::prompt_hidden(const std::string& message)
    {
        if (&in_ != &std::cin || !isatty(STDIN_FILENO))
            return prompt(message);

        std::optional<std::string> line;
        {
            EchoGuard guard;
            line = prompt(message);
        }
        out_ << "\n";
        return line;
    }
} // namespace geni::client
