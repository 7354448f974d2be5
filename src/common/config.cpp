#include "geni/common/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace geni
{
    namespace
    {
        std::string env_or(const char* name, const std::string& fallback)
        {
            const char* value = std::getenv(name);
            if (value == nullptr || *value == '\0')
                return fallback;
            return value;
        }
    }

    Config Config::from_environment()
    {
        Config config;
        config.user_pool_id = env_or("GENI_USER_POOL_ID", DEFAULT_USER_POOL_ID);
        config.client_id    = env_or("GENI_CLIENT_ID", DEFAULT_CLIENT_ID);
        config.region       = env_or("GENI_REGION", DEFAULT_REGION);

        const auto dir    = env_or("GENI_CONFIG_DIR", "");
        config.config_dir = dir.empty() ? default_config_dir() : std::filesystem::path(dir);

        const auto level = env_or("GENI_LOG_LEVEL", "");
        if (!level.empty())
            config.log_level = Logger::parse_level(level);

        const auto timeout = env_or("GENI_HTTP_TIMEOUT", "");
        if (!timeout.empty())
        {
            int seconds = 0;
            try
            {
                seconds = std::stoi(timeout);
            }
            catch (const std::exception&)
            {
                throw std::invalid_argument("GENI_HTTP_TIMEOUT must be a number of seconds");
            }
            if (seconds <= 0)
                throw std::invalid_argument("GENI_HTTP_TIMEOUT must be positive");
            config.http_timeout = std::chrono::seconds(seconds);
        }

        config.validate();
        return config;
    }

    std::string Config::pool_name() const
    {
        const auto pos = user_pool_id.find('_');
        if (pos == std::string::npos || pos + 1 >= user_pool_id.size())
            throw std::invalid_argument("User pool id must look like <region>_<name>: " + user_pool_id);
        return user_pool_id.substr(pos + 1);
    }

    std::string Config::provider_host() const
    {
        return "cognito-idp." + region + ".amazonaws.com";
    }

    void Config::validate() const
    {
        (void)pool_name();

        if (client_id.empty())
            throw std::invalid_argument("Client id must not be empty");
        if (region.empty())
            throw std::invalid_argument("Region must not be empty");
    }

    std::filesystem::path Config::default_config_dir()
    {
        const char* home = std::getenv("HOME");
        if (home == nullptr || *home == '\0')
            return std::filesystem::current_path() / ".geniable";
        return std::filesystem::path(home) / ".geniable";
    }
} // namespace geni
