#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "geni/common/log.hpp"

namespace geni
{
    // hosted identity provider the CLI talks to by default
    inline constexpr const char* DEFAULT_USER_POOL_ID = "ap-southeast-2_5OWr5yHu8";
    inline constexpr const char* DEFAULT_CLIENT_ID    = "3936nngb9i12t5ei6rjn9fblgc";
    inline constexpr const char* DEFAULT_REGION       = "ap-southeast-2";

    inline constexpr const char* KEYRING_SERVICE = "geniable";
    inline constexpr const char* KEYRING_ACCOUNT = "tokens";
    inline constexpr const char* TOKEN_FILE_NAME = "tokens.json";

    struct Config
    {
        std::string user_pool_id{DEFAULT_USER_POOL_ID};
        std::string client_id{DEFAULT_CLIENT_ID};
        std::string region{DEFAULT_REGION};
        std::filesystem::path config_dir;
        bool use_keyring{true};
        LogLevel log_level{LogLevel::WARNING};
        std::chrono::seconds http_timeout{30};

        // GENI_USER_POOL_ID, GENI_CLIENT_ID, GENI_REGION, GENI_CONFIG_DIR,
        // GENI_LOG_LEVEL, GENI_HTTP_TIMEOUT override the defaults
        static Config from_environment();

        // segment of the pool id after its first '_'
        [[nodiscard]] std::string pool_name() const;

        [[nodiscard]] std::string provider_host() const;

        [[nodiscard]] std::filesystem::path token_file() const { return config_dir / TOKEN_FILE_NAME; }

        // throws std::invalid_argument on an unusable configuration
        void validate() const;

        static std::filesystem::path default_config_dir();
    };
} // namespace geni
