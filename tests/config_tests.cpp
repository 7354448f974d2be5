#include "geni/common/config.hpp"
#include "geni/common/errors.hpp"
#include "geni/common/log.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <sstream>

namespace geni
{
    class ConfigTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            clear_environment();
        }

        void TearDown() override
        {
            clear_environment();
        }

        static void clear_environment()
        {
            for (const char* name : {"GENI_USER_POOL_ID", "GENI_CLIENT_ID", "GENI_REGION",
                                     "GENI_CONFIG_DIR", "GENI_LOG_LEVEL", "GENI_HTTP_TIMEOUT"})
                unsetenv(name);
        }
    };

    TEST_F(ConfigTest, Defaults)
    {
        const Config config;
        EXPECT_EQ(config.user_pool_id, DEFAULT_USER_POOL_ID);
        EXPECT_EQ(config.client_id, DEFAULT_CLIENT_ID);
        EXPECT_EQ(config.pool_name(), "5OWr5yHu8");
        EXPECT_EQ(config.provider_host(), "cognito-idp.ap-southeast-2.amazonaws.com");
        EXPECT_EQ(config.http_timeout, std::chrono::seconds(30));
        EXPECT_NO_THROW(config.validate());
    }

    TEST_F(ConfigTest, PoolNameIsSegmentAfterFirstUnderscore)
    {
        Config config;
        config.user_pool_id = "us-east-1_abc_def";
        EXPECT_EQ(config.pool_name(), "abc_def");

        config.user_pool_id = "nounderscore";
        EXPECT_THROW((void)config.pool_name(), std::invalid_argument);

        config.user_pool_id = "us-east-1_";
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }

    TEST_F(ConfigTest, ValidateRejectsEmptyFields)
    {
        Config config;
        config.client_id = "";
        EXPECT_THROW(config.validate(), std::invalid_argument);

        config        = Config{};
        config.region = "";
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }

    TEST_F(ConfigTest, TokenFileUnderConfigDir)
    {
        Config config;
        config.config_dir = "/tmp/geni-config";
        EXPECT_EQ(config.token_file(), std::filesystem::path("/tmp/geni-config/tokens.json"));
    }

    TEST_F(ConfigTest, FromEnvironmentDefaults)
    {
        const auto config = Config::from_environment();
        EXPECT_EQ(config.user_pool_id, DEFAULT_USER_POOL_ID);
        EXPECT_EQ(config.config_dir, Config::default_config_dir());
        EXPECT_EQ(config.log_level, LogLevel::WARNING);
    }

    TEST_F(ConfigTest, FromEnvironmentOverrides)
    {
        setenv("GENI_USER_POOL_ID", "eu-west-1_TestPool", 1);
        setenv("GENI_CLIENT_ID", "client-1", 1);
        setenv("GENI_REGION", "eu-west-1", 1);
        setenv("GENI_CONFIG_DIR", "/tmp/geni-env", 1);
        setenv("GENI_LOG_LEVEL", "Debug", 1);
        setenv("GENI_HTTP_TIMEOUT", "5", 1);

        const auto config = Config::from_environment();
        EXPECT_EQ(config.pool_name(), "TestPool");
        EXPECT_EQ(config.client_id, "client-1");
        EXPECT_EQ(config.provider_host(), "cognito-idp.eu-west-1.amazonaws.com");
        EXPECT_EQ(config.token_file(), std::filesystem::path("/tmp/geni-env/tokens.json"));
        EXPECT_EQ(config.log_level, LogLevel::DEBUG);
        EXPECT_EQ(config.http_timeout, std::chrono::seconds(5));
    }

    TEST_F(ConfigTest, FromEnvironmentRejectsBadValues)
    {
        setenv("GENI_HTTP_TIMEOUT", "soon", 1);
        EXPECT_THROW(Config::from_environment(), std::invalid_argument);

        setenv("GENI_HTTP_TIMEOUT", "0", 1);
        EXPECT_THROW(Config::from_environment(), std::invalid_argument);

        unsetenv("GENI_HTTP_TIMEOUT");
        setenv("GENI_LOG_LEVEL", "loud", 1);
        EXPECT_THROW(Config::from_environment(), std::invalid_argument);

        unsetenv("GENI_LOG_LEVEL");
        setenv("GENI_USER_POOL_ID", "malformed", 1);
        EXPECT_THROW(Config::from_environment(), std::invalid_argument);
    }

    class LoggerTest : public ::testing::Test
    {
    protected:
        std::ostringstream sink_;
        LogLevel saved_level_{LogLevel::WARNING};

        void SetUp() override
        {
            saved_level_ = Logger::instance().level();
            Logger::instance().set_sink(&sink_);
        }

        void TearDown() override
        {
            Logger::instance().set_sink(nullptr);
            Logger::instance().set_level(saved_level_);
        }
    };

    TEST_F(LoggerTest, ParseLevel)
    {
        EXPECT_EQ(Logger::parse_level("debug"), LogLevel::DEBUG);
        EXPECT_EQ(Logger::parse_level("INFO"), LogLevel::INFO);
        EXPECT_EQ(Logger::parse_level("warn"), LogLevel::WARNING);
        EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::WARNING);
        EXPECT_EQ(Logger::parse_level("error"), LogLevel::ERROR);
        EXPECT_EQ(Logger::parse_level("off"), LogLevel::OFF);
        EXPECT_THROW(Logger::parse_level("verbose"), std::invalid_argument);
    }

    TEST_F(LoggerTest, WritesLevelPrefix)
    {
        Logger::instance().set_level(LogLevel::INFO);
        GENI_LOG_INFO("stored tokens in " << "keyring");
        EXPECT_EQ(sink_.str(), "[INFO] stored tokens in keyring\n");
    }

    TEST_F(LoggerTest, FiltersBelowLevel)
    {
        Logger::instance().set_level(LogLevel::WARNING);
        GENI_LOG_DEBUG("hidden");
        GENI_LOG_INFO("hidden");
        GENI_LOG_WARN("shown");
        EXPECT_EQ(sink_.str(), "[WARNING] shown\n");
    }

    TEST_F(LoggerTest, OffSilencesEverything)
    {
        Logger::instance().set_level(LogLevel::OFF);
        GENI_LOG_ERROR("hidden");
        EXPECT_TRUE(sink_.str().empty());
    }

    TEST_F(LoggerTest, FailureNames)
    {
        EXPECT_EQ(auth_failure_to_string(AuthFailure::InvalidCredentials), "INVALID_CREDENTIALS");
        EXPECT_EQ(auth_failure_to_string(AuthFailure::Network), "NETWORK");
    }
} // namespace geni
