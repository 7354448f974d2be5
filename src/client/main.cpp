#include "geni/auth/auth_session.hpp"
#include "geni/client/client.hpp"
#include "geni/common/config.hpp"
#include "geni/common/log.hpp"
#include "geni/net/cognito_client.hpp"
#include "geni/net/https_client.hpp"
#include "geni/storage/file_backend.hpp"
#include "geni/storage/keyring_backend.hpp"
#include "geni/storage/token_store.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    geni::client::Options options;
    try {
        options = geni::client::parse_options(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << geni::client::usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        auto config = geni::Config::from_environment();
        config.use_keyring = options.use_keyring;
        if (options.verbose)
            config.log_level = geni::LogLevel::DEBUG;

        geni::Logger::instance().set_level(config.log_level);
        GENI_LOG_DEBUG("Using user pool " << config.user_pool_id << " in " << config.region);

        std::shared_ptr<geni::storage::SecretBackend> secure;
        if (config.use_keyring)
            secure = std::make_shared<geni::storage::KeyringBackend>(geni::KEYRING_SERVICE, geni::KEYRING_ACCOUNT);
        auto fallback = std::make_shared<geni::storage::FileBackend>(config.token_file());
        auto store    = std::make_shared<geni::storage::TokenStore>(secure, fallback);

        auto transport = std::make_shared<geni::net::HttpsClient>(config.http_timeout);
        auto provider  = std::make_shared<geni::net::CognitoClient>(config.provider_host(), config.client_id, transport);

        geni::auth::AuthSession session(config.pool_name(), provider, store);
        geni::client::Client client(session, std::cin, std::cout, std::cerr);

        return client.run(options);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
