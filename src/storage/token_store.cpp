#include "geni/storage/token_store.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "geni/common/errors.hpp"
#include "geni/common/log.hpp"

namespace geni::storage
{
    using json = nlohmann::json;

    namespace
    {
        std::string required_string(const json& document, const char* key)
        {
            const auto it = document.find(key);
            if (it == document.end() || !it->is_string())
                throw std::invalid_argument(std::string("Stored tokens lack '") + key + "'");
            return it->get<std::string>();
        }

        // keeps expires_at and expires_at - TOKEN_EXPIRY_BUFFER representable
        constexpr int64_t MAX_EXPIRY_SECONDS =
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()).count() / 2;

        std::chrono::system_clock::time_point read_expiry(const json& document)
        {
            const auto it = document.find("expires_at");
            if (it == document.end() || it->is_null())
                return std::chrono::system_clock::time_point{};

            if (it->is_number_unsigned())
            {
                if (it->get<uint64_t>() > static_cast<uint64_t>(MAX_EXPIRY_SECONDS))
                    throw std::invalid_argument("Stored 'expires_at' is out of range");
                return std::chrono::system_clock::time_point{std::chrono::seconds(it->get<int64_t>())};
            }

            if (it->is_number_integer())
            {
                const auto seconds = it->get<int64_t>();
                if (seconds < -MAX_EXPIRY_SECONDS || seconds > MAX_EXPIRY_SECONDS)
                    throw std::invalid_argument("Stored 'expires_at' is out of range");
                return std::chrono::system_clock::time_point{std::chrono::seconds(seconds)};
            }

            if (it->is_number_float())
            {
                const auto seconds = it->get<double>();
                if (!std::isfinite(seconds) ||
                    seconds < -static_cast<double>(MAX_EXPIRY_SECONDS) ||
                    seconds > static_cast<double>(MAX_EXPIRY_SECONDS))
                    throw std::invalid_argument("Stored 'expires_at' is out of range");

                const std::chrono::duration<double> since_epoch(seconds);
                return std::chrono::system_clock::time_point{
                    std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch)};
            }

            throw std::invalid_argument("Stored 'expires_at' is not a number");
        }
    }

    TokenStore::TokenStore(std::shared_ptr<SecretBackend> secure, std::shared_ptr<SecretBackend> fallback)
        : secure_(std::move(secure))
          , fallback_(std::move(fallback))
    {
        if (!fallback_)
            throw std::invalid_argument("TokenStore requires a fallback backend");
    }

    void TokenStore::store(const auth::AuthTokens& tokens)
    {
        const auto data = serialize(tokens);

        // the backend written last must be the only one holding a bundle
        if (secure_)
        {
            try
            {
                secure_->set(data);
                GENI_LOG_DEBUG("Tokens stored in " << secure_->name());
                discard_stale(*fallback_);
                return;
            }
            catch (const std::exception& e)
            {
                GENI_LOG_WARN("Could not store tokens in " << secure_->name() << ", using "
                    << fallback_->name() << " instead: " << e.what());
            }
        }

        try
        {
            fallback_->set(data);
            GENI_LOG_DEBUG("Tokens stored in " << fallback_->name());
        }
        catch (const std::exception& e)
        {
            throw StorageError(std::string("Failed to store tokens: ") + e.what());
        }

        if (secure_)
            discard_stale(*secure_);
    }

    void TokenStore::discard_stale(SecretBackend& backend)
    {
        try
        {
            backend.remove();
        }
        catch (const std::exception& e)
        {
            GENI_LOG_WARN("Could not remove stale tokens from " << backend.name() << ": " << e.what());
        }
    }

    std::optional<auth::AuthTokens> TokenStore::load()
    {
        if (secure_)
        {
            if (auto tokens = load_from(*secure_))
                return tokens;
        }

        return load_from(*fallback_);
    }

    std::optional<auth::AuthTokens> TokenStore::load_from(SecretBackend& backend)
    {
        std::optional<std::string> data;
        try
        {
            data = backend.get();
        }
        catch (const std::exception& e)
        {
            GENI_LOG_WARN("Could not read tokens from " << backend.name() << ": " << e.what());
            return std::nullopt;
        }

        if (!data)
            return std::nullopt;

        try
        {
            return deserialize(*data);
        }
        catch (const std::invalid_argument& e)
        {
            GENI_LOG_WARN("Ignoring unreadable tokens in " << backend.name() << ": " << e.what());
            return std::nullopt;
        }
    }

    void TokenStore::clear()
    {
        std::size_t attempted = 0;
        std::size_t failed    = 0;
        std::string last_error;

        for (const auto& backend : {secure_, fallback_})
        {
            if (!backend)
                continue;

            ++attempted;
            try
            {
                backend->remove();
            }
            catch (const std::exception& e)
            {
                ++failed;
                last_error = e.what();
                GENI_LOG_WARN("Could not clear tokens from " << backend->name() << ": " << e.what());
            }
        }

        if (failed == attempted)
            throw StorageError("Failed to clear tokens: " + last_error);
    }

    std::string TokenStore::serialize(const auth::AuthTokens& tokens)
    {
        const auto expires_at = std::chrono::duration_cast<std::chrono::seconds>(
            tokens.expires_at.time_since_epoch()).count();

        json document;
        document["access_token"]  = tokens.access_token;
        document["id_token"]      = tokens.id_token;
        document["refresh_token"] = tokens.refresh_token;
        document["expires_at"]    = expires_at;
        document["user_id"]       = tokens.user_id;
        document["email"]         = tokens.email;
        return document.dump();
    }

    auth::AuthTokens TokenStore::deserialize(const std::string& data)
    {
        const json document = json::parse(data, nullptr, false);
        if (document.is_discarded() || !document.is_object())
            throw std::invalid_argument("Stored tokens are not a JSON object");

        auth::AuthTokens tokens;
        tokens.access_token  = required_string(document, "access_token");
        tokens.id_token      = required_string(document, "id_token");
        tokens.refresh_token = required_string(document, "refresh_token");
        tokens.expires_at    = read_expiry(document);
        tokens.user_id       = required_string(document, "user_id");
        tokens.email         = required_string(document, "email");
        return tokens;
    }
} // namespace geni::storage
