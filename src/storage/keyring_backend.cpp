#include "geni/storage/keyring_backend.hpp"

#include <libsecret/secret.h>

#include <memory>
#include <stdexcept>
#include <utility>

namespace geni::storage
{
    namespace
    {
        const SecretSchema* token_schema()
        {
            // match items written by other clients that carry no xdg:schema
            static const SecretSchema schema = {
                "org.freedesktop.Secret.Generic",
                SECRET_SCHEMA_DONT_MATCH_NAME,
                {
                    {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
                    {"username", SECRET_SCHEMA_ATTRIBUTE_STRING},
                    {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING},
                }
            };
            return &schema;
        }

        struct ErrorDeleter
        {
            void operator()(GError* error) const { g_error_free(error); }
        };

        using ErrorPtr = std::unique_ptr<GError, ErrorDeleter>;

        [[noreturn]] void throw_error(const char* action, GError* raw)
        {
            ErrorPtr error(raw);
            throw std::runtime_error(std::string("Keyring ") + action + " failed: " +
                (error ? error->message : "unknown error"));
        }
    }

    KeyringBackend::KeyringBackend(std::string service, std::string account)
        : service_(std::move(service))
          , account_(std::move(account))
    {
    }

    std::optional<std::string> KeyringBackend::get()
    {
        GError* error = nullptr;
        gchar* password = secret_password_lookup_sync(
            token_schema(), nullptr, &error,
            "service", service_.c_str(),
            "username", account_.c_str(),
            nullptr);

        if (error != nullptr)
            throw_error("lookup", error);
        if (password == nullptr)
            return std::nullopt;

        std::string secret(password);
        secret_password_free(password);
        return secret;
    }

    void KeyringBackend::set(const std::string& secret)
    {
        const std::string label = "Password for '" + account_ + "' on '" + service_ + "'";

        GError* error = nullptr;
        const gboolean stored = secret_password_store_sync(
            token_schema(), SECRET_COLLECTION_DEFAULT, label.c_str(), secret.c_str(), nullptr, &error,
            "service", service_.c_str(),
            "username", account_.c_str(),
            nullptr);

        if (error != nullptr || !stored)
            throw_error("store", error);
    }

    void KeyringBackend::remove()
    {
        GError* error = nullptr;
        // FALSE without an error only means there was nothing to remove
        secret_password_clear_sync(
            token_schema(), nullptr, &error,
            "service", service_.c_str(),
            "username", account_.c_str(),
            nullptr);

        if (error != nullptr)
            throw_error("clear", error);
    }
} // namespace geni::storage
