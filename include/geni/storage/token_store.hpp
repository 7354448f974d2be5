#pragma once

#include <memory>
#include <optional>
#include <string>

#include "geni/auth/auth_types.hpp"
#include "geni/storage/secret_backend.hpp"

namespace geni::storage
{
    /**
     * Persists the credential bundle
     * The secure backend is tried first; the file fallback takes over when it
     * is missing or fails. A successful write removes the bundle from the other
     * backend. StorageError only when no backend could do the job.
     */
    class TokenStore
    {
    public:
        // secure may be null (keyring disabled); fallback is required
        TokenStore(std::shared_ptr<SecretBackend> secure, std::shared_ptr<SecretBackend> fallback);

        void store(const auth::AuthTokens& tokens);

        // nullopt when nothing usable is stored
        std::optional<auth::AuthTokens> load();

        void clear();

        static std::string serialize(const auth::AuthTokens& tokens);

        // throws std::invalid_argument on malformed content
        static auth::AuthTokens deserialize(const std::string& data);

    private:
        std::optional<auth::AuthTokens> load_from(SecretBackend& backend);

        // best effort, failures are logged
        static void discard_stale(SecretBackend& backend);

        std::shared_ptr<SecretBackend> secure_;
        std::shared_ptr<SecretBackend> fallback_;
    };
} // namespace geni::storage
