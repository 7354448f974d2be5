#pragma once

#include <string>

#include "geni/storage/secret_backend.hpp"

namespace geni::storage
{
    /**
     * Desktop keyring through libsecret (Secret Service)
     * Items use the generic schema with service/username attributes, the
     * same addressing Python keyring uses
     */
    class KeyringBackend : public SecretBackend
    {
    public:
        KeyringBackend(std::string service, std::string account);

        std::optional<std::string> get() override;
        void set(const std::string& secret) override;
        void remove() override;

        [[nodiscard]] std::string name() const override { return "keyring"; }

    private:
        std::string service_;
        std::string account_;
    };
} // namespace geni::storage
