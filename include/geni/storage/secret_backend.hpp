#pragma once

#include <optional>
#include <string>

namespace geni::storage
{
    // one opaque secret slot; implementations throw on backend failure
    class SecretBackend
    {
    public:
        virtual ~SecretBackend() = default;

        // nullopt when nothing is stored
        virtual std::optional<std::string> get() = 0;

        virtual void set(const std::string& secret) = 0;

        // removing a missing secret is not an error
        virtual void remove() = 0;

        [[nodiscard]] virtual std::string name() const = 0;
    };
} // namespace geni::storage
