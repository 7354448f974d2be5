#pragma once

#include <string>
#include <chrono>

#include "geni/auth/srp_types.hpp"
#include "geni/auth/srp_utils.hpp"

namespace geni::auth
{
    /**
     * SRP-6a Client Implementation
     * One instance per login attempt: holds the ephemeral pair (a, A) and
     * answers exactly one PASSWORD_VERIFIER challenge
     */
    class SRPClient
    {
    private:
        std::string pool_name_;

        // SRP parameters
        SRPUtils::BigNum N_; // safe prime
        SRPUtils::BigNum g_; // generator
        SRPUtils::BigNum k_; // multiplier k = H(N, g)

        // client ephemeral values
        SRPUtils::BigNum a_; // private ephemeral
        SRPUtils::BigNum A_; // public ephemeral A = g^a mod N

        bool consumed_{false};

    public:
        // fresh random a; pool_name is the pool id segment after '_'
        explicit SRPClient(std::string pool_name);

        // fixed private exponent, reduced mod N
        SRPClient(std::string pool_name, const std::string& a_hex);

        SRPClient(const SRPClient&)            = delete;
        SRPClient& operator=(const SRPClient&) = delete;

        // public ephemeral A as sent in SRP_A
        [[nodiscard]] std::string public_value_hex() const { return A_.to_hex(); }

        // process server's challenge (salt, B, secret block) into a signed claim;
        // throws SrpProtocolError when u == 0, std::logic_error on reuse
        PasswordClaim compute_claim(
            const PasswordVerifierChallenge& challenge,
            const std::string& password,
            const std::string& timestamp);

        [[nodiscard]] bool is_consumed() const { return consumed_; }

        // "Tue Mar 3 04:05:06 UTC 2026", always UTC and English
        static std::string format_timestamp(std::chrono::system_clock::time_point time);

    private:
        void init_public_value();
    };
} // namespace geni::auth
