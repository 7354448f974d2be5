#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <openssl/bn.h>

namespace geni::auth
{
    /**
     * SRP utility functions for cryptographic operations
     * Byte layout follows the identity provider's SRP-6a variant: every
     * big integer is hashed as the bytes of its padded hex form
     */
    class SRPUtils
    {
    public:
        // BigNum wrapper for RAII
        class BigNum
        {
        private:
            BIGNUM* bn_;

        public:
            BigNum();
            explicit BigNum(const std::vector<uint8_t>& bytes);
            // throws ValidationError unless hex is a non-empty hex string
            explicit BigNum(const std::string& hex);
            ~BigNum();

            // no copy
            BigNum(const BigNum&)            = delete;
            BigNum& operator=(const BigNum&) = delete;

            // move
            BigNum(BigNum&& other) noexcept;
            BigNum& operator=(BigNum&& other) noexcept;

            BIGNUM* get() { return bn_; }
            const BIGNUM* get() const { return bn_; }

            [[nodiscard]] bool is_zero() const;

            std::vector<uint8_t> to_bytes() const;
            // lowercase, "0" for zero
            std::string to_hex() const;
        };

        // Hash functions
        static std::vector<uint8_t> hash_sha256(const std::vector<uint8_t>& data);
        static std::vector<uint8_t> hash_sha256(const std::string& data);

        // Hash multiple values
        static std::vector<uint8_t> hash_multiple(
            const std::vector<std::vector<uint8_t>>& values);

        static std::vector<uint8_t> hmac_sha256(
            const std::vector<uint8_t>& key,
            const std::vector<uint8_t>& data);

        // Random number generation
        static std::vector<uint8_t> random_bytes(size_t length);

        // left-pad odd length with "0", prefix "00" when the first byte >= 0x80
        static std::string pad_hex(const std::string& hex);
        static std::string pad_hex(const BigNum& value);

        // result = value mod modulus, non-negative
        static BigNum mod(const BigNum& value, const BigNum& modulus);

        // result = base^exponent mod modulus
        static BigNum modpow(const BigNum& base, const BigNum& exponent, const BigNum& modulus);

        // SRP-specific calculations
        // k = H(pad(N) | pad(g))
        static BigNum calculate_k(const BigNum& N, const BigNum& g);

        // u = H(pad(A) | pad(B))
        static BigNum calculate_u(const BigNum& A, const BigNum& B);

        // throws SrpProtocolError when u == 0
        static void validate_u(const BigNum& u);

        // x = H(pad(salt) | H(pool_name | username | ":" | password))
        static BigNum calculate_x(
            const std::string& salt_hex,
            const std::string& pool_name,
            const std::string& username,
            const std::string& password);

        // Client: S = (B - kg^x)^(a + ux) mod N
        static BigNum calculate_S_client(
            const BigNum& N,
            const BigNum& B,
            const BigNum& k,
            const BigNum& g,
            const BigNum& x,
            const BigNum& a,
            const BigNum& u);

        // HKDF: prk = HMAC(pad(u), pad(S)), key = HMAC(prk, info | 0x01)[:16]
        static std::vector<uint8_t> derive_key(const BigNum& S, const BigNum& u);

        // Convert bytes to/from hex
        static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
        static std::vector<uint8_t> hex_to_bytes(const std::string& hex);

        // Convert bytes to/from base64
        static std::string bytes_to_base64(const std::vector<uint8_t>& bytes);
        static std::vector<uint8_t> base64_to_bytes(const std::string& base64);

        // URL-safe alphabet, padding optional
        static std::vector<uint8_t> base64url_to_bytes(const std::string& base64url);

        static std::vector<uint8_t> to_bytes(const std::string& text);

    private:
        class BnContext
        {
        private:
            BN_CTX* ctx_;

        public:
            BnContext();
            ~BnContext();

            // No copy
            BnContext(const BnContext&)            = delete;
            BnContext& operator=(const BnContext&) = delete;

            BN_CTX* get() { return ctx_; }
        };

        static bool is_hex_digit(char c);
    };
} // namespace geni::auth
