#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <openssl/bn.h>

#include "geni/auth/srp_types.hpp"
#include "geni/auth/srp_utils.hpp"

namespace geni::test
{
    using auth::SRPUtils;

    /**
     * Server half of the exchange for one user, used to check that the
     * claims a client produces would be accepted
     */
    class FakeSrpServer
    {
    public:
        FakeSrpServer(std::string pool_name,
                      std::string user_id,
                      const std::string& password,
                      std::string salt_hex,
                      const std::string& b_hex)
            : pool_name_(std::move(pool_name))
              , user_id_(std::move(user_id))
              , salt_hex_(std::move(salt_hex))
              , N_(std::string(auth::SRP_N_HEX_3072))
              , g_(std::string(auth::SRP_G_HEX))
              , k_(SRPUtils::calculate_k(N_, g_))
              , b_(b_hex)
        {
            // verifier v = g^x
            const auto x = SRPUtils::calculate_x(salt_hex_, pool_name_, user_id_, password);
            v_ = SRPUtils::modpow(g_, x, N_);

            // B = k*v + g^b mod N
            Context ctx;
            SRPUtils::BigNum kv, gb;
            check(BN_mod_mul(kv.get(), k_.get(), v_.get(), N_.get(), ctx.get()));
            check(BN_mod_exp(gb.get(), g_.get(), b_.get(), N_.get(), ctx.get()));
            check(BN_mod_add(B_.get(), kv.get(), gb.get(), N_.get(), ctx.get()));
        }

        [[nodiscard]] std::string public_value_hex() const { return B_.to_hex(); }
        [[nodiscard]] const std::string& salt_hex() const { return salt_hex_; }
        [[nodiscard]] const std::string& user_id() const { return user_id_; }

        // S = (A * v^u)^b mod N, then the same key derivation and MAC as the client
        [[nodiscard]] std::string expected_signature(const std::string& A_hex,
                                                     const std::string& secret_block,
                                                     const std::string& timestamp) const
        {
            const SRPUtils::BigNum A(A_hex);
            const auto u = SRPUtils::calculate_u(A, B_);

            Context ctx;
            SRPUtils::BigNum vu, base, S;
            check(BN_mod_exp(vu.get(), v_.get(), u.get(), N_.get(), ctx.get()));
            check(BN_mod_mul(base.get(), A.get(), vu.get(), N_.get(), ctx.get()));
            check(BN_mod_exp(S.get(), base.get(), b_.get(), N_.get(), ctx.get()));

            const auto key = SRPUtils::derive_key(S, u);

            auto message      = SRPUtils::to_bytes(pool_name_ + user_id_);
            auto block        = SRPUtils::base64_to_bytes(secret_block);
            auto time_bytes   = SRPUtils::to_bytes(timestamp);
            message.insert(message.end(), block.begin(), block.end());
            message.insert(message.end(), time_bytes.begin(), time_bytes.end());

            return SRPUtils::bytes_to_base64(SRPUtils::hmac_sha256(key, message));
        }

    private:
        struct Context
        {
            struct Deleter
            {
                void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
            };

            std::unique_ptr<BN_CTX, Deleter> ctx{BN_CTX_new()};

            BN_CTX* get() const { return ctx.get(); }
        };

        static void check(const int ok)
        {
            if (!ok)
                throw std::runtime_error("BIGNUM operation failed");
        }

        std::string pool_name_;
        std::string user_id_;
        std::string salt_hex_;
        SRPUtils::BigNum N_;
        SRPUtils::BigNum g_;
        SRPUtils::BigNum k_;
        SRPUtils::BigNum b_;
        SRPUtils::BigNum v_;
        SRPUtils::BigNum B_;
    };
} // namespace geni::test
