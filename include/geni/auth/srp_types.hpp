#pragma once

#include <string>
#include <cstddef>

namespace geni::auth
{
    // SRP-6a parameters shared with the identity provider
    constexpr size_t SRP_HASH_SIZE        = 32;  // SHA-256
    constexpr size_t SRP_DERIVED_KEY_SIZE = 16;  // truncated HKDF output
    constexpr size_t SRP_EPHEMERAL_BYTES  = 128; // random input for a

    // 3072-bit safe prime from RFC 3526 (Group 15)
    constexpr const char* SRP_N_HEX_3072 =
        "FFFFFFFFFFFFFFFFC90FDAA22168C234C4C6628B80DC1CD1"
        "29024E088A67CC74020BBEA63B139B22514A08798E3404DD"
        "EF9519B3CD3A431B302B0A6DF25F14374FE1356D6D51C245"
        "E485B576625E7EC6F44C42E9A637ED6B0BFF5CB6F406B7ED"
        "EE386BFB5A899FA5AE9F24117C4B1FE649286651ECE45B3D"
        "C2007CB8A163BF0598DA48361C55D39A69163FA8FD24CF5F"
        "83655D23DCA3AD961C62F356208552BB9ED529077096966D"
        "670C354E4ABC9804F1746C08CA18217C32905E462E36CE3B"
        "E39E772C180E86039B2783A2EC07A28FB5C55DF06F4C52C9"
        "DE2BCBF6955817183995497CEA956AE515D2261898FA0510"
        "15728E5A8AAAC42DAD33170D04507A33A85521ABDF1CBA64"
        "ECFB850458DBEF0A8AEA71575D060C7DB3970F85A6E1E4C7"
        "ABF5AE8CDB0933D71E8C94E04A25619DCEE3D2261AD2EE6B"
        "F12FFA06D98A0864D87602733EC86A64521F2B18177B200C"
        "BBE117577A615D6C770988C0BAD946E208E24FA074E5AB31"
        "43DB5BFCE0FD108E4B82D120A93AD2CAFFFFFFFFFFFFFFFF";

    constexpr const char* SRP_G_HEX = "2"; // generator g = 2

    // info label for the HKDF expand step
    constexpr const char* SRP_DERIVED_KEY_INFO = "Caldera Derived Key";

    // PASSWORD_VERIFIER challenge parameters, consumed once
    struct PasswordVerifierChallenge
    {
        std::string user_id_for_srp; // server-chosen username, echoed back
        std::string salt_hex;
        std::string srp_b_hex;
        std::string secret_block;    // base64, echoed back unchanged
    };

    // what the client sends back to answer PASSWORD_VERIFIER
    struct PasswordClaim
    {
        std::string user_id_for_srp;
        std::string secret_block;
        std::string signature; // base64 HMAC-SHA256
        std::string timestamp;
    };
} // namespace geni::auth
