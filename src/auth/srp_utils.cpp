#include "geni/auth/srp_utils.hpp"

#include <openssl/sha.h>
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

#include "geni/auth/srp_types.hpp"
#include "geni/common/errors.hpp"

namespace geni::auth
{
    // BigNum implementation
    SRPUtils::BigNum::BigNum() : bn_(BN_new())
    {
        if (!bn_) throw std::runtime_error("Failed to create BIGNUM");
    }

    SRPUtils::BigNum::BigNum(const std::vector<uint8_t>& bytes) : bn_(BN_new())
    {
        if (!bn_) throw std::runtime_error("Failed to create BIGNUM");
        if (!BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), bn_))
        {
            BN_free(bn_);
            throw std::runtime_error("Failed to convert bytes to BIGNUM");
        }
    }

    SRPUtils::BigNum::BigNum(const std::string& hex) : bn_(BN_new())
    {
        if (!bn_) throw std::runtime_error("Failed to create BIGNUM");

        if (hex.empty() || !std::all_of(hex.begin(), hex.end(), is_hex_digit))
        {
            BN_free(bn_);
            throw ValidationError("Invalid hex value for big integer");
        }

        // BN_hex2bn returns the number of digits consumed
        if (BN_hex2bn(&bn_, hex.c_str()) != static_cast<int>(hex.size()))
        {
            BN_free(bn_);
            throw std::runtime_error("Failed to convert hex to BIGNUM");
        }
    }

    SRPUtils::BigNum::~BigNum()
    {
        if (bn_) BN_clear_free(bn_);
    }

    SRPUtils::BigNum::BigNum(BigNum&& other) noexcept : bn_(other.bn_)
    {
        other.bn_ = nullptr;
    }

    SRPUtils::BigNum& SRPUtils::BigNum::operator=(BigNum&& other) noexcept
    {
        if (this != &other)
        {
            if (bn_) BN_clear_free(bn_);
            bn_       = other.bn_;
            other.bn_ = nullptr;
        }
        return *this;
    }

    bool SRPUtils::BigNum::is_zero() const
    {
        return BN_is_zero(bn_) == 1;
    }

    std::vector<uint8_t> SRPUtils::BigNum::to_bytes() const
    {
        int len = BN_num_bytes(bn_);
        std::vector<uint8_t> bytes(len);
        BN_bn2bin(bn_, bytes.data());
        return bytes;
    }

    std::string SRPUtils::BigNum::to_hex() const
    {
        char* hex = BN_bn2hex(bn_);
        if (!hex) throw std::runtime_error("Failed to convert BIGNUM to hex");
        std::string result(hex);
        OPENSSL_free(hex);

        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    SRPUtils::BnContext::BnContext()
        : ctx_(BN_CTX_new())
    {
        if (!ctx_)
            throw std::runtime_error("Failed to create BN_CTX");
    }

    SRPUtils::BnContext::~BnContext()
    {
        if (ctx_)
            BN_CTX_free(ctx_);
    }

    // Hash functions
    std::vector<uint8_t> SRPUtils::hash_sha256(const std::vector<uint8_t>& data)
    {
        std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
        SHA256(data.data(), data.size(), hash.data());
        return hash;
    }

    std::vector<uint8_t> SRPUtils::hash_sha256(const std::string& data)
    {
        return hash_sha256(to_bytes(data));
    }

    std::vector<uint8_t> SRPUtils::hash_multiple(
        const std::vector<std::vector<uint8_t>>& values)
    {
        std::vector<uint8_t> combined;
        for (const auto& v : values)
            combined.insert(combined.end(), v.begin(), v.end());
        return hash_sha256(combined);
    }

    std::vector<uint8_t> SRPUtils::hmac_sha256(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& data)
    {
        static const uint8_t empty_key = 0;

        std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
        unsigned int mac_len = 0;

        if (!HMAC(EVP_sha256(),
                  key.empty() ? &empty_key : key.data(), static_cast<int>(key.size()),
                  data.data(), data.size(),
                  mac.data(), &mac_len))
            throw std::runtime_error("Failed to compute HMAC-SHA256");

        mac.resize(mac_len);
        return mac;
    }

    std::vector<uint8_t> SRPUtils::random_bytes(size_t length)
    {
        std::vector<uint8_t> bytes(length);
        if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1)
            throw std::runtime_error("Failed to generate random bytes");
        return bytes;
    }

    std::string SRPUtils::pad_hex(const std::string& hex)
    {
        if (hex.empty() || !std::all_of(hex.begin(), hex.end(), is_hex_digit))
            throw ValidationError("Invalid hex string: '" + hex + "'");

        if (hex.size() % 2 == 1)
            return "0" + hex;

        // a leading byte with the high bit set would read back as negative
        if (std::stoi(hex.substr(0, 2), nullptr, 16) >= 0x80)
            return "00" + hex;

        return hex;
    }

    std::string SRPUtils::pad_hex(const BigNum& value)
    {
        return pad_hex(value.to_hex());
    }

    SRPUtils::BigNum SRPUtils::mod(const BigNum& value, const BigNum& modulus)
    {
        BnContext ctx;
        BigNum result;
        if (!BN_nnmod(result.get(), value.get(), modulus.get(), ctx.get()))
            throw std::runtime_error("Failed to reduce modulo N");
        return result;
    }

    SRPUtils::BigNum SRPUtils::modpow(const BigNum& base, const BigNum& exponent, const BigNum& modulus)
    {
        BnContext ctx;
        BigNum result;
        if (!BN_mod_exp(result.get(), base.get(), exponent.get(), modulus.get(), ctx.get()))
            throw std::runtime_error("Failed to calculate modular exponentiation");
        return result;
    }

    // SRP calculations
    SRPUtils::BigNum SRPUtils::calculate_k(const BigNum& N, const BigNum& g)
    {
        // k = H(pad(N) | pad(g))
        auto N_bytes = hex_to_bytes(pad_hex(N));
        auto g_bytes = hex_to_bytes(pad_hex(g));
        auto hash    = hash_multiple({N_bytes, g_bytes});
        return BigNum(hash);
    }

    SRPUtils::BigNum SRPUtils::calculate_u(const BigNum& A, const BigNum& B)
    {
        // u = H(pad(A) | pad(B))
        auto A_bytes = hex_to_bytes(pad_hex(A));
        auto B_bytes = hex_to_bytes(pad_hex(B));
        auto hash    = hash_multiple({A_bytes, B_bytes});
        return BigNum(hash);
    }

    void SRPUtils::validate_u(const BigNum& u)
    {
        if (u.is_zero())
            throw SrpProtocolError("Invalid SRP exchange: scrambling parameter u is zero");
    }

    SRPUtils::BigNum SRPUtils::calculate_x(
        const std::string& salt_hex,
        const std::string& pool_name,
        const std::string& username,
        const std::string& password)
    {
        // x = H(pad(salt) | H(pool_name | username | ":" | password))
        auto inner_hash = hash_sha256(pool_name + username + ":" + password);
        auto combined   = hex_to_bytes(pad_hex(salt_hex));
        combined.insert(combined.end(), inner_hash.begin(), inner_hash.end());
        auto x_hash = hash_sha256(combined);
        return BigNum(x_hash);
    }

    SRPUtils::BigNum SRPUtils::calculate_S_client(
        const BigNum& N,
        const BigNum& B,
        const BigNum& k,
        const BigNum& g,
        const BigNum& x,
        const BigNum& a,
        const BigNum& u)
    {
        // S = (B - kg^x)^(a + ux) mod N
        BnContext ctx;
        BigNum gx, kgx, base, ux, exp, S;

        // gx = g^x mod N
        if (!BN_mod_exp(gx.get(), g.get(), x.get(), N.get(), ctx.get()))
            throw std::runtime_error("Failed to calculate g^x");

        // kgx = k * gx mod N
        if (!BN_mod_mul(kgx.get(), k.get(), gx.get(), N.get(), ctx.get()))
            throw std::runtime_error("Failed to calculate k*g^x");

        // base = B - kgx mod N, always non-negative
        if (!BN_mod_sub(base.get(), B.get(), kgx.get(), N.get(), ctx.get()))
            throw std::runtime_error("Failed to calculate B - kg^x");

        // ux = u * x
        if (!BN_mul(ux.get(), u.get(), x.get(), ctx.get()))
            throw std::runtime_error("Failed to calculate ux");

        // exp = a + ux
        if (!BN_add(exp.get(), a.get(), ux.get()))
            throw std::runtime_error("Failed to calculate a + ux");

        // S = base^exp mod N
        if (!BN_mod_exp(S.get(), base.get(), exp.get(), N.get(), ctx.get()))
            throw std::runtime_error("Failed to calculate S");

        return S;
    }

    std::vector<uint8_t> SRPUtils::derive_key(const BigNum& S, const BigNum& u)
    {
        auto prk = hmac_sha256(hex_to_bytes(pad_hex(u)), hex_to_bytes(pad_hex(S)));

        auto info = to_bytes(SRP_DERIVED_KEY_INFO);
        info.push_back(0x01);

        auto key = hmac_sha256(prk, info);
        key.resize(SRP_DERIVED_KEY_SIZE);
        return key;
    }

    // Encoding functions
    std::string SRPUtils::bytes_to_hex(const std::vector<uint8_t>& bytes)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (uint8_t b : bytes)
            oss << std::setw(2) << static_cast<int>(b);
        return oss.str();
    }

    std::vector<uint8_t> SRPUtils::hex_to_bytes(const std::string& hex)
    {
        if (hex.size() % 2 != 0)
            throw ValidationError("Hex string must have even length");
        if (!std::all_of(hex.begin(), hex.end(), is_hex_digit))
            throw ValidationError("Invalid character in hex string");

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.length(); i += 2)
        {
            std::string byte_str = hex.substr(i, 2);
            uint8_t byte         = static_cast<uint8_t>(std::stoi(byte_str, nullptr, 16));
            bytes.push_back(byte);
        }
        return bytes;
    }

    std::string SRPUtils::bytes_to_base64(const std::vector<uint8_t>& bytes)
    {
        if (bytes.empty())
            return {};

        std::string result(4 * ((bytes.size() + 2) / 3), '\0');
        const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()),
                                            bytes.data(), static_cast<int>(bytes.size()));
        if (written < 0)
            throw std::runtime_error("Base64 encode failed");

        result.resize(static_cast<size_t>(written));
        return result;
    }

    std::vector<uint8_t> SRPUtils::base64_to_bytes(const std::string& base64)
    {
        if (base64.empty())
            return {};

        if (base64.size() % 4 != 0)
            throw ValidationError("Base64 input length must be a multiple of 4");

        size_t padding = 0;
        if (base64[base64.size() - 1] == '=') ++padding;
        if (base64[base64.size() - 2] == '=') ++padding;

        std::vector<uint8_t> result(3 * (base64.size() / 4));
        const int decoded_size = EVP_DecodeBlock(result.data(),
                                                 reinterpret_cast<const unsigned char*>(base64.data()),
                                                 static_cast<int>(base64.size()));
        if (decoded_size < 0)
            throw ValidationError("Base64 decode failed");

        // EVP_DecodeBlock counts padding as zero bytes
        result.resize(static_cast<size_t>(decoded_size) - padding);
        return result;
    }

    std::vector<uint8_t> SRPUtils::base64url_to_bytes(const std::string& base64url)
    {
        std::string standard(base64url);
        std::replace(standard.begin(), standard.end(), '-', '+');
        std::replace(standard.begin(), standard.end(), '_', '/');

        if (standard.size() % 4 == 1)
            throw ValidationError("Invalid base64url length");

        while (standard.size() % 4 != 0)
            standard.push_back('=');

        return base64_to_bytes(standard);
    }

    std::vector<uint8_t> SRPUtils::to_bytes(const std::string& text)
    {
        return {text.begin(), text.end()};
    }

    bool SRPUtils::is_hex_digit(const char c)
    {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }
} // namespace geni::auth
