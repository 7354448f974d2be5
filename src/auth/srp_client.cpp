#include "geni/auth/srp_client.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace geni::auth
{
    SRPClient::SRPClient(std::string pool_name)
        : pool_name_(std::move(pool_name))
          , N_(std::string(SRP_N_HEX_3072))
          , g_(std::string(SRP_G_HEX))
          , k_(SRPUtils::calculate_k(N_, g_))
    {
        // generate random private ephemeral 'a', reduced mod N
        a_ = SRPUtils::mod(SRPUtils::BigNum(SRPUtils::random_bytes(SRP_EPHEMERAL_BYTES)), N_);

        init_public_value();
    }

    SRPClient::SRPClient(std::string pool_name, const std::string& a_hex)
        : pool_name_(std::move(pool_name))
          , N_(std::string(SRP_N_HEX_3072))
          , g_(std::string(SRP_G_HEX))
          , k_(SRPUtils::calculate_k(N_, g_))
    {
        a_ = SRPUtils::mod(SRPUtils::BigNum(a_hex), N_);

        init_public_value();
    }

    void SRPClient::init_public_value()
    {
        // calculate A = g^a mod N
        A_ = SRPUtils::modpow(g_, a_, N_);
    }

    PasswordClaim SRPClient::compute_claim(
        const PasswordVerifierChallenge& challenge,
        const std::string& password,
        const std::string& timestamp)
    {
        if (consumed_)
            throw std::logic_error("SRP key pair was already used for a claim");
        consumed_ = true;

        SRPUtils::BigNum B(challenge.srp_b_hex);

        // calculate u = H(pad(A) | pad(B)), hard failure on zero
        auto u = SRPUtils::calculate_u(A_, B);
        SRPUtils::validate_u(u);

        // calculate x = H(pad(salt) | H(pool_name | username | ":" | password))
        auto x = SRPUtils::calculate_x(challenge.salt_hex, pool_name_, challenge.user_id_for_srp, password);

        // calculate S = (B - kg^x)^(a + ux) mod N
        auto S = SRPUtils::calculate_S_client(N_, B, k_, g_, x, a_, u);

        // 16-byte signing key
        auto key = SRPUtils::derive_key(S, u);

        // message = pool_name | username | secret_block | timestamp, text parts as UTF-8
        auto message      = SRPUtils::to_bytes(pool_name_);
        auto username     = SRPUtils::to_bytes(challenge.user_id_for_srp);
        auto secret_block = SRPUtils::base64_to_bytes(challenge.secret_block);
        auto time_bytes   = SRPUtils::to_bytes(timestamp);
        message.insert(message.end(), username.begin(), username.end());
        message.insert(message.end(), secret_block.begin(), secret_block.end());
        message.insert(message.end(), time_bytes.begin(), time_bytes.end());

        auto signature = SRPUtils::hmac_sha256(key, message);

        return PasswordClaim{
            .user_id_for_srp = challenge.user_id_for_srp,
            .secret_block = challenge.secret_block,
            .signature = SRPUtils::bytes_to_base64(signature),
            .timestamp = timestamp
        };
    }

    std::string SRPClient::format_timestamp(const std::chrono::system_clock::time_point time)
    {
        static constexpr const char* kWeekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
        static constexpr const char* kMonths[]   = {
            "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
        };

        const std::time_t time_t = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        if (!gmtime_r(&time_t, &utc))
            throw std::runtime_error("Failed to convert time to UTC");

        // day of month has no padding, unlike strftime %d and %e
        std::ostringstream oss;
        oss << kWeekdays[utc.tm_wday] << " "
            << kMonths[utc.tm_mon] << " "
            << utc.tm_mday << " "
            << std::setfill('0')
            << std::setw(2) << utc.tm_hour << ":"
            << std::setw(2) << utc.tm_min << ":"
            << std::setw(2) << utc.tm_sec
            << " UTC " << (utc.tm_year + 1900);
        return oss.str();
    }
} // namespace geni::auth
