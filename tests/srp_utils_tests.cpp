#include "geni/auth/srp_utils.hpp"
#include "geni/common/errors.hpp"

#include <gtest/gtest.h>

namespace geni::auth
{
    class SRPUtilsTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
        }

        void TearDown() override
        {
        }
    };

    TEST_F(SRPUtilsTest, PadHexOddLength)
    {
        EXPECT_EQ(SRPUtils::pad_hex("abc"), "0abc");
        EXPECT_EQ(SRPUtils::pad_hex("0"), "00");
    }

    TEST_F(SRPUtilsTest, PadHexHighBitPrefixed)
    {
        EXPECT_EQ(SRPUtils::pad_hex("80"), "0080");
        EXPECT_EQ(SRPUtils::pad_hex("ff01"), "00ff01");
        EXPECT_EQ(SRPUtils::pad_hex("FF01"), "00FF01");
    }

    TEST_F(SRPUtilsTest, PadHexUnchanged)
    {
        EXPECT_EQ(SRPUtils::pad_hex("7f"), "7f");
        EXPECT_EQ(SRPUtils::pad_hex("0a0b"), "0a0b");
    }

    TEST_F(SRPUtilsTest, PadHexAlwaysEvenLength)
    {
        for (const std::string hex : {"1", "12", "123", "8", "80", "fff", "ffff", "7fffff"})
        {
            const auto padded = SRPUtils::pad_hex(hex);
            EXPECT_EQ(padded.size() % 2, 0u) << hex;
            EXPECT_LT(std::stoi(padded.substr(0, 2), nullptr, 16), 0x80) << hex;
        }
    }

    TEST_F(SRPUtilsTest, PadHexRejectsInvalid)
    {
        EXPECT_THROW(SRPUtils::pad_hex(""), ValidationError);
        EXPECT_THROW(SRPUtils::pad_hex("xyz"), ValidationError);
        EXPECT_THROW(SRPUtils::pad_hex("-1"), ValidationError);
    }

    TEST_F(SRPUtilsTest, PadHexFromBigNum)
    {
        const SRPUtils::BigNum value(std::string("ff"));
        EXPECT_EQ(SRPUtils::pad_hex(value), "00ff");
    }

    TEST_F(SRPUtilsTest, BigNumRejectsInvalidHex)
    {
        EXPECT_THROW(SRPUtils::BigNum(std::string("")), ValidationError);
        EXPECT_THROW(SRPUtils::BigNum(std::string("12g4")), ValidationError);
    }

    TEST_F(SRPUtilsTest, BigNumHexIsLowercase)
    {
        const SRPUtils::BigNum value(std::string("ABCDEF"));
        EXPECT_EQ(value.to_hex(), "abcdef");
    }

    TEST_F(SRPUtilsTest, BigNumZero)
    {
        const SRPUtils::BigNum zero(std::string("0"));
        EXPECT_TRUE(zero.is_zero());
        EXPECT_EQ(SRPUtils::pad_hex(zero), "00");
    }

    TEST_F(SRPUtilsTest, BigNumMoveLeavesSourceEmpty)
    {
        SRPUtils::BigNum source(std::string("1234"));
        SRPUtils::BigNum target(std::move(source));
        EXPECT_EQ(target.to_hex(), "1234");
        EXPECT_EQ(source.get(), nullptr);
    }

    TEST_F(SRPUtilsTest, Sha256KnownVector)
    {
        EXPECT_EQ(SRPUtils::bytes_to_hex(SRPUtils::hash_sha256(std::string("abc"))),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST_F(SRPUtilsTest, HashMultipleConcatenates)
    {
        const auto joined = SRPUtils::hash_multiple({SRPUtils::to_bytes("a"), SRPUtils::to_bytes("bc")});
        EXPECT_EQ(joined, SRPUtils::hash_sha256(std::string("abc")));
    }

    TEST_F(SRPUtilsTest, HmacSha256Rfc4231)
    {
        const auto mac = SRPUtils::hmac_sha256(SRPUtils::to_bytes("Jefe"),
                                               SRPUtils::to_bytes("what do ya want for nothing?"));
        EXPECT_EQ(SRPUtils::bytes_to_hex(mac),
                  "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    }

    TEST_F(SRPUtilsTest, ModPow)
    {
        const SRPUtils::BigNum base(std::string("4"));
        const SRPUtils::BigNum exponent(std::string("d"));
        const SRPUtils::BigNum modulus(std::string("1f1"));

        // 4^13 mod 497 = 445
        EXPECT_EQ(SRPUtils::modpow(base, exponent, modulus).to_hex(), "01bd");
    }

    TEST_F(SRPUtilsTest, ModIsNonNegative)
    {
        const SRPUtils::BigNum value(std::string("64"));
        const SRPUtils::BigNum modulus(std::string("7"));
        EXPECT_EQ(SRPUtils::mod(value, modulus).to_hex(), "02");
    }

    TEST_F(SRPUtilsTest, ValidateUZeroThrows)
    {
        const SRPUtils::BigNum zero(std::string("0"));
        EXPECT_THROW(SRPUtils::validate_u(zero), SrpProtocolError);

        const SRPUtils::BigNum one(std::string("1"));
        EXPECT_NO_THROW(SRPUtils::validate_u(one));
    }

    TEST_F(SRPUtilsTest, UZeroIsProtocolViolation)
    {
        try
        {
            SRPUtils::validate_u(SRPUtils::BigNum(std::string("00")));
            FAIL() << "expected SrpProtocolError";
        }
        catch (const SrpProtocolError& e)
        {
            EXPECT_EQ(e.reason(), AuthFailure::ProtocolViolation);
        }
    }

    TEST_F(SRPUtilsTest, HexRoundTrip)
    {
        const std::vector<uint8_t> bytes{0x00, 0x01, 0x7f, 0x80, 0xff};
        EXPECT_EQ(SRPUtils::bytes_to_hex(bytes), "00017f80ff");
        EXPECT_EQ(SRPUtils::hex_to_bytes("00017f80ff"), bytes);
    }

    TEST_F(SRPUtilsTest, HexToBytesRejectsInvalid)
    {
        EXPECT_THROW(SRPUtils::hex_to_bytes("abc"), ValidationError);
        EXPECT_THROW(SRPUtils::hex_to_bytes("zz"), ValidationError);
    }

    TEST_F(SRPUtilsTest, Base64Padding)
    {
        EXPECT_EQ(SRPUtils::bytes_to_base64(SRPUtils::to_bytes("f")), "Zg==");
        EXPECT_EQ(SRPUtils::bytes_to_base64(SRPUtils::to_bytes("fo")), "Zm8=");
        EXPECT_EQ(SRPUtils::bytes_to_base64(SRPUtils::to_bytes("foo")), "Zm9v");

        EXPECT_EQ(SRPUtils::base64_to_bytes("Zg=="), SRPUtils::to_bytes("f"));
        EXPECT_EQ(SRPUtils::base64_to_bytes("Zm8="), SRPUtils::to_bytes("fo"));
        EXPECT_EQ(SRPUtils::base64_to_bytes("Zm9v"), SRPUtils::to_bytes("foo"));
    }

    TEST_F(SRPUtilsTest, Base64DecodeBinary)
    {
        const auto bytes = SRPUtils::base64_to_bytes("b3BhcXVlLXNlY3JldC1ibG9jay0AAf7/");
        ASSERT_EQ(bytes.size(), 24u);
        EXPECT_EQ(bytes[20], 0x00);
        EXPECT_EQ(bytes[21], 0x01);
        EXPECT_EQ(bytes[22], 0xfe);
        EXPECT_EQ(bytes[23], 0xff);
    }

    TEST_F(SRPUtilsTest, Base64RejectsInvalid)
    {
        EXPECT_THROW(SRPUtils::base64_to_bytes("abc"), ValidationError);
        EXPECT_THROW(SRPUtils::base64_to_bytes("ab!="), ValidationError);
    }

    TEST_F(SRPUtilsTest, Base64UrlUnpadded)
    {
        const auto bytes = SRPUtils::base64url_to_bytes(
            "eyJzdWIiOiAiYWJjLTEyMyIsICJlbWFpbCI6ICJkZXZAZXhhbXBsZS5jb20ifQ");
        EXPECT_EQ(std::string(bytes.begin(), bytes.end()),
                  R"({"sub": "abc-123", "email": "dev@example.com"})");
    }

    TEST_F(SRPUtilsTest, Base64UrlAlphabet)
    {
        // 0xfb 0xff -> "+/8=" in the standard alphabet
        EXPECT_EQ(SRPUtils::base64url_to_bytes("-_8"), (std::vector<uint8_t>{0xfb, 0xff}));
    }

    TEST_F(SRPUtilsTest, RandomBytes)
    {
        const auto first  = SRPUtils::random_bytes(32);
        const auto second = SRPUtils::random_bytes(32);
        EXPECT_EQ(first.size(), 32u);
        EXPECT_NE(first, second);
    }
} // namespace geni::auth
