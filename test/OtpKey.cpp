/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../lockit/crypto/OtpKey.hpp"
#include "../lockit/crypto/Encoding.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>

static const std::string rfcSecret = "12345678901234567890";

static std::string
codeAt(const lockit::OtpKey &key, uint64_t counter, unsigned digits=6)
{
    std::string out;
    REQUIRE(key.hotp(out, counter, digits));
    return out;
}

TEST_CASE("RFC 4226 test vectors", "[crypto][otp]" )
{
    lockit::OtpKey key(rfcSecret);

    const char *cases[] =
    {
        "755224",
        "287082",
        "359152",
        "969429",
        "338314",
        "254676",
        "287922",
        "162583",
        "399871",
        "520489"
    };
    int i = 0;
    for (auto test: cases)
    {
        REQUIRE(codeAt(key, i) == test);
        ++i;
    }
}

TEST_CASE("RFC 6238 test vector", "[crypto][otp]" )
{
    lockit::OtpKey key(rfcSecret);
    std::string code;

    REQUIRE(key.totp(code, 59, 30, 8));
    REQUIRE(code == "94287082");

    REQUIRE(key.totp(code, 59, 30, 6));
    REQUIRE(code == "287082");

    REQUIRE(key.totp(code, 1111111109, 30, 8));
    REQUIRE(code == "07081804");
}

TEST_CASE("Leading zeros in OTP output", "[crypto][otp]" )
{
    lockit::OtpKey key;
    REQUIRE(key.decodeBase32("AAAAAAAA"));
    REQUIRE(codeAt(key, 2) == "073348");
    REQUIRE(codeAt(key, 9) == "003773");
}

TEST_CASE("OTP generation is deterministic", "[crypto][otp]" )
{
    lockit::OtpKey key(rfcSecret);
    std::string direct;
    REQUIRE(lockit::otpGenerate(direct, key.key(), 12345, 7));
    REQUIRE(direct == codeAt(key, 12345, 7));
    REQUIRE(direct == codeAt(key, 12345, 7));
}

TEST_CASE("OTP generation rejects bad input", "[crypto][otp]" )
{
    std::string code = "untouched";

    SECTION("empty secret")
    {
        lockit::OtpKey key;
        auto s = key.hotp(code, 1);
        REQUIRE_FALSE(s);
        REQUIRE(lockit::LOCKIT_CC_InvalidSecret == s.value());
        REQUIRE(code == "untouched");
    }
    SECTION("digit counts")
    {
        lockit::OtpKey key(rfcSecret);
        REQUIRE_FALSE(key.hotp(code, 1, 0));
        REQUIRE_FALSE(key.hotp(code, 1, 11));
        REQUIRE(key.hotp(code, 1, 10));
        REQUIRE(10 == code.size());
    }
    SECTION("zero time step")
    {
        lockit::OtpKey key(rfcSecret);
        REQUIRE_FALSE(key.totp(code, 59, 0));
    }
}

TEST_CASE("Random keys", "[crypto][otp]" )
{
    lockit::OtpKey a, b;
    REQUIRE(a.create());
    REQUIRE(b.create(20));
    REQUIRE(10 == a.key().size());
    REQUIRE(20 == b.key().size());
    REQUIRE(a.encodeBase32() != b.encodeBase32());

    lockit::OtpKey c;
    REQUIRE(c.decodeBase32(b.encodeBase32()));
    REQUIRE(c.encodeBase32() == b.encodeBase32());
}

TEST_CASE("Verification in the current step", "[crypto][otp][verify]" )
{
    lockit::OtpKey key(rfcSecret);
    const time_t now = 1111111109;
    const lockit::OtpWindow window(6, 30);

    auto match = key.verify(codeAt(key, now / 30), now, window);
    REQUIRE(match.matched);
    REQUIRE(0 == match.delta);
    REQUIRE(lockit::otpVerifyStrict(codeAt(key, now / 30), key.key(), now));
}

TEST_CASE("Verification tolerates drift inside the window", "[crypto][otp][verify]" )
{
    lockit::OtpKey key(rfcSecret);
    const time_t now = 1111111109;
    const uint64_t counter = now / 30;

    for (int window = 0; window <= 3; ++window)
    {
        for (int k = -5; k <= 5; ++k)
        {
            auto match = key.verify(codeAt(key, counter + k), now,
                lockit::OtpWindow(window, 30));
            if (std::abs(k) <= window)
            {
                REQUIRE(match.matched);
                REQUIRE(k == match.delta);
            }
            else
            {
                REQUIRE_FALSE(match.matched);
            }
        }
    }
}

TEST_CASE("Strict verification refuses drifted codes", "[crypto][otp][verify]" )
{
    lockit::OtpKey key(rfcSecret);
    const time_t now = 1111111109;
    const auto late = codeAt(key, now / 30 - 1);

    REQUIRE(key.verify(late, now).matched);
    REQUIRE_FALSE(lockit::otpVerifyStrict(late, key.key(), now));
}

TEST_CASE("Wrong codes do not verify", "[crypto][otp][verify]" )
{
    lockit::OtpKey key(rfcSecret);
    const time_t now = 1111111109;

    // None of the 13 codes around this time is 000000:
    REQUIRE_FALSE(key.verify("000000", now).matched);
    REQUIRE_FALSE(key.verify("", now).matched);
    REQUIRE_FALSE(key.verify("81804", now).matched);
    REQUIRE_FALSE(key.verify("0081804", now).matched);
    REQUIRE_FALSE(key.verify("08180x", now).matched);
    REQUIRE_FALSE(key.verify("081804", now, lockit::OtpWindow(6, 0)).matched);
    REQUIRE_FALSE(lockit::OtpKey().verify("081804", now).matched);

    // The real code still works:
    REQUIRE(key.verify("081804", now).matched);
}

TEST_CASE("Verification prefers the nearest step", "[crypto][otp][verify]" )
{
    lockit::OtpKey key(rfcSecret);

    SECTION("past wins a tie")
    {
        // At t=930 the one-digit codes for steps 30 and 32 are both 0:
        REQUIRE(codeAt(key, 30, 1) == "0");
        REQUIRE(codeAt(key, 32, 1) == "0");
        REQUIRE(codeAt(key, 31, 1) != "0");

        auto match = key.verify("0", 930, lockit::OtpWindow(1, 30), 1);
        REQUIRE(match.matched);
        REQUIRE(-1 == match.delta);
    }
    SECTION("nearer future beats farther past")
    {
        // At t=600 the code 5 belongs to steps 18 and 21:
        REQUIRE(codeAt(key, 18, 1) == "5");
        REQUIRE(codeAt(key, 21, 1) == "5");

        auto match = key.verify("5", 600, lockit::OtpWindow(2, 30), 1);
        REQUIRE(match.matched);
        REQUIRE(1 == match.delta);
    }
}

TEST_CASE("Verification near the epoch", "[crypto][otp][verify]" )
{
    lockit::OtpKey key(rfcSecret);

    auto match = key.verify(codeAt(key, 0), 45);
    REQUIRE(match.matched);
    REQUIRE(-1 == match.delta);

    match = key.verify(codeAt(key, 3), 15);
    REQUIRE(match.matched);
    REQUIRE(3 == match.delta);
}
