/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKey.hpp"
#include "Encoding.hpp"
#include "Random.hpp"
#include "../util/Debug.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <limits>
#include <sstream>

namespace lockit {

#define OTP_MAX_DIGITS 10 // A 31-bit value has at most 10 decimal digits

Status
OtpKey::create(size_t keySize)
{
    LOCKIT_CHECK(randomData(key_, keySize));
    return Status();
}

Status
OtpKey::decodeBase32(const std::string &key)
{
    LOCKIT_CHECK(base32Decode(key_, key));
    return Status();
}

Status
OtpKey::hotp(std::string &result, uint64_t counter, unsigned digits) const
{
    return otpGenerate(result, key_, counter, digits);
}

Status
OtpKey::totp(std::string &result, time_t now,
    unsigned timeStep, unsigned digits) const
{
    if (!timeStep)
        return LOCKIT_ERROR(LOCKIT_CC_Error, "The time step must be positive");
    if (now < 0)
        return LOCKIT_ERROR(LOCKIT_CC_Error, "The time is before the epoch");

    return otpGenerate(result, key_, static_cast<uint64_t>(now) / timeStep,
        digits);
}

OtpMatch
OtpKey::verify(const std::string &code, time_t now,
    const OtpWindow &window, unsigned digits) const
{
    OtpMatch out = {false, 0};

    if (key_.empty())
    {
        LOCKIT_DebugLog("OTP verification attempted without a key");
        return out;
    }
    if (!window.timeStep)
    {
        LOCKIT_DebugLog("OTP verification attempted with a zero time step");
        return out;
    }
    if (now < 0 || code.size() != digits)
        return out;

    const uint64_t counter = static_cast<uint64_t>(now) / window.timeStep;
    const uint64_t limit = std::numeric_limits<uint64_t>::max();

    for (unsigned distance = 0; distance <= window.size; ++distance)
    {
        // Try the past before the future:
        const int sides[] = {-1, 1};
        for (auto side: sides)
        {
            if (!distance && 0 < side)
                continue;
            if (side < 0 && counter < distance)
                continue;
            if (0 < side && limit - counter < distance)
                continue;

            uint64_t step = side < 0 ? counter - distance : counter + distance;
            std::string expected;
            if (!otpGenerate(expected, key_, step, digits).log())
                return out;

            if (!CRYPTO_memcmp(expected.data(), code.data(), digits))
            {
                out.matched = true;
                out.delta = side * static_cast<int>(distance);
                return out;
            }
        }

        // Stop before `distance` wraps around:
        if (distance == std::numeric_limits<unsigned>::max())
            break;
    }

    return out;
}

std::string
OtpKey::encodeBase32() const
{
    return base32Encode(key_);
}

Status
otpGenerate(std::string &result, DataSlice secret, uint64_t counter,
    unsigned digits)
{
    if (secret.empty())
        return LOCKIT_ERROR(LOCKIT_CC_InvalidSecret, "The OTP secret is empty");
    if (!digits || OTP_MAX_DIGITS < digits)
        return LOCKIT_ERROR(LOCKIT_CC_Error, "OTP codes need 1 to 10 digits");

    // Do HMAC_SHA1(key, counter):
    DataArray<20> hmac;
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};
    unsigned int hmacSize = 0;
    if (!HMAC(EVP_sha1(), secret.data(), secret.size(), cb.data(), cb.size(),
        hmac.data(), &hmacSize) || hmac.size() != hmacSize)
        return LOCKIT_ERROR(LOCKIT_CC_SysError, "HMAC-SHA1 failed");

    // Calculate the truncated output:
    unsigned offset = hmac[19] & 0xf;
    uint32_t p = (uint32_t(hmac[offset]) << 24) |
        (uint32_t(hmac[offset + 1]) << 16) |
        (uint32_t(hmac[offset + 2]) << 8) | hmac[offset + 3];
    p &= 0x7fffffff;

    // Format as a fixed-width decimal number,
    // where dropping the leading digits takes the modulus:
    std::stringstream ss;
    ss.width(digits);
    ss.fill('0');
    ss << p;
    auto s = ss.str();
    s.erase(0, s.size() - digits);

    result = std::move(s);
    return Status();
}

bool
otpVerifyStrict(const std::string &code, DataSlice secret, time_t now,
    const OtpWindow &window)
{
    OtpKey key(secret);
    auto match = key.verify(code, now, window);
    return match.matched && 0 == match.delta;
}

} // namespace lockit
