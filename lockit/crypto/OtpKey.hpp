/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_CRYPTO_OTPKEY_HPP
#define LOCKIT_CRYPTO_OTPKEY_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <time.h>

namespace lockit {

/**
 * How far a submitted code may drift from the current time step.
 *
 * The default of 6 steps of 30 seconds accepts codes up to three minutes
 * old or early. That is generous towards bad device clocks, but widens the
 * period in which an observed code can be replayed. Callers who want
 * strict behavior can shrink the window or insist on a zero delta.
 */
struct OtpWindow
{
    OtpWindow(unsigned size=6, unsigned timeStep=30):
        size(size), timeStep(timeStep)
    {}

    unsigned size;      // Steps accepted on either side of the current one
    unsigned timeStep;  // Seconds per step, must be positive
};

/**
 * The outcome of checking a code against a window.
 * A match with delta 0 was produced in the current time step,
 * while a negative delta means the device clock is behind.
 */
struct OtpMatch
{
    bool matched;
    int delta;
};

/**
 * Implements the HOTP and TOTP algorithms defined by rfc4226 and rfc6238.
 */
class OtpKey
{
public:
    OtpKey() {}
    OtpKey(DataSlice key): key_(key.begin(), key.end()) {}

    /**
     * Initializes the key with random data.
     */
    Status
    create(size_t keySize=10);

    /**
     * Initializes the key with a base32-encoded string.
     */
    Status
    decodeBase32(const std::string &key);

    /**
     * Produces a counter-based password.
     */
    Status
    hotp(std::string &result, uint64_t counter, unsigned digits=6) const;

    /**
     * Produces a time-based password for the step containing `now`.
     */
    Status
    totp(std::string &result, time_t now,
        unsigned timeStep=30, unsigned digits=6) const;

    /**
     * Searches the window around `now` for a step producing `code`.
     * The current step is tried first, then steps further away,
     * with the past winning ties. Never fails: malformed codes,
     * empty keys and zero time steps simply do not match.
     */
    OtpMatch
    verify(const std::string &code, time_t now,
        const OtpWindow &window=OtpWindow(), unsigned digits=6) const;

    /**
     * Encodes the key as a base32 string.
     */
    std::string
    encodeBase32() const;

    /**
     * Obtains access to the underlying binary key.
     */
    DataSlice
    key() const { return key_; }

private:
    DataChunk key_;
};

/**
 * Derives the code for a secret and counter.
 * Fails if the secret is empty or the digit count is outside 1-10.
 */
Status
otpGenerate(std::string &result, DataSlice secret, uint64_t counter,
    unsigned digits=6);

/**
 * Accepts a code only if it belongs to the current time step,
 * although the whole window is searched. This is the policy the login
 * routes apply on top of OtpKey::verify.
 */
bool
otpVerifyStrict(const std::string &code, DataSlice secret, time_t now,
    const OtpWindow &window=OtpWindow());

} // namespace lockit

#endif
