/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../lockit/auth/Provisioning.hpp"
#include "../../lockit/auth/QrCode.hpp"
#include "../../lockit/crypto/OtpKey.hpp"
#include <iostream>

using namespace lockit;

COMMAND(InitLevel::none, OtpCreate, "otp-create",
        " [bytes]", "make a random secret")
{
    if (1 < argc)
        return LOCKIT_ERROR(LOCKIT_CC_Error, helpString(*this));

    long long size = 10;
    if (argc)
        LOCKIT_CHECK(parseInteger(size, argv[0]));
    if (size < 1 || 1024 < size)
        return LOCKIT_ERROR(LOCKIT_CC_Error, "Keys must be 1 to 1024 bytes");

    OtpKey key;
    LOCKIT_CHECK(key.create(size));
    std::cout << "key: " << key.encodeBase32() << std::endl;

    return Status();
}

COMMAND(InitLevel::config, OtpCode, "otp-code",
        " <key> [unix-time]", "print the current code for a secret")
{
    if (argc < 1 || 2 < argc)
        return LOCKIT_ERROR(LOCKIT_CC_Error, helpString(*this));

    OtpKey key;
    LOCKIT_CHECK(key.decodeBase32(argv[0]));
    time_t now;
    LOCKIT_CHECK(parseTime(now, 2 == argc ? argv[1] : nullptr));

    std::string code;
    LOCKIT_CHECK(key.totp(code, now, session.config.otpStep(),
        session.config.otpDigits()));
    std::cout << code << std::endl;

    return Status();
}

COMMAND(InitLevel::config, OtpVerify, "otp-verify",
        " <key> <code> [unix-time]", "check a code, reporting clock drift")
{
    if (argc < 2 || 3 < argc)
        return LOCKIT_ERROR(LOCKIT_CC_Error, helpString(*this));

    OtpKey key;
    LOCKIT_CHECK(key.decodeBase32(argv[0]));
    const std::string code = argv[1];
    time_t now;
    LOCKIT_CHECK(parseTime(now, 3 == argc ? argv[2] : nullptr));

    const auto match = key.verify(code, now, session.config.otpWindow(),
        session.config.otpDigits());
    if (match.matched)
        std::cout << "match, delta: " << match.delta <<
            (match.delta ? " (clock drift)" : "") << std::endl;
    else
        std::cout << "no match" << std::endl;
    std::cout << "strict: " <<
        (match.matched && !match.delta ? "accepted" : "rejected") << std::endl;

    return Status();
}

COMMAND(InitLevel::config, OtpUri, "otp-uri",
        " <key> <account>", "print the enrollment link and chart URL")
{
    if (argc != 2)
        return LOCKIT_ERROR(LOCKIT_CC_Error, helpString(*this));

    OtpKey key;
    LOCKIT_CHECK(key.decodeBase32(argv[0]));
    const std::string account = argv[1];
    const std::string issuer = session.config.issuer();

    std::cout << "uri: " <<
        otpProvisioningUri(key.key(), account, issuer) << std::endl;
    std::cout << "chart: " <<
        otpChartUrl(key.key(), account, issuer) << std::endl;

    return Status();
}

COMMAND(InitLevel::config, OtpQr, "otp-qr",
        " <key> <account>", "draw the enrollment QR code")
{
    if (argc != 2)
        return LOCKIT_ERROR(LOCKIT_CC_Error, helpString(*this));

    OtpKey key;
    LOCKIT_CHECK(key.decodeBase32(argv[0]));

    QrCode qr;
    LOCKIT_CHECK(qrEncode(qr,
        otpProvisioningUri(key.key(), argv[1], session.config.issuer())));
    std::cout << qr.ascii();

    return Status();
}
