/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Provisioning.hpp"
#include "../crypto/Encoding.hpp"
#include "../http/Uri.hpp"
#include <sstream>

namespace lockit {

#define OTP_URI_PREFIX "otpauth://totp/"
#define CHART_API "https://chart.googleapis.com/chart?chs=200x200&cht=qr&chl="

std::string
otpProvisioningUri(DataSlice secret, const std::string &account,
    const std::string &issuer)
{
    std::ostringstream out;
    out << OTP_URI_PREFIX << uriEncodeComponent(issuer + ":" + account) <<
        "?secret=" << uriEncodeComponent(base32Encode(secret)) <<
        "&issuer=" << uriEncodeComponent(issuer);
    return out.str();
}

std::string
otpChartUrl(DataSlice secret, const std::string &account,
    const std::string &issuer)
{
    // The chart service takes the whole link as one escaped parameter,
    // so the parts inside go unescaped:
    std::ostringstream payload;
    payload << OTP_URI_PREFIX << issuer << ':' << account <<
        "?secret=" << base32Encode(secret) <<
        "&issuer=" << issuer;
    return CHART_API + uriEncodeComponent(payload.str());
}

} // namespace lockit
