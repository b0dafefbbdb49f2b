/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Enrollment links for authenticator apps.
 */

#ifndef LOCKIT_AUTH_PROVISIONING_HPP
#define LOCKIT_AUTH_PROVISIONING_HPP

#include "../util/Data.hpp"

namespace lockit {

#define LOCKIT_DEFAULT_ISSUER "Lockit"

/**
 * Builds the "Key URI Format" link that authenticator apps scan:
 * otpauth://totp/<issuer>:<account>?secret=<base32>&issuer=<issuer>
 * with each component percent-encoded.
 */
std::string
otpProvisioningUri(DataSlice secret, const std::string &account,
    const std::string &issuer=LOCKIT_DEFAULT_ISSUER);

/**
 * Builds a link to a 200x200 QR image of the provisioning URI,
 * rendered by the Google chart service.
 */
std::string
otpChartUrl(DataSlice secret, const std::string &account,
    const std::string &issuer=LOCKIT_DEFAULT_ISSUER);

} // namespace lockit

#endif
