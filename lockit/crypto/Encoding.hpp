/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_CRYPTO_ENCODING_HPP
#define LOCKIT_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace lockit {

/**
 * Encodes data into a lower-case hex string.
 */
std::string
base16Encode(DataSlice data);

/**
 * Decodes a hex string, accepting either case.
 */
Status
base16Decode(DataChunk &result, const std::string &in);

/**
 * Encodes data into a base-32 string according to rfc4648.
 * The output is padded with '=' to a multiple of 8 characters.
 */
std::string
base32Encode(DataSlice data);

/**
 * Decodes a base-32 string as defined by rfc4648.
 * Lower-case letters are accepted. The padding must be exactly what
 * base32Encode would produce for the decoded length.
 * On failure, result is left untouched.
 */
Status
base32Decode(DataChunk &result, const std::string &in);

} // namespace lockit

#endif
