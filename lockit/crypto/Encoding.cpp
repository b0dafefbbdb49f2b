/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <algorithm>

namespace lockit {

static int
base16Value(char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('a' <= c && c <= 'f')
        return 10 + c - 'a';
    if ('A' <= c && c <= 'F')
        return 10 + c - 'A';
    return -1;
}

static int
base32Value(char c)
{
    if ('A' <= c && c <= 'Z')
        return c - 'A';
    if ('a' <= c && c <= 'z')
        return c - 'a';
    if ('2' <= c && c <= '7')
        return 26 + c - '2';
    return -1;
}

std::string
base16Encode(DataSlice data)
{
    const char base16Sym[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * data.size());

    for (auto c: data)
    {
        out += base16Sym[c >> 4];
        out += base16Sym[c & 0xf];
    }
    return out;
}

Status
base16Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 2 characters long:
    if (in.size() % 2)
        return LOCKIT_ERROR(LOCKIT_CC_InvalidEncoding, "Bad hex string length");

    DataChunk out;
    out.reserve(in.size() / 2);

    for (size_t i = 0; i < in.size(); i += 2)
    {
        int hi = base16Value(in[i]);
        int lo = base16Value(in[i + 1]);
        if (hi < 0 || lo < 0)
            return LOCKIT_ERROR(LOCKIT_CC_InvalidEncoding, "Bad hex character");
        out.push_back(hi << 4 | lo);
    }

    result = std::move(out);
    return Status();
}

std::string
base32Encode(DataSlice data)
{
    const char base32Sym[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    auto chunks = (data.size() + 4) / 5; // Rounding up
    out.reserve(8 * chunks);

    auto i = data.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != data.end() || 0 < bits)
    {
        // Reload the buffer if we need more bits:
        if (i != data.end() && bits < 5)
        {
            buffer |= *i++ << (8 - bits);
            bits += 8;
        }

        // Write out 5 most-significant bits in the buffer:
        out += base32Sym[buffer >> 11];
        buffer <<= 5;
        bits -= 5;
    }

    // Pad the final string to a multiple of 8 characters long:
    out.append(-out.size() % 8, '=');
    return out;
}

Status
base32Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 8 characters long:
    if (in.size() % 8)
        return LOCKIT_ERROR(LOCKIT_CC_InvalidEncoding,
            "Base32 length is not a multiple of 8");

    DataChunk out;
    out.reserve(5 * (in.size() / 8));

    auto i = in.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != in.end() && '=' != *i)
    {
        // Read one character from the string:
        int value = base32Value(*i++);
        if (value < 0)
            return LOCKIT_ERROR(LOCKIT_CC_InvalidEncoding,
                "Illegal base32 character");

        // Append the bits to the buffer:
        buffer |= value << (11 - bits);
        bits += 5;

        // Write out some bits if the buffer has a byte's worth:
        if (8 <= bits)
        {
            out.push_back(buffer >> 8);
            buffer <<= 8;
            bits -= 8;
        }
    }

    // Any extra characters must be '=':
    if (!std::all_of(i, in.end(), [](char c){ return '=' == c; }))
        return LOCKIT_ERROR(LOCKIT_CC_InvalidEncoding,
            "Base32 data after padding");

    // Only the padding lengths rfc4648 can produce are allowed,
    // which are 6, 4, 3 and 1 for a final group of 1, 2, 3 and 4 bytes:
    auto padding = in.end() - i;
    if (!(0 == padding || 1 == padding || 3 == padding ||
        4 == padding || 6 == padding))
        return LOCKIT_ERROR(LOCKIT_CC_InvalidEncoding,
            "Bad base32 padding");

    result = std::move(out);
    return Status();
}

} // namespace lockit
