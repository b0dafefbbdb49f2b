/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../lockit/crypto/Encoding.hpp"
#include <catch2/catch.hpp>

TEST_CASE("RFC 4648 base16 test vectors", "[crypto][base16]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "66"},
        {"fo", "666f"},
        {"foo", "666f6f"},
        {"foob", "666f6f62"},
        {"fooba", "666f6f6261"},
        {"foobar", "666f6f626172"}
    };

    // Encoding:
    for (auto &test: cases)
        REQUIRE(test.text == lockit::base16Encode(std::string(test.data)));

    // Decoding:
    for (auto &test: cases)
    {
        lockit::DataChunk result;
        REQUIRE(lockit::base16Decode(result, test.text));
        REQUIRE(lockit::toString(result) == test.data);
    }
}

TEST_CASE("Bad base16 strings", "[crypto][base16]")
{
    lockit::DataChunk result;

    // Bad length:
    REQUIRE_FALSE(lockit::base16Decode(result, "123"));

    // Bad characters:
    REQUIRE_FALSE(lockit::base16Decode(result, "0g"));
    REQUIRE_FALSE(lockit::base16Decode(result, "0="));
}

TEST_CASE("RFC 4648 base32 test vectors", "[crypto][base32]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"f", "MY======"},
        {"fo", "MZXQ===="},
        {"foo", "MZXW6==="},
        {"foob", "MZXW6YQ="},
        {"fooba", "MZXW6YTB"},
        {"foobar", "MZXW6YTBOI======"}
    };

    // Encoding:
    for (auto &test: cases)
        REQUIRE(test.text == lockit::base32Encode(std::string(test.data)));

    // Decoding:
    for (auto &test: cases)
    {
        lockit::DataChunk result;
        REQUIRE(lockit::base32Decode(result, test.text));
        REQUIRE(lockit::toString(result) == test.data);
    }
}

TEST_CASE("Lower-case base32 decodes", "[crypto][base32]")
{
    lockit::DataChunk result;
    REQUIRE(lockit::base32Decode(result, "mzxw6ytboi======"));
    REQUIRE(lockit::toString(result) == "foobar");

    REQUIRE(lockit::base32Decode(result, "MzXw6YtB"));
    REQUIRE(lockit::toString(result) == "fooba");
}

TEST_CASE("Bad base32 strings", "[crypto][base32]")
{
    lockit::DataChunk result;

    // Bad length:
    auto s = lockit::base32Decode(result, "12345");
    REQUIRE_FALSE(s);
    REQUIRE(lockit::LOCKIT_CC_InvalidEncoding == s.value());

    // Bad padding:
    REQUIRE_FALSE(lockit::base32Decode(result, "AAAAAAAA========"));
    REQUIRE_FALSE(lockit::base32Decode(result, "A======="));
    REQUIRE_FALSE(lockit::base32Decode(result, "AAA====="));
    REQUIRE_FALSE(lockit::base32Decode(result, "AAAAAA=="));
    REQUIRE_FALSE(lockit::base32Decode(result, "MY==MY=="));

    // Illegal characters:
    REQUIRE_FALSE(lockit::base32Decode(result, "A1======"));
    REQUIRE_FALSE(lockit::base32Decode(result, "A8======"));
    REQUIRE_FALSE(lockit::base32Decode(result, "MZXW6 YQ"));
}

TEST_CASE("Failed base32 decoding leaves the output alone", "[crypto][base32]")
{
    lockit::DataChunk result = {1, 2, 3};
    REQUIRE_FALSE(lockit::base32Decode(result, "A1======"));
    REQUIRE(result == lockit::DataChunk({1, 2, 3}));
}

TEST_CASE("Binary base32 round trip", "[crypto][base32]")
{
    // Every length through two full groups, with every byte value:
    lockit::DataChunk data;
    for (unsigned i = 0; i < 256; ++i)
        data.push_back(static_cast<uint8_t>(255 - i));

    for (size_t size = 0; size <= 12; ++size)
    {
        lockit::DataChunk in(data.begin(), data.begin() + size);
        auto text = lockit::base32Encode(in);
        REQUIRE(0 == text.size() % 8);

        lockit::DataChunk out;
        REQUIRE(lockit::base32Decode(out, text));
        REQUIRE(out == in);
    }

    lockit::DataChunk out;
    REQUIRE(lockit::base32Decode(out, lockit::base32Encode(data)));
    REQUIRE(out == data);
}
