/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Uri.hpp"
#include "../crypto/Encoding.hpp"

namespace lockit {

enum CharClass
{
    schemeChar = 1 << 0,
    authorityChar = 1 << 1,     // RFC 3986 pchar
    pathChar = 1 << 2,          // pchar plus '/'
    queryChar = 1 << 3,         // pchar plus '/' and '?', also for fragments
    componentChar = 1 << 4      // Left alone by uriEncodeComponent
};

/**
 * Classifies a byte by hand, since the C library answers
 * differently depending on the locale.
 */
static unsigned
classify(char c)
{
    const bool alpha = ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z');
    const bool digit = '0' <= c && c <= '9';
    const unsigned pchar = authorityChar | pathChar | queryChar;

    if (alpha || digit)
        return schemeChar | pchar | componentChar;

    switch (c)
    {
    case '+':
        return schemeChar | pchar;
    case '-':
    case '.':
        return schemeChar | pchar | componentChar;
    case '_':
    case '~':
    case '!':
    case '\'':
    case '(':
    case ')':
    case '*':
        return pchar | componentChar;
    case '$':
    case '&':
    case ',':
    case ';':
    case '=':
    case ':':
    case '@':
        return pchar;
    case '/':
        return pathChar | queryChar;
    case '?':
        return queryChar;
    default:
        return 0;
    }
}

static bool
isHex(char c)
{
    return ('0' <= c && c <= '9') ||
        ('A' <= c && c <= 'F') || ('a' <= c && c <= 'f');
}

/**
 * True if every byte is in the class or starts a well-formed %XX escape.
 */
static bool
validate(const std::string &in, unsigned type)
{
    for (size_t i = 0; i < in.size(); ++i)
    {
        if ('%' == in[i])
        {
            if (in.size() < i + 3 || !isHex(in[i + 1]) || !isHex(in[i + 2]))
                return false;
            i += 2;
        }
        else if (!(classify(in[i]) & type))
        {
            return false;
        }
    }
    return true;
}

/**
 * Replaces %XX escapes with their bytes. Broken escapes stay as they are.
 */
static std::string
unescape(const std::string &in)
{
    std::string out;
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i)
    {
        DataChunk byte;
        if ('%' == in[i] && i + 3 <= in.size() &&
            base16Decode(byte, in.substr(i + 1, 2)))
        {
            out += static_cast<char>(byte[0]);
            i += 2;
        }
        else
        {
            out += in[i];
        }
    }
    return out;
}

bool
Uri::decode(const std::string &in, bool strict)
{
    Uri out;

    // The scheme runs up to the first ':' and always starts with a letter:
    const auto colon = in.find(':');
    if (std::string::npos == colon || !colon)
        return false;
    out.scheme_ = in.substr(0, colon);
    const char first = out.scheme_[0];
    if (!(('A' <= first && first <= 'Z') || ('a' <= first && first <= 'z')))
        return false;
    for (auto c: out.scheme_)
        if (!(classify(c) & schemeChar))
            return false;

    std::string rest = in.substr(colon + 1);

    // The fragment goes first, since it may contain '?':
    const auto hash = rest.find('#');
    if (std::string::npos != hash)
    {
        out.fragmentOk_ = true;
        out.fragment_ = rest.substr(hash + 1);
        rest.erase(hash);
    }

    const auto question = rest.find('?');
    if (std::string::npos != question)
    {
        out.queryOk_ = true;
        out.query_ = rest.substr(question + 1);
        rest.erase(question);
    }

    // What remains is "//authority/path" or just a path:
    if (0 == rest.compare(0, 2, "//"))
    {
        const auto slash = rest.find('/', 2);
        out.authorityOk_ = true;
        out.authority_ = rest.substr(2, std::string::npos == slash ?
            std::string::npos : slash - 2);
        out.path_ = std::string::npos == slash ? "" : rest.substr(slash);
    }
    else
    {
        out.path_ = rest;
    }

    if (strict &&
        !(validate(out.authority_, authorityChar) &&
          validate(out.path_, pathChar) &&
          validate(out.query_, queryChar) &&
          validate(out.fragment_, queryChar)))
        return false;

    *this = std::move(out);
    return true;
}

std::string
Uri::encode() const
{
    std::string out = scheme_ + ':';
    if (authorityOk_)
        out += "//" + authority_;
    out += path_;
    if (queryOk_)
        out += '?' + query_;
    if (fragmentOk_)
        out += '#' + fragment_;
    return out;
}

std::string
Uri::scheme() const
{
    std::string out = scheme_;
    for (auto &c: out)
        if ('A' <= c && c <= 'Z')
            c += 'a' - 'A';
    return out;
}

std::string
Uri::authority() const
{
    return unescape(authority_);
}

std::string
Uri::path() const
{
    return unescape(path_);
}

std::string
Uri::query() const
{
    return unescape(query_);
}

std::string
Uri::fragment() const
{
    return unescape(fragment_);
}

Uri::QueryMap
Uri::queryDecode() const
{
    QueryMap out;

    size_t start = 0;
    while (start < query_.size())
    {
        auto end = query_.find('&', start);
        if (std::string::npos == end)
            end = query_.size();

        const auto pair = query_.substr(start, end - start);
        const auto equals = pair.find('=');
        if (std::string::npos == equals)
            out[unescape(pair)] = "";
        else
            out[unescape(pair.substr(0, equals))] =
                unescape(pair.substr(equals + 1));

        start = end + 1;
    }

    return out;
}

std::string
uriEncodeComponent(const std::string &in)
{
    static const char hex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(in.size());
    for (auto c: in)
    {
        if (classify(c) & componentChar)
        {
            out += c;
        }
        else
        {
            const auto byte = static_cast<uint8_t>(c);
            out += '%';
            out += hex[byte >> 4];
            out += hex[byte & 0xf];
        }
    }
    return out;
}

} // namespace lockit
