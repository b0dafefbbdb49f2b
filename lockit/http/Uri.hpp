/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Just enough RFC 3986 for login redirects, enrollment links
 * and database connection strings.
 */

#ifndef LOCKIT_HTTP_URI_HPP
#define LOCKIT_HTTP_URI_HPP

#include <map>
#include <string>

namespace lockit {

/**
 * A URI split into its five parts.
 * The parts keep their escaping, so encode() gives back the input,
 * while the accessors return unescaped text.
 */
class Uri
{
public:
    /**
     * Splits a URI into parts. Leaves the object alone on failure.
     * @param strict Set to false for connection strings and other text
     * that may carry raw spaces or punctuation outside the scheme.
     */
    bool decode(const std::string &in, bool strict=true);
    std::string encode() const;

    /**
     * The scheme, lowercased.
     */
    std::string scheme() const;

    // user@server:port
    std::string authority() const;
    bool authorityOk() const { return authorityOk_; }

    std::string path() const;

    std::string query() const;
    bool queryOk() const { return queryOk_; }

    std::string fragment() const;
    bool fragmentOk() const { return fragmentOk_; }

    typedef std::map<std::string, std::string> QueryMap;

    /**
     * Splits the query on '&' and '='.
     * Missing values are empty, and a repeated key keeps its last value.
     */
    QueryMap queryDecode() const;

private:
    std::string scheme_;
    std::string authority_;
    std::string path_;
    std::string query_;
    std::string fragment_;

    bool authorityOk_ = false;
    bool queryOk_ = false;
    bool fragmentOk_ = false;
};

/**
 * Percent-encodes text for use as one URI component, the way
 * encodeURIComponent does: only letters, digits and -_.!~*'()
 * pass through. Other bytes become %XX with upper-case hex.
 */
std::string
uriEncodeComponent(const std::string &in);

} // namespace lockit

#endif
