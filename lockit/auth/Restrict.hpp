/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Keeps visitors who are not logged in away from private routes.
 */

#ifndef LOCKIT_AUTH_RESTRICT_HPP
#define LOCKIT_AUTH_RESTRICT_HPP

#include <string>

namespace lockit {

#define LOCKIT_DEFAULT_LOGIN_ROUTE "/login"

struct RestrictConfig
{
    RestrictConfig(const std::string &loginRoute=LOCKIT_DEFAULT_LOGIN_ROUTE,
        bool rest=false):
        loginRoute(loginRoute), rest(rest)
    {}

    std::string loginRoute; // Where the login form lives
    bool rest;              // JSON clients get a bare 401, not a redirect
};

/**
 * The parts of an incoming HTTP request the gate looks at.
 */
class Request
{
public:
    virtual ~Request();

    /**
     * True if the request's session belongs to a logged-in user.
     */
    virtual bool loggedIn() const = 0;

    /**
     * The path and query the visitor asked for.
     */
    virtual std::string url() const = 0;
};

struct RestrictResult
{
    enum Action
    {
        proceed,
        unauthorized,
        redirect
    };

    Action action;
    int status;             // HTTP status to send, 0 to proceed
    std::string location;   // Redirect target, if any
};

/**
 * Decides what to do with a request for a private route.
 * Redirects carry the original url in a "redirect" query parameter,
 * so the login route can send the user back afterwards.
 */
RestrictResult
restrictRoute(const RestrictConfig &config, const Request &request);

} // namespace lockit

#endif
