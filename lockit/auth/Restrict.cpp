/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Restrict.hpp"
#include "../http/Uri.hpp"
#include "../util/Debug.hpp"

namespace lockit {

Request::~Request()
{
}

RestrictResult
restrictRoute(const RestrictConfig &config, const Request &request)
{
    RestrictResult out;
    out.action = RestrictResult::proceed;
    out.status = 0;

    if (request.loggedIn())
        return out;

    if (config.rest)
    {
        out.action = RestrictResult::unauthorized;
        out.status = 401;
        return out;
    }

    const std::string route = config.loginRoute.empty() ?
        LOCKIT_DEFAULT_LOGIN_ROUTE : config.loginRoute;
    const auto url = request.url();
    LOCKIT_DebugLevel(2, "Redirecting %s to %s", url.c_str(), route.c_str());

    out.action = RestrictResult::redirect;
    out.status = 302;
    out.location = route + "?redirect=" + uriEncodeComponent(url);
    return out;
}

} // namespace lockit
