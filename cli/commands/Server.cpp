/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../lockit/auth/Restrict.hpp"
#include "../../lockit/db/Database.hpp"
#include <iostream>

using namespace lockit;

namespace {

/**
 * A request made up from the command line.
 */
class FakeRequest:
    public Request
{
public:
    FakeRequest(const std::string &url, bool loggedIn):
        url_(url), loggedIn_(loggedIn)
    {}

    bool loggedIn() const override { return loggedIn_; }
    std::string url() const override { return url_; }

private:
    std::string url_;
    bool loggedIn_;
};

} // namespace

COMMAND(InitLevel::config, DbResolve, "db-resolve",
        " [uri]", "name the storage adapter for a database")
{
    if (1 < argc)
        return LOCKIT_ERROR(LOCKIT_CC_Error, helpString(*this));

    DatabaseInfo info;
    if (argc)
    {
        LOCKIT_CHECK(databaseResolve(info, argv[0]));
    }
    else
    {
        LOCKIT_CHECK(session.config.database(info));
        auto name = session.config.databaseName();
        auto collection = session.config.databaseCollection();
        if (!name.empty())
            std::cout << "name: " << name << std::endl;
        if (!collection.empty())
            std::cout << "collection: " << collection << std::endl;
    }

    std::cout << "type: " << info.type << std::endl;
    std::cout << "adapter: " << info.adapter << std::endl;

    return Status();
}

COMMAND(InitLevel::config, RestrictCheck, "restrict-check",
        " <url> <logged-in 0/1>", "show what the login gate does with a request")
{
    if (argc != 2)
        return LOCKIT_ERROR(LOCKIT_CC_Error, helpString(*this));

    long long loggedIn;
    LOCKIT_CHECK(parseInteger(loggedIn, argv[1]));

    FakeRequest request(argv[0], 0 != loggedIn);
    auto result = restrictRoute(session.config.restrictConfig(), request);
    switch (result.action)
    {
    case RestrictResult::proceed:
        std::cout << "proceed" << std::endl;
        break;
    case RestrictResult::unauthorized:
        std::cout << result.status << " unauthorized" << std::endl;
        break;
    case RestrictResult::redirect:
        std::cout << result.status << " redirect " <<
            result.location << std::endl;
        break;
    }

    return Status();
}
