/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Database.hpp"
#include "../http/Uri.hpp"

namespace lockit {

struct AdapterEntry
{
    const char *scheme;
    const char *type;
    const char *adapter;
};

static const AdapterEntry adapters[] =
{
    {"http",     "couchdb",    "lockit-couchdb-adapter"},
    {"https",    "couchdb",    "lockit-couchdb-adapter"},
    {"mongodb",  "mongodb",    "lockit-mongodb-adapter"},
    {"postgres", "postgresql", "lockit-sql-adapter"},
    {"mysql",    "mysql",      "lockit-sql-adapter"},
    {"sqlite",   "sqlite",     "lockit-sql-adapter"}
};

Status
databaseResolve(DatabaseInfo &result, const std::string &uri)
{
    // Connection strings often carry raw passwords, so parse leniently:
    Uri parsed;
    if (!parsed.decode(uri, false))
        return LOCKIT_ERROR(LOCKIT_CC_UnrecognizedScheme,
            "The database setting is not a URI");

    const auto scheme = parsed.scheme();
    for (const auto &entry: adapters)
    {
        if (scheme == entry.scheme)
        {
            result.type = entry.type;
            result.adapter = entry.adapter;
            return Status();
        }
    }

    return LOCKIT_ERROR(LOCKIT_CC_UnrecognizedScheme,
        "No database adapter for scheme " + scheme);
}

} // namespace lockit
