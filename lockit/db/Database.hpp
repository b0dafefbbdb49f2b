/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Picks the storage adapter matching a database connection string.
 */

#ifndef LOCKIT_DB_DATABASE_HPP
#define LOCKIT_DB_DATABASE_HPP

#include "../util/Status.hpp"

namespace lockit {

struct DatabaseInfo
{
    std::string type;       // couchdb, mongodb, postgresql, mysql or sqlite
    std::string adapter;    // Name of the adapter package for that type
};

/**
 * Maps a connection URI to its database type by scheme:
 * http(s) is CouchDB, while mongodb, postgres, mysql and sqlite
 * name themselves. Anything else is LOCKIT_CC_UnrecognizedScheme.
 */
Status
databaseResolve(DatabaseInfo &result, const std::string &uri);

} // namespace lockit

#endif
