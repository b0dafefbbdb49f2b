/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * The settings file shared by the Lockit routes and tools.
 */

#ifndef LOCKIT_CONFIG_HPP
#define LOCKIT_CONFIG_HPP

#include "auth/Provisioning.hpp"
#include "auth/Restrict.hpp"
#include "crypto/OtpKey.hpp"
#include "db/Database.hpp"
#include "json/JsonObject.hpp"

namespace lockit {

/**
 * A JSON settings object. Every key is optional:
 *
 *  {
 *      "loginRoute": "/login",
 *      "rest": false,
 *      "issuer": "Lockit",
 *      "otpWindow": 6,
 *      "otpStep": 30,
 *      "otpDigits": 6,
 *      "db": "postgres://127.0.0.1:5432/"
 *          or {"url": "...", "name": "users", "collection": "my_user_table"},
 *      "logFile": "/var/log/lockit.log"
 *  }
 */
struct LockitConfig:
    public JsonObject
{
    LOCKIT_JSON_CONSTRUCTORS(LockitConfig, JsonObject)

    LOCKIT_JSON_STRING(loginRoute, "loginRoute", LOCKIT_DEFAULT_LOGIN_ROUTE)
    LOCKIT_JSON_BOOLEAN(rest, "rest", false)
    LOCKIT_JSON_STRING(issuer, "issuer", LOCKIT_DEFAULT_ISSUER)
    LOCKIT_JSON_INTEGER(otpWindowSize, "otpWindow", 6)
    LOCKIT_JSON_INTEGER(otpStep, "otpStep", 30)
    LOCKIT_JSON_INTEGER(otpDigits, "otpDigits", 6)
    LOCKIT_JSON_STRING(logFile, "logFile", nullptr)

    /**
     * Verifies that every key present has a usable type and range.
     */
    Status
    check() const;

    OtpWindow
    otpWindow() const;

    RestrictConfig
    restrictConfig() const;

    /**
     * Reads the "db" setting, written either as a bare connection URI
     * or as an object with a "url" member.
     */
    Status
    databaseUrl(std::string &result) const;

    /**
     * The table or collection names from an object-style "db" setting.
     */
    std::string databaseName() const;
    std::string databaseCollection() const;

    /**
     * Resolves the "db" setting to a database type and adapter.
     */
    Status
    database(DatabaseInfo &result) const;

private:
    const char *
    databaseMember(const char *key) const;
};

} // namespace lockit

#endif
