/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Config.hpp"

namespace lockit {

Status
LockitConfig::check() const
{
    if (member("loginRoute"))
        LOCKIT_CHECK(loginRouteOk());
    if (member("rest"))
        LOCKIT_CHECK(restOk());
    if (member("issuer"))
        LOCKIT_CHECK(issuerOk());
    if (member("otpWindow"))
        LOCKIT_CHECK(otpWindowSizeOk());
    if (member("otpStep"))
        LOCKIT_CHECK(otpStepOk());
    if (member("otpDigits"))
        LOCKIT_CHECK(otpDigitsOk());
    if (member("logFile"))
        LOCKIT_CHECK(logFileOk());

    if (otpWindowSize() < 0 || 1000 < otpWindowSize())
        return LOCKIT_ERROR(LOCKIT_CC_JSONError, "otpWindow must be 0-1000");
    if (otpStep() < 1 || 86400 < otpStep())
        return LOCKIT_ERROR(LOCKIT_CC_JSONError, "otpStep must be 1-86400");
    if (otpDigits() < 1 || 10 < otpDigits())
        return LOCKIT_ERROR(LOCKIT_CC_JSONError, "otpDigits must be 1-10");

    if (member("db"))
    {
        std::string url;
        LOCKIT_CHECK(databaseUrl(url));
    }

    return Status();
}

OtpWindow
LockitConfig::otpWindow() const
{
    return OtpWindow(otpWindowSize(), otpStep());
}

RestrictConfig
LockitConfig::restrictConfig() const
{
    return RestrictConfig(loginRoute(), rest());
}

Status
LockitConfig::databaseUrl(std::string &result) const
{
    json_t *db = member("db");
    if (!db)
        return LOCKIT_ERROR(LOCKIT_CC_JSONError, "No db setting");

    if (json_is_string(db))
    {
        result = json_string_value(db);
        return Status();
    }

    json_t *url = json_object_get(db, "url");
    if (!json_is_object(db) || !json_is_string(url))
        return LOCKIT_ERROR(LOCKIT_CC_JSONError,
            "The db setting must be a URI or an object with a url");

    result = json_string_value(url);
    return Status();
}

const char *
LockitConfig::databaseMember(const char *key) const
{
    json_t *value = json_object_get(member("db"), key);
    return json_is_string(value) ? json_string_value(value) : "";
}

std::string
LockitConfig::databaseName() const
{
    return databaseMember("name");
}

std::string
LockitConfig::databaseCollection() const
{
    return databaseMember("collection");
}

Status
LockitConfig::database(DatabaseInfo &result) const
{
    std::string url;
    LOCKIT_CHECK(databaseUrl(url));
    LOCKIT_CHECK(databaseResolve(result, url));
    return Status();
}

} // namespace lockit
