/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonObject.hpp"

namespace lockit {

Status
JsonObject::load(const std::string &filename)
{
    JsonObject out;
    LOCKIT_CHECK(out.JsonPtr::load(filename));
    LOCKIT_CHECK(out.checkRoot(filename));

    swap(out);
    return Status();
}

Status
JsonObject::decode(const std::string &data)
{
    JsonObject out;
    LOCKIT_CHECK(out.JsonPtr::decode(data));
    LOCKIT_CHECK(out.checkRoot("<text>"));

    swap(out);
    return Status();
}

json_t *
JsonObject::member(const char *key) const
{
    return json_object_get(root_, key);
}

Status
JsonObject::expect(const char *key, bool ok, const char *type) const
{
    if (!member(key))
        return LOCKIT_ERROR(LOCKIT_CC_JSONError,
            std::string("Missing setting \"") + key + "\"");
    if (!ok)
        return LOCKIT_ERROR(LOCKIT_CC_JSONError,
            std::string("Setting \"") + key + "\" is not of type " + type);
    return Status();
}

Status
JsonObject::setMember(const char *key, json_t *value)
{
    if (!root_)
        root_ = json_object();
    if (!root_ || !value)
    {
        json_decref(value);
        return LOCKIT_ERROR(LOCKIT_CC_JSONError,
            std::string("Cannot store setting \"") + key + "\"");
    }

    if (json_object_set_new(root_, key, value) < 0)
        return LOCKIT_ERROR(LOCKIT_CC_JSONError,
            std::string("Cannot store setting \"") + key + "\"");
    return Status();
}

Status
JsonObject::checkRoot(const std::string &source) const
{
    if (!json_is_object(root_))
        return LOCKIT_ERROR(LOCKIT_CC_JSONError,
            source + ": settings must be a JSON object");
    return Status();
}

} // namespace lockit
