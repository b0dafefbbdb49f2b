/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_JSON_JSON_OBJECT_HPP
#define LOCKIT_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace lockit {

/**
 * A JsonPtr whose root is an object, read through named members.
 * Subclasses declare their members with the LOCKIT_JSON_* macros below.
 */
class JsonObject:
    public JsonPtr
{
public:
    LOCKIT_JSON_CONSTRUCTORS(JsonObject, JsonPtr)

    Status
    load(const std::string &filename);

    Status
    decode(const std::string &data);

protected:
    /**
     * A borrowed pointer to a member, or nullptr if it is missing.
     */
    json_t *
    member(const char *key) const;

    /**
     * Fails unless the member exists and passed the type test.
     */
    Status
    expect(const char *key, bool ok, const char *type) const;

    /**
     * Stores a member, creating the root object if needed.
     * Takes ownership of the value.
     */
    Status
    setMember(const char *key, json_t *value);

private:
    Status
    checkRoot(const std::string &source) const;
};

#define LOCKIT_JSON_VALUE(name, key, Type, type, fallback) \
    Type name() const \
    { \
        json_t *value = member(key); \
        return json_is_##type(value) ? json_##type##_value(value) : fallback; \
    } \
    lockit::Status name##Ok() const \
    { \
        return expect(key, json_is_##type(member(key)), #type); \
    } \
    lockit::Status name##Set(Type value) \
    { \
        return setMember(key, json_##type(value)); \
    }

#define LOCKIT_JSON_STRING(name, key, fallback) \
    LOCKIT_JSON_VALUE(name, key, const char *, string, fallback)

#define LOCKIT_JSON_BOOLEAN(name, key, fallback) \
    LOCKIT_JSON_VALUE(name, key, bool, boolean, fallback)

#define LOCKIT_JSON_INTEGER(name, key, fallback) \
    LOCKIT_JSON_VALUE(name, key, json_int_t, integer, fallback)

} // namespace lockit

#endif
