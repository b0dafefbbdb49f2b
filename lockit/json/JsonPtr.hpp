/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_JSON_JSON_PTR_HPP
#define LOCKIT_JSON_JSON_PTR_HPP

#include "../util/Status.hpp"
#include <jansson.h>
#include <string>

namespace lockit {

/**
 * Holds one reference to a jansson value.
 * Copies share the value, so changes through one copy show in the others.
 */
class JsonPtr
{
public:
    ~JsonPtr();
    JsonPtr();
    JsonPtr(const JsonPtr &copy);
    JsonPtr(JsonPtr &&move);
    JsonPtr &operator=(JsonPtr other);

    /**
     * Adopts a new reference, such as the result of json_object().
     */
    explicit JsonPtr(json_t *root);

    void swap(JsonPtr &other);

    /**
     * A borrowed pointer to the root value, or nullptr.
     */
    json_t *get() const { return root_; }
    explicit operator bool() const { return root_; }

    /**
     * Parses a JSON file. Duplicate keys are an error,
     * since one of the two settings would be silently lost.
     */
    Status
    load(const std::string &filename);

    /**
     * Parses JSON text held in memory.
     */
    Status
    decode(const std::string &data);

    /**
     * Writes the value out with sorted keys.
     * An empty pointer encodes as "null".
     */
    std::string
    encode(bool compact=false) const;

protected:
    json_t *root_;
};

/**
 * Adds the standard constructors to JsonPtr child classes.
 */
#define LOCKIT_JSON_CONSTRUCTORS(This, Base) \
    This() {} \
    This(JsonPtr &&move): Base(std::move(move)) {} \
    This(const JsonPtr &copy): Base(copy) {}

} // namespace lockit

#endif
