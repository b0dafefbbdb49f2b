/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonPtr.hpp"
#include "../util/AutoFree.hpp"
#include "../util/Debug.hpp"
#include <stdlib.h>
#include <new>
#include <utility>

namespace lockit {

#define JSON_LOAD_FLAGS JSON_REJECT_DUPLICATES

static void
freeString(char *text)
{
    free(text);
}

static Status
parseError(const std::string &source, const json_error_t &error)
{
    return LOCKIT_ERROR(LOCKIT_CC_JSONError, source + ":" +
        std::to_string(error.line) + ":" + std::to_string(error.column) +
        ": " + error.text);
}

JsonPtr::~JsonPtr()
{
    json_decref(root_);
}

JsonPtr::JsonPtr():
    root_(nullptr)
{}

JsonPtr::JsonPtr(const JsonPtr &copy):
    root_(json_incref(copy.root_))
{}

JsonPtr::JsonPtr(JsonPtr &&move):
    root_(move.root_)
{
    move.root_ = nullptr;
}

JsonPtr &
JsonPtr::operator=(JsonPtr other)
{
    swap(other);
    return *this;
}

JsonPtr::JsonPtr(json_t *root):
    root_(root)
{}

void
JsonPtr::swap(JsonPtr &other)
{
    std::swap(root_, other.root_);
}

Status
JsonPtr::load(const std::string &filename)
{
    LOCKIT_DebugLog("Loading settings from %s", filename.c_str());

    json_error_t error;
    JsonPtr out(json_load_file(filename.c_str(), JSON_LOAD_FLAGS, &error));
    if (!out)
        return parseError(filename, error);

    swap(out);
    return Status();
}

Status
JsonPtr::decode(const std::string &data)
{
    json_error_t error;
    JsonPtr out(json_loadb(data.data(), data.size(), JSON_LOAD_FLAGS, &error));
    if (!out)
        return parseError("<text>", error);

    swap(out);
    return Status();
}

std::string
JsonPtr::encode(bool compact) const
{
    if (!root_)
        return "null";

    const size_t flags = JSON_SORT_KEYS |
        (compact ? JSON_COMPACT : JSON_INDENT(4));
    AutoFree<char, freeString> text(json_dumps(root_, flags));
    if (!text)
        throw std::bad_alloc();
    return text.get();
}

} // namespace lockit
