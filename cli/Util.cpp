/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"
#include <errno.h>
#include <stdlib.h>

using namespace lockit;

Status
parseInteger(long long &result, const char *text)
{
    char *end = nullptr;
    errno = 0;
    long long value = strtoll(text, &end, 10);
    if (errno || end == text || *end)
        return LOCKIT_ERROR(LOCKIT_CC_Error,
            std::string("Not a number: ") + text);

    result = value;
    return Status();
}

Status
parseTime(time_t &result, const char *text)
{
    if (!text)
    {
        result = time(nullptr);
        return Status();
    }

    long long value;
    LOCKIT_CHECK(parseInteger(value, text));
    if (value < 0)
        return LOCKIT_ERROR(LOCKIT_CC_Error, "Times start at the Unix epoch");

    result = static_cast<time_t>(value);
    return Status();
}
