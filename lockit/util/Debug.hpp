/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_UTIL_DEBUG_HPP
#define LOCKIT_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define LOCKIT_DebugLevel(level, ...)   \
{                                       \
    if (DEBUG_LEVEL >= level)           \
    {                                   \
        LOCKIT_DebugLog(__VA_ARGS__);   \
    }                                   \
}

namespace lockit {

/**
 * Starts mirroring the debug log into a file.
 * The previous log, if any, is kept next to it with a ".prev" suffix.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

void LOCKIT_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace lockit

#endif
