/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Utilities and helpers shared between commands.
 */

#ifndef CLI_UTIL_HPP
#define CLI_UTIL_HPP

#include "../lockit/util/Status.hpp"
#include <time.h>

/**
 * Reads a whole decimal number, rejecting trailing junk.
 */
lockit::Status
parseInteger(long long &result, const char *text);

/**
 * Reads a Unix timestamp, or takes the current time if `text` is null.
 */
lockit::Status
parseTime(time_t &result, const char *text);

#endif
