/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_CRYPTO_RANDOM_HPP
#define LOCKIT_CRYPTO_RANDOM_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace lockit {

/**
 * Creates a buffer of random data.
 */
Status
randomData(DataChunk &result, size_t size);

} // namespace lockit

#endif
