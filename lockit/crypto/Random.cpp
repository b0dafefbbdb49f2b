/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/rand.h>

namespace lockit {

Status
randomData(DataChunk &result, size_t size)
{
    DataChunk out(size);

    if (!out.empty() && RAND_bytes(out.data(), out.size()) != 1)
        return LOCKIT_ERROR(LOCKIT_CC_SysError, "Random data generation failed");

    result = std::move(out);
    return Status();
}

} // namespace lockit
