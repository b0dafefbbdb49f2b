/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <sys/stat.h>

namespace lockit {

bool
fileExists(const std::string &path)
{
    struct stat statInfo;
    return 0 == stat(path.c_str(), &statInfo);
}

} // namespace lockit
