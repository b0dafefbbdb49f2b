/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "SessionEnd.hpp"

namespace lockit {

SessionHandle::~SessionHandle()
{
}

void
sessionDestroy(SessionHandle &session, std::function<void()> done)
{
    if (session.storeBacked())
        return session.destroy(std::move(done));

    session.clear();
    if (done)
        done();
}

} // namespace lockit
