/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_AUTH_SESSION_END_HPP
#define LOCKIT_AUTH_SESSION_END_HPP

#include <functional>

namespace lockit {

/**
 * A visitor's session, as provided by the web framework.
 */
class SessionHandle
{
public:
    virtual ~SessionHandle();

    /**
     * True if the session lives in a server-side store,
     * false for cookie sessions.
     */
    virtual bool storeBacked() const = 0;

    /**
     * Removes the session from its store, calling `done` when finished.
     */
    virtual void destroy(std::function<void()> done) = 0;

    /**
     * Drops the session data held with the request.
     */
    virtual void clear() = 0;
};

/**
 * Logs the visitor out, then calls `done`.
 */
void
sessionDestroy(SessionHandle &session, std::function<void()> done);

} // namespace lockit

#endif
