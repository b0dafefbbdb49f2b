/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_UTIL_AUTO_FREE_HPP
#define LOCKIT_UTIL_AUTO_FREE_HPP

namespace lockit {

/**
 * Owns a C-library object and releases it with the library's own
 * free function when going out of scope.
 */
template<typename T, void (*Free)(T *)>
class AutoFree
{
public:
    ~AutoFree()
    {
        if (p_)
            Free(p_);
    }

    explicit AutoFree(T *p=nullptr):
        p_(p)
    {}

    AutoFree(const AutoFree &) = delete;
    AutoFree &operator=(const AutoFree &) = delete;

    T *get() const { return p_; }
    T *operator->() const { return p_; }
    explicit operator bool() const { return p_; }

private:
    T *p_;
};

} // namespace lockit

#endif
