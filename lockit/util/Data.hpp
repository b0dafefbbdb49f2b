/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Byte buffers for keys, digests and encoded text.
 */

#ifndef LOCKIT_UTIL_DATA_HPP
#define LOCKIT_UTIL_DATA_HPP

#include <stddef.h>
#include <stdint.h>
#include <array>
#include <string>
#include <vector>

namespace lockit {

/**
 * A non-owning view of bytes held elsewhere.
 * Anything with data() and size() converts to one,
 * so secrets can be passed as strings, vectors or arrays alike.
 * The view must not outlive the container it came from.
 */
class DataSlice
{
public:
    DataSlice():
        data_(nullptr), size_(0)
    {}

    template<typename Container>
    DataSlice(const Container &container):
        data_(reinterpret_cast<const uint8_t *>(container.data())),
        size_(container.size())
    {}

    bool empty()            const { return !size_; }
    size_t size()           const { return size_; }
    const uint8_t *data()   const { return data_; }
    const uint8_t *begin()  const { return data_; }
    const uint8_t *end()    const { return data_ + size_; }

private:
    const uint8_t *data_;
    size_t size_;
};

/**
 * Copies the bytes into a string, for text kept in a byte buffer.
 */
std::string
toString(DataSlice slice);

/**
 * Fixed-size bytes, such as a digest.
 */
template<size_t Size> using DataArray = std::array<uint8_t, Size>;

/**
 * Owned bytes of any length, such as a secret key.
 */
typedef std::vector<uint8_t> DataChunk;

} // namespace lockit

#endif
