/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef LOCKIT_AUTH_QR_CODE_HPP
#define LOCKIT_AUTH_QR_CODE_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace lockit {

/**
 * A square QR symbol, one byte per module (1 is dark, 0 is light),
 * stored row by row.
 */
struct QrCode
{
    unsigned width = 0;
    DataChunk modules;

    bool dark(unsigned x, unsigned y) const
    {
        return modules[y * width + x];
    }

    /**
     * Draws the symbol with a quiet zone, two characters per module,
     * for display on a terminal.
     */
    std::string ascii() const;
};

/**
 * Encodes text (typically a provisioning URI) as a QR symbol.
 */
Status
qrEncode(QrCode &result, const std::string &text);

} // namespace lockit

#endif
