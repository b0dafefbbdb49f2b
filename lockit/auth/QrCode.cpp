/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "QrCode.hpp"
#include "../util/AutoFree.hpp"
#include "../util/Debug.hpp"
#include <qrencode.h>

namespace lockit {

#define QR_QUIET_ZONE 2 // Modules of light border around the symbol

std::string
QrCode::ascii() const
{
    const unsigned size = width + 2 * QR_QUIET_ZONE;
    std::string out;
    out.reserve(size * (2 * size + 1));

    for (unsigned y = 0; y < size; ++y)
    {
        for (unsigned x = 0; x < size; ++x)
        {
            bool on =
                QR_QUIET_ZONE <= x && x < width + QR_QUIET_ZONE &&
                QR_QUIET_ZONE <= y && y < width + QR_QUIET_ZONE &&
                dark(x - QR_QUIET_ZONE, y - QR_QUIET_ZONE);
            out += on ? "##" : "  ";
        }
        out += '\n';
    }
    return out;
}

Status
qrEncode(QrCode &result, const std::string &text)
{
    LOCKIT_DebugLog("Encoding QR code of %u bytes",
        static_cast<unsigned>(text.size()));

    AutoFree<QRcode, QRcode_free>
    qr(QRcode_encodeString(text.c_str(), 0, QR_ECLEVEL_L, QR_MODE_8, 1));
    if (!qr)
        return LOCKIT_ERROR(LOCKIT_CC_Error, "Unable to create QR code");

    QrCode out;
    out.width = qr->width;
    out.modules.resize(out.width * out.width);
    for (size_t i = 0; i < out.modules.size(); i++)
        out.modules[i] = qr->data[i] & 0x1;

    result = std::move(out);
    return Status();
}

} // namespace lockit
