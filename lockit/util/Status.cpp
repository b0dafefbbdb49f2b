/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>

namespace lockit {

Status::Status() :
    value_(LOCKIT_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tLOCKIT_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::ostringstream ss;
        ss << *this;
        LOCKIT_DebugLog("%s", ss.str().c_str());
    }
    return *this;
}

static const char *
codeName(tLOCKIT_CC value)
{
    switch (value)
    {
    case LOCKIT_CC_Ok:                  return "ok";
    case LOCKIT_CC_Error:               return "error";
    case LOCKIT_CC_SysError:            return "system error";
    case LOCKIT_CC_FileOpenError:       return "file open error";
    case LOCKIT_CC_FileReadError:       return "file read error";
    case LOCKIT_CC_JSONError:           return "settings error";
    case LOCKIT_CC_InvalidEncoding:     return "invalid encoding";
    case LOCKIT_CC_InvalidSecret:       return "invalid secret";
    case LOCKIT_CC_UnrecognizedScheme:  return "unrecognized scheme";
    }
    return "unknown error";
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output << s.file() << ":" << s.line() << ": " << s.function() <<
        ": " << codeName(s.value()) << " " << s.value() << ": " << s.message();
    return output;
}

} // namespace lockit
