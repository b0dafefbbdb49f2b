/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef LOCKIT_UTIL_STATUS_HPP
#define LOCKIT_UTIL_STATUS_HPP

#include <ostream>
#include <string>

namespace lockit {

/**
 * Lockit Condition Codes
 *
 * Every fallible Lockit function reports one of these.
 * LOCKIT_CC_Ok indicates that there was no issue.
 * All other values indicate some issue.
 */
typedef enum eLOCKIT_CC
{
    /** The function completed without an error */
    LOCKIT_CC_Ok = 0,
    /** An error occured */
    LOCKIT_CC_Error = 1,
    /** The operating system or a library failed */
    LOCKIT_CC_SysError = 2,
    /** Could not open file */
    LOCKIT_CC_FileOpenError = 3,
    /** Could not read from file */
    LOCKIT_CC_FileReadError = 4,
    /** JSON parsing or type error */
    LOCKIT_CC_JSONError = 5,
    /** Text is not valid base32 (or base16) */
    LOCKIT_CC_InvalidEncoding = 6,
    /** The OTP secret is empty or unusable */
    LOCKIT_CC_InvalidSecret = 7,
    /** The database URI scheme has no known adapter */
    LOCKIT_CC_UnrecognizedScheme = 8
} tLOCKIT_CC;

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tLOCKIT_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tLOCKIT_CC value()          const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == LOCKIT_CC_Ok; }

    /**
     * Writes the status to the debug log if it represents an error.
     * Returns the status unchanged, so it can be checked afterwards.
     */
    const Status &log() const;

private:
    // Error information:
    tLOCKIT_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define LOCKIT_ERROR(value, message) \
    lockit::Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define LOCKIT_CHECK(f) \
    do { \
        lockit::Status s = (f); \
        if (!s) return s; \
    } while (false)

} // namespace lockit

#endif
