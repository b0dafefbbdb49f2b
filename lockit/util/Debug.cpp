/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include "FileIO.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <mutex>
#include <vector>

namespace lockit {

#define MAX_LOG_SIZE (1 << 19) // Rotate past 512 KiB

namespace {

/**
 * The optional on-disk copy of the log.
 * Once the file grows too large it becomes <path>.prev,
 * replacing any older one, and a fresh file starts.
 */
class LogFile
{
public:
    ~LogFile()
    {
        close();
    }

    Status
    open(const std::string &path)
    {
        close();
        path_ = path;
        return rotate();
    }

    void
    close()
    {
        if (file_)
            fclose(file_);
        file_ = nullptr;
    }

    void
    write(const std::string &line)
    {
        if (!file_)
            return;

        if (MAX_LOG_SIZE < ftell(file_))
        {
            // The log cannot report its own failures, so use stderr:
            Status s = rotate();
            if (!s)
            {
                fprintf(stderr, "%s\n", s.message().c_str());
                return;
            }
        }

        fwrite(line.data(), 1, line.size(), file_);
        fflush(file_);
    }

private:
    Status
    rotate()
    {
        close();
        if (fileExists(path_) && rename(path_.c_str(), (path_ + ".prev").c_str()))
            return LOCKIT_ERROR(LOCKIT_CC_SysError, "Cannot rotate " + path_);

        file_ = fopen(path_.c_str(), "w");
        if (!file_)
            return LOCKIT_ERROR(LOCKIT_CC_FileOpenError, "Cannot open " + path_);
        return Status();
    }

    std::string path_;
    FILE *file_ = nullptr;
};

std::mutex gLogMutex;
LogFile gLogFile;

} // namespace

Status
debugInitialize(const std::string &path)
{
#ifdef DEBUG
    std::lock_guard<std::mutex> lock(gLogMutex);
    LOCKIT_CHECK(gLogFile.open(path));
#else
    (void)path;
#endif
    return Status();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    gLogFile.close();
}

void LOCKIT_DebugLog(const char *format, ...)
{
#ifdef DEBUG
    // Timestamp:
    time_t now = time(nullptr);
    struct tm utc;
    gmtime_r(&now, &utc);
    char date[32];
    strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S Lockit: ", &utc);

    // Message:
    va_list args;
    va_start(args, format);
    int size = vsnprintf(nullptr, 0, format, args);
    va_end(args);
    if (size < 0)
        return;

    std::vector<char> message(size + 1);
    va_start(args, format);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    std::string line = date;
    line.append(message.data(), size);
    if (line.back() != '\n')
        line += '\n';

    std::lock_guard<std::mutex> lock(gLogMutex);
    fputs(line.c_str(), stdout);
    gLogFile.write(line);
#else
    (void)format;
#endif
}

} // namespace lockit
