/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "../lockit/util/Debug.hpp"
#include "../lockit/util/FileIO.hpp"
#include <iostream>
#include <getopt.h>
#include <stdlib.h>

using namespace lockit;

struct Options
{
    std::string configPath;
    bool help = false;
};

/**
 * ~/.config/lockit/lockit.conf, honoring XDG_CONFIG_HOME.
 */
static std::string
defaultConfigPath()
{
    const char *xdg = getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return std::string(xdg) + "/lockit/lockit.conf";

    const char *home = getenv("HOME");
    return std::string(home && *home ? home : "") + "/.config/lockit/lockit.conf";
}

/**
 * Consumes the options in front of the command name.
 */
static Status
parseOptions(Options &result, int &argc, char **&argv)
{
    static const struct option longOptions[] =
    {
        {"config",  required_argument, nullptr, 'c'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    Options out;
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "+c:h", longOptions, nullptr)))
    {
        switch (c)
        {
        case 'c':
            out.configPath = optarg;
            break;
        case 'h':
            out.help = true;
            break;
        case '?':
            if ('c' == optopt)
                return LOCKIT_ERROR(LOCKIT_CC_Error, "-c needs a file name");
            return LOCKIT_ERROR(LOCKIT_CC_Error,
                std::string("Unknown option '-") + char(optopt) + "'");
        default:
            return LOCKIT_ERROR(LOCKIT_CC_Error, "Bad command line");
        }
    }

    argc -= optind;
    argv += optind;
    result = out;
    return Status();
}

/**
 * Reads and checks the settings. A file named on the command line
 * must exist, while a missing default file just means defaults.
 */
static Status
loadConfig(Session &session, const Options &options)
{
    session.configPath = options.configPath;
    if (session.configPath.empty() && fileExists(defaultConfigPath()))
        session.configPath = defaultConfigPath();

    if (!session.configPath.empty())
        LOCKIT_CHECK(session.config.load(session.configPath));
    LOCKIT_CHECK(session.config.check());

    if (session.config.logFileOk())
        LOCKIT_CHECK(debugInitialize(session.config.logFile()));
    return Status();
}

static Status
run(int argc, char *argv[])
{
    Options options;
    LOCKIT_CHECK(parseOptions(options, argc, argv));

    if (argc < 1)
    {
        CommandRegistry::print();
        return Status();
    }

    Command *command = CommandRegistry::find(argv[0]);
    if (!command)
        return LOCKIT_ERROR(LOCKIT_CC_Error,
            std::string("Unknown command ") + argv[0]);
    if (options.help)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    Session session;
    if (InitLevel::config <= command->level())
        LOCKIT_CHECK(loadConfig(session, options));

    Status s = (*command)(session, argc - 1, argv + 1);
    debugTerminate();
    return s;
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
