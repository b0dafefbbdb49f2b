/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../lockit/Config.hpp"
#include "../lockit/util/Status.hpp"

/**
 * How much a command needs set up before it runs.
 */
enum class InitLevel
{
    none,       // Pure computation on the arguments
    config      // Needs the settings file
};

/**
 * State shared with the commands.
 */
struct Session
{
    lockit::LockitConfig config;
    std::string configPath;
};

#define COMMAND_PROTO \
    operator ()(Session &session, int argc, char *argv[])

class Command
{
public:
    virtual ~Command();
    virtual lockit::Status COMMAND_PROTO = 0;
    virtual InitLevel level() const = 0;
    virtual const char *name() const = 0;
    virtual const char *usage() const = 0;
    virtual const char *summary() const = 0;
};

/**
 * Constructing one of these adds a command to the table.
 */
class CommandRegistry
{
public:
    CommandRegistry(Command &command);

    /**
     * Returns nullptr if there is no such command.
     */
    static Command *
    find(const std::string &name);

    /**
     * Lists every command with its summary.
     */
    static void
    print();
};

/**
 * Defines and registers a command.
 * The command body follows in curly braces, and sees
 * `session`, `argc` and `argv` (with the command name removed).
 */
#define COMMAND(LEVEL, NAME, TEXT, USAGE, SUMMARY) \
    class NAME: public Command { \
        lockit::Status COMMAND_PROTO override; \
        InitLevel level() const override { return LEVEL; } \
        const char *name() const override { return TEXT; } \
        const char *usage() const override { return USAGE; } \
        const char *summary() const override { return SUMMARY; } \
    } implement##NAME; \
    CommandRegistry register##NAME(implement##NAME); \
    lockit::Status NAME::COMMAND_PROTO

/**
 * The usage line for a command, for argument errors and --help.
 */
std::string
helpString(const Command &command);

#endif
