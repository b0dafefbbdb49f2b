/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <string.h>

Command::~Command()
{
}

typedef std::map<std::string, Command *> CommandMap;

/**
 * The command table, built on first use so registrations
 * from any translation unit find it constructed.
 */
static CommandMap &
commands()
{
    static CommandMap map;
    return map;
}

CommandRegistry::CommandRegistry(Command &command)
{
    if (!commands().insert(std::make_pair(command.name(), &command)).second)
        std::cerr << "warning: Duplicate command " << command.name() <<
            std::endl;
}

Command *
CommandRegistry::find(const std::string &name)
{
    auto i = commands().find(name);
    return commands().end() == i ? nullptr : i->second;
}

void
CommandRegistry::print()
{
    size_t width = 0;
    for (const auto &i: commands())
        width = std::max(width, strlen(i.second->name()));

    std::cout << "usage: lockit-cli [-c config] <command> [args...]" <<
        std::endl << std::endl << "commands:" << std::endl;
    for (const auto &i: commands())
        std::cout << "  " << std::left << std::setw(width + 2) <<
            i.second->name() << i.second->summary() << std::endl;
}

std::string
helpString(const Command &command)
{
    return std::string("usage: lockit-cli [-c config] ") +
        command.name() + command.usage();
}
