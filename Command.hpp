/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <boost/exception/info.hpp>
#include <string>
#include <vector>

struct CommandError : virtual std::exception, virtual boost::exception { };

typedef boost::error_info<struct Info_CommandLine, std::string>
	CommandLine;
typedef boost::error_info<struct Info_CommandStatus, int>
	CommandStatus;

/**
 * The program and its arguments. The program is found through PATH.
 */
typedef std::vector<std::string>  CommandArgs;

/**
 * Runs a program and waits for it to finish. Its output goes wherever the
 * output of this process goes.
 * @return  The exit status of the program.
 * @throw CommandError  The program could not be started, or was ended by a
 *                      signal.
 */
int runCommand(const CommandArgs &args);

/**
 * Runs a program, waits for it to finish, and provides what it wrote to
 * its standard output.
 * @throw CommandError  The program could not be started, or did not exit
 *                      with a status of zero.
 */
std::string commandOutput(const CommandArgs &args);

/**
 * Joins the arguments into one string for messages.
 */
std::string commandLine(const CommandArgs &args);

#endif        //  #ifndef COMMAND_HPP
