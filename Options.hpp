/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include "PointerLock.hpp"
#include <iosfwd>
#include <string>

/**
 * The settings given on the command line.
 */
struct Options {
	/**
	 * The touchpad device file; empty to search for one.
	 */
	std::string devpath;
	std::string lockname;
	/**
	 * The script pkexec runs to fix the touchpad's access rights.
	 */
	std::string fixhelper;
	LockMode lock = LockMode::Auto;
	bool verbose = false;
	bool prompt = true;
};

/**
 * Reads the command line.
 * @param out  Where the help message goes.
 * @param err  Where complaints about the options go.
 * @return  A negative number to run the program, or the exit status to
 *          use without running.
 * @throw boost::program_options::error  The command line is malformed.
 */
int parseOptions(
	int argc,
	const char *const argv[],
	Options &opts,
	std::ostream &out,
	std::ostream &err
);

#endif        //  #ifndef OPTIONS_HPP
