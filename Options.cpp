/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "Options.hpp"
#include <boost/program_options.hpp>
#include <ostream>

#ifndef TOUCHDRAW_FIX_HELPER
#define TOUCHDRAW_FIX_HELPER "/usr/share/touchdraw/fix-permissions.sh"
#endif

int parseOptions(
	int argc,
	const char *const argv[],
	Options &opts,
	std::ostream &out,
	std::ostream &err
) {
	boost::program_options::options_description optdesc("");
	optdesc.add_options()
		( // help info
			"help,h",
			"Show this help message"
		)
		( // the device file to use
			"device,d",
			boost::program_options::value<std::string>(&opts.devpath),
			"Specify the touchpad device file instead of searching for one"
		)
		( // how to keep the touchpad from moving the pointer
			"lock,l",
			boost::program_options::value<std::string>(&opts.lockname)->
				default_value("auto"),
			"How to stop the touchpad from moving the pointer: auto, xinput,"
			" gnome, grab, or none"
		)
		( // debugging output
			"verbose,v",
			"Log input events and reports to stderr"
		)
		( // for non-interactive use
			"no-prompt",
			"Do not offer to fix the touchpad's access rights"
		)
		( // permission fixing script
			"fix-helper",
			boost::program_options::value<std::string>(&opts.fixhelper)->
				default_value(TOUCHDRAW_FIX_HELPER),
			"The script run by pkexec to fix the touchpad's access rights"
		)
	;
	boost::program_options::positional_options_description posoptdesc;
	// --device or -d doesn't need to be specified if the file is the last
	// argument given to the program
	posoptdesc.add("device", 1);
	boost::program_options::variables_map vm;
	boost::program_options::store(
		boost::program_options::command_line_parser(argc, argv).
		options(optdesc).positional(posoptdesc).run(),
		vm
	);
	boost::program_options::notify(vm);
	if (vm.count("help")) {
		out << "Touchdraw - reports touchpad contact positions for "
		"drawing.\nPress a touchpad button or Ctrl-C to stop.\n" <<
		argv[0] << " [options] [device file]\n" << optdesc << std::endl;
		return 0;
	}
	if (!parseLockMode(opts.lockname, opts.lock)) {
		err << "Unknown lock type: " << opts.lockname << std::endl;
		return 1;
	}
	opts.verbose = vm.count("verbose") > 0;
	opts.prompt = vm.count("no-prompt") == 0;
	return -1;
}
