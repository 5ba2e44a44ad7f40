/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "Session.hpp"
#include "Options.hpp"
#include "Touchpad.hpp"
#include "PermissionFix.hpp"
#include "Command.hpp"
#include <iostream>
#include <cstdlib>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/exception/get_error_info.hpp>
#include <boost/program_options.hpp>

// used to log intput events for debugging
void logEv(EventTypeCode tc, std::int32_t v) {
	std::cerr << "Got event " << tc.typeName() << ':' << tc.codeName() <<
	" with value " << v << std::endl;
}

void logReport(const Report &r) {
	std::cerr << "Report " << r << std::endl;
}

// the coordinates are the output of the program
void printReport(const Report &r) {
	if (r.moved()) {
		std::cout << *r.pos.x << ' ' << *r.pos.y << std::endl;
	}
}

/**
 * Reports an inaccessible touchpad and offers to fix the problem.
 */
int permissionFailure(const Options &opts) {
	std::cerr << "Failed to access touchpad!" << std::endl;
	if (opts.prompt && isatty(STDIN_FILENO)) {
		if (askToFix(std::cin, std::cerr)) {
			try {
				int status = runPermissionFix(opts.fixhelper);
				if (status) {
					std::cerr << "The fix failed with status " << status <<
					'.' << std::endl;
				}
			} catch (CommandError &) {
				std::cerr << "Could not run pkexec:\n" <<
				boost::current_exception_diagnostic_information() << std::endl;
			}
		} else {
			std::cerr << "Canceled." << std::endl;
		}
	}
	return 1;
}

int main(int argc, char *argv[]) {
	Options opts;
	try {
		int result = parseOptions(argc, argv, opts, std::cout, std::cerr);
		if (result >= 0) {
			return result;
		}
		EvdevShared touchpad;
		if (opts.devpath.empty()) {
			touchpad = findTouchpad();
		} else {
			touchpad = std::make_shared<Evdev>(opts.devpath);
		}
		std::cerr << "Using touchpad: " << touchpadName(*touchpad) << std::endl;
		Calibration cal = calibrate(*touchpad);
		if (opts.verbose) {
			std::cerr << "X range " << cal.x.min() << " to " << cal.x.max() <<
			", Y range " << cal.y.min() << " to " << cal.y.max() << std::endl;
		}
		Session session(touchpad, cal);
		if (opts.verbose) {
			session.reports().inputConnect(&logEv);
			session.reports().reportConnect(&logReport);
		}
		session.reports().reportConnect(&printReport);
		std::unique_ptr<PointerLock> lock = makePointerLock(
			resolveLockMode(opts.lock, std::getenv("XDG_SESSION_TYPE")),
			touchpad,
			touchpadName(*touchpad)
		);
		if (opts.verbose) {
			std::cerr << "Using " << lock->name() << " pointer lock." <<
			std::endl;
		}
		Session::End end = session.run(*lock);
		if (opts.verbose) {
			std::cerr << ((end == Session::Cancelled) ?
				"Stopped by button press" : "Interrupted") << " after " <<
				session.reports().reportCount() << " reports." << std::endl;
		}
		return 0;
	} catch (boost::program_options::error &pe) {
		std::cerr << pe.what() << std::endl;
		return 1;
	} catch (EvdevPermissionError &) {
		return permissionFailure(opts);
	} catch (NoTouchpadError &) {
		std::cerr << "No touchpad found" << std::endl;
		return 1;
	} catch (EvdevFileOpenError &efoe) {
		const std::string *fname = boost::get_error_info<boost::errinfo_file_name>(efoe);
		std::cerr << "Failed to open " << (fname ? *fname : opts.devpath) <<
		'.' << std::endl;
		return 1;
	} catch (CalibrationError &) {
		std::cerr << "The touchpad does not report a usable position range:\n" <<
		boost::current_exception_diagnostic_information() << std::endl;
		return 2;
	} catch (UnexpectedTouchpadState &uts) {
		const std::string *state = boost::get_error_info<TouchpadState>(uts);
		std::cerr << "Unexpected touchpad state: \"" << (state ? *state : "") <<
		"\", are you using Gnome?" << std::endl;
		return 1;
	} catch (...) {
		std::cerr << "Program failed:\n" <<
		boost::current_exception_diagnostic_information()
		<< std::endl;
		return 3;
	}
}
