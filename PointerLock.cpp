/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "PointerLock.hpp"
#include "Command.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/throw_exception.hpp>
#include <cstring>
#include <iostream>

static const char *sendEventsSchema = "org.gnome.desktop.peripherals.touchpad";
static const char *sendEventsKey =
	"/org/gnome/desktop/peripherals/touchpad/send-events";

void XinputPointerLock::acquire() {
	int status = runCommand(CommandArgs{ "xinput", "disable", devname });
	if (status) {
		std::cerr << "xinput could not disable " << devname << "; status " <<
		status << '.' << std::endl;
	}
}

void XinputPointerLock::release() {
	try {
		int status = runCommand(CommandArgs{ "xinput", "enable", devname });
		if (status) {
			std::cerr << "xinput could not enable " << devname << "; status " <<
			status << '.' << std::endl;
		}
	} catch (CommandError &) {
		std::cerr << "Failed to re-enable the touchpad:\n" <<
		boost::current_exception_diagnostic_information() << std::endl;
	}
}

std::string sendEventsValue(const std::string &raw) {
	std::string val = boost::algorithm::trim_copy(raw);
	if (val.empty()) {
		return "'enabled'";
	}
	return val;
}

bool knownSendEvents(const std::string &val) {
	return (val == "'enabled'") || (val == "'disabled'") ||
		(val == "'disabled-on-external-mouse'");
}

void GnomePointerLock::acquire() {
	prior = sendEventsValue(commandOutput(
		CommandArgs{ "gsettings", "get", sendEventsSchema, "send-events" }
	));
	if (!knownSendEvents(prior)) {
		BOOST_THROW_EXCEPTION(UnexpectedTouchpadState() <<
			TouchpadState(prior)
		);
	}
	int status = runCommand(
		CommandArgs{ "dconf", "write", sendEventsKey, "'disabled'" }
	);
	if (status) {
		std::cerr << "dconf could not disable the touchpad; status " <<
		status << '.' << std::endl;
	}
	held = true;
}

void GnomePointerLock::release() {
	if (!held) {
		return;
	}
	held = false;
	try {
		int status = runCommand(
			CommandArgs{ "dconf", "write", sendEventsKey, prior }
		);
		if (status) {
			std::cerr << "dconf could not restore the touchpad setting " <<
			prior << "; status " << status << '.' << std::endl;
		}
	} catch (CommandError &) {
		std::cerr << "Failed to restore the touchpad setting:\n" <<
		boost::current_exception_diagnostic_information() << std::endl;
	}
}

bool parseLockMode(const std::string &str, LockMode &mode) {
	static const struct {
		const char *name;
		LockMode mode;
	} modes[] = {
		{ "auto", LockMode::Auto },
		{ "xinput", LockMode::Xinput },
		{ "gnome", LockMode::Gnome },
		{ "grab", LockMode::Grab },
		{ "none", LockMode::None }
	};
	for (const auto &m : modes) {
		if (str == m.name) {
			mode = m.mode;
			return true;
		}
	}
	return false;
}

LockMode resolveLockMode(LockMode mode, const char *sessionType) {
	if (mode != LockMode::Auto) {
		return mode;
	}
	if (sessionType) {
		if (std::strcmp(sessionType, "wayland") == 0) {
			return LockMode::Gnome;
		} else if (std::strcmp(sessionType, "x11") == 0) {
			return LockMode::Xinput;
		}
	}
	// no desktop, or one that is not known; take the device for this process
	return LockMode::Grab;
}
