/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "PermissionFix.hpp"
#include "Command.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <istream>
#include <ostream>

bool acceptsFix(const std::string &answer) {
	std::string ans = boost::algorithm::to_lower_copy(
		boost::algorithm::trim_copy(answer)
	);
	return ans.empty() || (ans == "y") || (ans == "ye") || (ans == "yes") ||
		(ans == "ok") || (ans == "sure");
}

bool askToFix(std::istream &in, std::ostream &out) {
	out << "Touchpad access is currently restricted. Would you like to "
	"unrestrict it?\n[Yes]/no: " << std::flush;
	std::string answer;
	if (!std::getline(in, answer)) {
		// end of input is not consent
		return false;
	}
	return acceptsFix(answer);
}

int runPermissionFix(const std::string &helper) {
	return runCommand(CommandArgs{ "pkexec", helper });
}
