/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "Touchpad.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>
#include <algorithm>
#include <utility>
#include <vector>

bool isTouchpad(const Evdev &ev) {
	return ev.hasEventCode(EV_ABS, ABS_X) &&
		ev.hasEventCode(EV_ABS, ABS_Y) &&
		ev.hasEventCode(EV_KEY, BTN_TOOL_FINGER) &&
		!ev.hasEventCode(EV_KEY, BTN_TOOL_PEN) &&
		!ev.hasProperty(INPUT_PROP_DIRECT);
}

std::string touchpadName(const Evdev &ev) {
	return boost::algorithm::trim_copy_if(
		ev.name(),
		boost::algorithm::is_any_of("\"")
	);
}

typedef std::pair<unsigned int, std::string>  EventNode;

/**
 * Lists the eventN files in the directory sorted by N.
 */
static std::vector<EventNode> eventNodes(const std::string &dir) {
	std::vector<EventNode> nodes;
	boost::filesystem::directory_iterator iter(dir), end;
	for (; iter != end; ++iter) {
		std::string fname = iter->path().filename().string();
		if (!boost::algorithm::starts_with(fname, "event")) {
			continue;
		}
		unsigned int num;
		if (boost::conversion::try_lexical_convert(fname.substr(5), num)) {
			nodes.emplace_back(num, iter->path().string());
		}
	}
	std::sort(nodes.begin(), nodes.end());
	return nodes;
}

EvdevShared findTouchpad(const std::string &dir) {
	std::string restricted;
	for (const EventNode &node : eventNodes(dir)) {
		EvdevShared ev;
		try {
			ev = std::make_shared<Evdev>(node.second);
		} catch (EvdevPermissionError &) {
			if (restricted.empty()) {
				restricted = node.second;
			}
			continue;
		} catch (EvdevError &) {
			// not an input device, or gone already
			continue;
		}
		if (isTouchpad(*ev)) {
			return ev;
		}
	}
	if (!restricted.empty()) {
		BOOST_THROW_EXCEPTION(EvdevPermissionError() <<
			boost::errinfo_file_name(restricted)
		);
	}
	BOOST_THROW_EXCEPTION(NoTouchpadError());
}

Calibration calibrate(const Evdev &ev) {
	return calibrate(ev.absInfo(ABS_X), ev.absInfo(ABS_Y));
}
