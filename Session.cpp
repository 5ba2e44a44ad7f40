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
#include "SignalWatch.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/throw_exception.hpp>
#include <iostream>

void GrabPointerLock::acquire() {
	if (!evdev->grab()) {
		BOOST_THROW_EXCEPTION(EvdevGrabError() <<
			boost::errinfo_file_name(evdev->path())
		);
	}
	held = true;
}

void GrabPointerLock::release() {
	if (!held) {
		return;
	}
	held = false;
	try {
		evdev->ungrab();
	} catch (EvdevGrabError &) {
		std::cerr << "Failed to release the touchpad:\n" <<
		boost::current_exception_diagnostic_information() << std::endl;
	}
}

std::unique_ptr<PointerLock> makePointerLock(
	LockMode mode,
	const EvdevShared &ev,
	const std::string &devname
) {
	switch (mode) {
		case LockMode::Xinput:
			return std::unique_ptr<PointerLock>(
				new XinputPointerLock(devname)
			);
		case LockMode::Gnome:
			return std::unique_ptr<PointerLock>(new GnomePointerLock());
		case LockMode::Grab:
			return std::unique_ptr<PointerLock>(new GrabPointerLock(ev));
		default:
			return std::unique_ptr<PointerLock>(new NullPointerLock());
	}
}

Session::Session(const EvdevShared &ev, const Calibration &cal) :
evdev(ev), pump(cal) {
	// only these events matter to the interpreter
	static const EventTypeCode used[] = {
		EventTypeCode(EV_ABS, ABS_X),
		EventTypeCode(EV_ABS, ABS_Y),
		EventTypeCode(EV_KEY, BTN_TOUCH),
		EventTypeCode(EV_KEY, BTN_LEFT),
		EventTypeCode(EV_KEY, BTN_RIGHT),
		EventTypeCode(EV_SYN, SYN_REPORT)
	};
	for (EventTypeCode etc : used) {
		conns.emplace_back(evdev->inputConnect(
			etc,
			[this](EventTypeCode tc, std::int32_t val) {
				pump.input(tc, val);
			}
		));
	}
}

Session::End Session::run(PointerLock &lock) {
	Poller poller;
	// watch for signals before the lock is taken so that an interrupt cannot
	// leave the touchpad locked
	std::shared_ptr<SignalWatch> sigs = std::make_shared<SignalWatch>(
		std::initializer_list<int>{ SIGINT, SIGTERM }
	);
	poller.add(sigs, sigs->fd);
	evdev->usePoller(poller);
	PointerLockGuard guard(lock);
	while (!pump.cancelled() && !sigs->caught()) {
		poller.wait();
	}
	if (pump.cancelled()) {
		return Cancelled;
	}
	return Interrupted;
}
