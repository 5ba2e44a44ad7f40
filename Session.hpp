/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef SESSION_HPP
#define SESSION_HPP

#include "Evdev.hpp"
#include "PointerLock.hpp"
#include "ReportPump.hpp"
#include <vector>

/**
 * Takes the touchpad away from everything else with an exclusive grab of
 * the evdev device.
 */
class GrabPointerLock : public PointerLock {
	EvdevShared evdev;
	bool held;
public:
	GrabPointerLock(const EvdevShared &ev) : evdev(ev), held(false) { }
	/**
	 * @throw EvdevGrabError  Another program already has the grab.
	 */
	virtual void acquire();
	virtual void release();
	virtual const char *name() const {
		return "grab";
	}
};

/**
 * Makes the pointer lock for the given mode. LockMode::Auto must already
 * be resolved with resolveLockMode().
 * @param mode     The kind of lock.
 * @param ev       The touchpad; only used by the grab lock.
 * @param devname  The name of the touchpad as the X server knows it.
 */
std::unique_ptr<PointerLock> makePointerLock(
	LockMode mode,
	const EvdevShared &ev,
	const std::string &devname
);

/**
 * Runs one drawing session on a touchpad: holds the pointer lock while
 * reading touch input and producing reports until a button is pressed or a
 * termination signal arrives.
 * @author  Jeff Jackowski
 */
class Session : boost::noncopyable {
	EvdevShared evdev;
	ReportPump pump;
	/**
	 * Connections of the pump to the device; dropped with the session.
	 */
	std::vector<boost::signals2::scoped_connection> conns;
public:
	/**
	 * How a session ended. Both are normal ends.
	 */
	enum End {
		/**
		 * A touchpad button was pressed.
		 */
		Cancelled,
		/**
		 * SIGINT or SIGTERM arrived.
		 */
		Interrupted
	};
	Session(const EvdevShared &ev, const Calibration &cal);
	/**
	 * The source of reports; connect to it before calling run().
	 */
	ReportPump &reports() {
		return pump;
	}
	/**
	 * Acquires the lock, handles input until the session ends, then releases
	 * the lock. The lock is released on every way out, including exceptions.
	 * @throw EvdevReadError  The touchpad could not be read.
	 */
	End run(PointerLock &lock);
};

#endif        //  #ifndef SESSION_HPP
