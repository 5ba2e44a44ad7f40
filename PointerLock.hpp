/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef POINTERLOCK_HPP
#define POINTERLOCK_HPP

#include <boost/exception/info.hpp>
#include <boost/noncopyable.hpp>
#include <string>

/**
 * The desktop reported a touchpad setting that this program does not know
 * how to restore.
 */
struct UnexpectedTouchpadState : virtual std::exception, virtual boost::exception { };

typedef boost::error_info<struct Info_TouchpadState, std::string>
	TouchpadState;

/**
 * Suspends the normal pointer function of the touchpad so that touches do
 * not also move the cursor.
 * @author  Jeff Jackowski
 */
class PointerLock : boost::noncopyable {
public:
	virtual ~PointerLock() = default;
	/**
	 * Stops the touchpad from moving the pointer.
	 */
	virtual void acquire() = 0;
	/**
	 * Restores the touchpad to what it was before acquire(). Must not
	 * throw; failures are reported on std::cerr.
	 */
	virtual void release() = 0;
	/**
	 * A short name for messages.
	 */
	virtual const char *name() const = 0;
};

/**
 * Holds a PointerLock for the lifetime of the object.
 */
class PointerLockGuard : boost::noncopyable {
	PointerLock &pl;
public:
	PointerLockGuard(PointerLock &lock) : pl(lock) {
		pl.acquire();
	}
	~PointerLockGuard() {
		pl.release();
	}
};

/**
 * Leaves the pointer alone.
 */
class NullPointerLock : public PointerLock {
public:
	virtual void acquire() { }
	virtual void release() { }
	virtual const char *name() const {
		return "none";
	}
};

/**
 * Uses xinput to disable the device in the X server.
 */
class XinputPointerLock : public PointerLock {
	std::string devname;
public:
	/**
	 * @param dev  The name of the device as known to the X server.
	 */
	XinputPointerLock(const std::string &dev) : devname(dev) { }
	const std::string &device() const {
		return devname;
	}
	virtual void acquire();
	virtual void release();
	virtual const char *name() const {
		return "xinput";
	}
};

/**
 * Turns off the GNOME touchpad send-events setting, then puts back the prior
 * value.
 */
class GnomePointerLock : public PointerLock {
	/**
	 * The setting as it was before acquire(), quoted as dconf expects.
	 */
	std::string prior;
	bool held;
public:
	GnomePointerLock() : held(false) { }
	/**
	 * @throw UnexpectedTouchpadState  The current setting is not one of the
	 *                                 known values; probably not GNOME.
	 * @throw CommandError             gsettings or dconf failed to run.
	 */
	virtual void acquire();
	virtual void release();
	virtual const char *name() const {
		return "gnome";
	}
};

/**
 * Cleans up the send-events value given by gsettings: removes surrounding
 * whitespace, and treats an empty value, as some distributions give, as
 * enabled.
 */
std::string sendEventsValue(const std::string &raw);

/**
 * True if @a val is a send-events value that can be restored later.
 */
bool knownSendEvents(const std::string &val);

/**
 * The ways the pointer can be locked.
 */
enum class LockMode {
	Auto,
	Xinput,
	Gnome,
	Grab,
	None
};

/**
 * Converts a name as given on the command line into a LockMode.
 * @return  False if the name is not known.
 */
bool parseLockMode(const std::string &str, LockMode &mode);

/**
 * Picks the lock for LockMode::Auto based on the value of XDG_SESSION_TYPE.
 * Other modes are returned unchanged.
 * @param sessionType  The session type, or nullptr if not set.
 */
LockMode resolveLockMode(LockMode mode, const char *sessionType);

#endif        //  #ifndef POINTERLOCK_HPP
