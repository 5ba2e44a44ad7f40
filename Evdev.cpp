/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "Evdev.hpp"
#include <boost/exception/errinfo_file_name.hpp>
#include <boost/exception/errinfo_errno.hpp>
#include <boost/throw_exception.hpp>

// for open() and related items; may be more than needed
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

const char *EventTypeCode::typeName() const {
	return libevdev_event_type_get_name(type);
}

const char *EventTypeCode::codeName() const {
	return libevdev_event_code_get_name(type, code);
}

Evdev::Evdev(const std::string &path) : devpath(path), dev(nullptr) {
	fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
	if (fd < 0) {
		int err = errno;
		if ((err == EACCES) || (err == EPERM)) {
			BOOST_THROW_EXCEPTION(EvdevPermissionError() <<
				boost::errinfo_errno(err) <<
				boost::errinfo_file_name(path)
			);
		}
		BOOST_THROW_EXCEPTION(EvdevFileOpenError() <<
			boost::errinfo_errno(err) <<
			boost::errinfo_file_name(path)
		);
	}
	int result = libevdev_new_from_fd(fd, &dev);
	if (result < 0) {
		close(fd);
		BOOST_THROW_EXCEPTION(EvdevInitError() <<
			boost::errinfo_errno(-result) <<
			// the file may have nothing to do with the error, but it will
			// add context
			boost::errinfo_file_name(path)
		);
	}
}

Evdev::~Evdev() {
	if (dev) {
		libevdev_free(dev);
	}
	if (fd >= 0) {
		close(fd);
	}
}

void Evdev::dispatch(const input_event &ie) {
	EventTypeCode etc(ie.type, ie.code);
	InputMap::const_iterator iter = receivers.find(etc);
	if (iter != receivers.end()) {
		iter->second(etc, ie.value);
	}
}

void Evdev::respond(int) {
	input_event ie;
	int result;
	do {
		result = libevdev_next_event(dev, LIBEVDEV_READ_FLAG_NORMAL, &ie);
		if (result == LIBEVDEV_READ_STATUS_SUCCESS) {
			dispatch(ie);
		} else if (result == LIBEVDEV_READ_STATUS_SYNC) {
			// the kernel dropped events; libevdev supplies the events that
			// bring the state up to date, ending with a SYN_REPORT
			do {
				dispatch(ie);
				result = libevdev_next_event(dev, LIBEVDEV_READ_FLAG_SYNC, &ie);
			} while (result == LIBEVDEV_READ_STATUS_SYNC);
			if (result == -EAGAIN) {
				// done with the sync; continue with normal events
				result = LIBEVDEV_READ_STATUS_SUCCESS;
			}
		}
	} while (result >= 0);
	if (result != -EAGAIN) {
		BOOST_THROW_EXCEPTION(EvdevReadError() <<
			boost::errinfo_errno(-result) <<
			boost::errinfo_file_name(devpath)
		);
	}
}

std::string Evdev::name() const {
	return libevdev_get_name(dev);
}

bool Evdev::grab() {
	return libevdev_grab(dev, LIBEVDEV_GRAB) == 0;
}

void Evdev::ungrab() {
	if (libevdev_grab(dev, LIBEVDEV_UNGRAB) != 0) {
		BOOST_THROW_EXCEPTION(EvdevGrabError() <<
			boost::errinfo_file_name(devpath)
		);
	}
}

bool Evdev::hasEventCode(unsigned int et, unsigned int ec) const {
	return libevdev_has_event_code(dev, et, ec) == 1;
}

bool Evdev::hasProperty(unsigned int prop) const {
	return libevdev_has_property(dev, prop) == 1;
}

void Evdev::usePoller(Poller &p) {
	p.add(shared_from_this(), fd);
}

const input_absinfo *Evdev::absInfo(unsigned int absEc) const {
	return libevdev_get_abs_info(dev, absEc);
}
