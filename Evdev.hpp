/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef EVDEV_HPP
#define EVDEV_HPP

#include <libevdev/libevdev.h>
#include <boost/signals2/signal.hpp>
#include "EventTypeCode.hpp"
#include "Poller.hpp"
#include <string>

struct EvdevError : virtual std::exception, virtual boost::exception { };
struct EvdevFileOpenError : EvdevError { };
/**
 * The device file exists, but this user account may not read it.
 */
struct EvdevPermissionError : EvdevFileOpenError { };
struct EvdevInitError : EvdevError { };
struct EvdevReadError : EvdevError { };
struct EvdevGrabError : EvdevError { };

/**
 * Handles getting input from a specific input device.
 * @author  Jeff Jackowski
 */
class Evdev :
	boost::noncopyable,
	public PollResponse,
	public std::enable_shared_from_this<Evdev>
{
public:
	typedef boost::signals2::signal< void(EventTypeCode, std::int32_t) >
		InputSignal;
protected:
	typedef std::map<EventTypeCode, InputSignal>  InputMap;
	InputMap receivers;
	std::string devpath;
	libevdev *dev;
	/**
	 * Passes an event to the receivers connected for its type and code.
	 */
	void dispatch(const input_event &ie);
public:
	int fd;
	/**
	 * Opens the given device file for non-blocking reads.
	 * @throw EvdevPermissionError  The file could not be opened due to its
	 *                              access rights.
	 * @throw EvdevFileOpenError    The file could not be opened.
	 * @throw EvdevInitError        The file is not an input device.
	 */
	Evdev(const std::string &path);
	~Evdev();
	/**
	 * Reads in all pending input events when invoked by the poller and gives
	 * them to the receivers in the order they were read.
	 * @throw EvdevReadError  The device could not be read; it may have been
	 *                        removed.
	 */
	virtual void respond(int fd);
	/**
	 * Reports the name of the device through libevdev_get_name().
	 */
	std::string name() const;
	/**
	 * The path of the device file.
	 */
	const std::string &path() const {
		return devpath;
	}
	/**
	 * Attempts to gain exclusive access to the input device. While grabbed,
	 * no other program, including the display server, gets input from it.
	 * @return  True if exclusive access was granted.
	 */
	bool grab();
	/**
	 * Gives up exclusive access obtained with grab().
	 */
	void ungrab();
	bool hasEventCode(unsigned int et, unsigned int ec) const;
	bool hasProperty(unsigned int prop) const;
	void usePoller(Poller &p);
	boost::signals2::connection inputConnect(
		EventTypeCode etc,
		const InputSignal::slot_type &slot,
		boost::signals2::connect_position at = boost::signals2::at_back
	) {
		return receivers[etc].connect(slot, at);
	}
	/**
	 * Provides information about a specified absolute axis.
	 * @param absEc  The event code for the axis to query. It must be for an
	 *               event of type EV_ABS.
	 * @return  The data, or nullptr if the device lacks the axis.
	 */
	const input_absinfo *absInfo(unsigned int absEc) const;
};

typedef std::shared_ptr<Evdev>  EvdevShared;

#endif        //  #ifndef EVDEV_HPP
