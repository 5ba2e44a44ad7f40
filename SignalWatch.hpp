/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef SIGNALWATCH_HPP
#define SIGNALWATCH_HPP

#include "Poller.hpp"
#include <initializer_list>
#include <signal.h>

struct SignalWatchError : virtual std::exception, virtual boost::exception { };

/**
 * Receives signals through a signalfd so that they can be handled by a
 * Poller along with device input instead of interrupting it. The signals
 * are blocked from normal delivery for the lifetime of the object; the prior
 * signal mask is restored by the destructor.
 * @author  Jeff Jackowski
 */
class SignalWatch : boost::noncopyable, public PollResponse {
	sigset_t watched;
	sigset_t prior;
	/**
	 * The last signal received, or zero if none.
	 */
	int last;
public:
	int fd;
	/**
	 * Starts watching for the given signals.
	 * @throw SignalWatchError  The signals could not be blocked, or the
	 *                          signalfd could not be made.
	 */
	SignalWatch(std::initializer_list<int> sigs);
	~SignalWatch();
	/**
	 * Reads the pending signals.
	 */
	virtual void respond(int fd);
	/**
	 * The number of the last signal received, or zero if none has arrived.
	 */
	int caught() const {
		return last;
	}
};

#endif        //  #ifndef SIGNALWATCH_HPP
