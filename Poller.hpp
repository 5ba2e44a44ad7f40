/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef POLLER_HPP
#define POLLER_HPP

#include <sys/epoll.h>
#include <boost/exception/info.hpp>
#include <boost/noncopyable.hpp>
#include <chrono>
#include <map>
#include <memory>

struct PollerError : virtual std::exception, virtual boost::exception { };
struct PollerCreateError : PollerError { };

/**
 * Responds to a poll event. The associated file descriptor(s) should not be
 * closed while the Poller that was given them exists.
 */
class PollResponse {
public:
	virtual ~PollResponse() = default;
	/**
	 * Called by Poller::wait(std::chrono::milliseconds) when an event occurs
	 * on the given file descriptor. The PollResponse object may be associated
	 * with multiple file descriptors.
	 * @param fd  The file descriptor with an event.
	 */
	virtual void respond(int fd) = 0;
};

typedef std::shared_ptr<PollResponse>  PollResponseShared;

/**
 * A simple C++ interface to using Linux's epoll() function. A session has
 * exactly one thread, so this class does no locking; it must only be used
 * from one thread.
 *
 * File descriptors are not managed by this class. They must be usable if given
 * to add(). Once give to add(), file descriptors must not be closed until
 * the Poller has been destructed. The Poller does not take responsibility for
 * this, or for closing the descriptors. A Poller lasts for one session.
 *
 * @author  Jeff Jackowski
 */
class Poller : boost::noncopyable {
	/**
	 * Holds responders keyed by their file descriptor.
	 */
	std::map<int, PollResponseShared> things;
	/**
	 * The file descriptor provided by epoll_create1().
	 */
	int epfd;
public:
	Poller();
	~Poller();
	/**
	 * Adds a file descriptor to check for events.
	 * @pre           The file descriptor is not already added to this poller.
	 * @param prs     A shared pointer to the object that will be informed when
	 *                an event on the file descriptor occurs.
	 * @param fd      The file descriptor.
	 * @param events  See the
	 *                [documentation for epoll_ctl() and epoll_event::events.](http://man7.org/linux/man-pages/man2/epoll_ctl.2.html)
	 */
	void add(const PollResponseShared &prs, int fd, int events = EPOLLIN);
	/**
	 * Waits up to the specified time for events, and processes events
	 * immediately. Up to 8 events are recorded in a single call.
	 *
	 * The responders needed for the events are copied before any
	 * PollResponse::respond() is called, so a responder may call add()
	 * without affecting the events already recorded. They are called in the
	 * order epoll_wait() reported the events.
	 *
	 * @param timeout  The maximum amount of time to wait for events to occur.
	 *                 A value of zero will handle events that are already
	 *                 queued without waiting for more. A value of -1 will wait
	 *                 indefinitely.
	 * @return   The number of events handled. Zero if the time ran out or
	 *           the wait was interrupted by a signal handler.
	 */
	int wait(std::chrono::milliseconds timeout);
	/**
	 * Waits indefinitely for events.
	 * @sa wait(std::chrono::milliseconds).
	 */
	int wait() {  // indefinite
		return wait(std::chrono::milliseconds(-1));
	}
};

#endif        //  #ifndef POLLER_HPP
