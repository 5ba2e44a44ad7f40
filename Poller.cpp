/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include <boost/exception/errinfo_errno.hpp>
#include <boost/throw_exception.hpp>
#include "Poller.hpp"
#include <unistd.h>
#include <cerrno>
#include <vector>

Poller::Poller() {
	epfd = epoll_create1(EPOLL_CLOEXEC);
	if (epfd < 0) {
		BOOST_THROW_EXCEPTION(PollerCreateError() <<
			boost::errinfo_errno(errno)
		);
	}
}

Poller::~Poller() {
	close(epfd);
}

void Poller::add(const PollResponseShared &prs, int fd, int events) {
	epoll_event event;
	event.events = events;
	event.data.fd = fd;
	if (epoll_ctl(epfd, EPOLL_CTL_ADD, fd, &event)) {
		BOOST_THROW_EXCEPTION(PollerError() <<
			boost::errinfo_errno(errno)
		);
	}
	things[fd] = prs;
}

struct ResponseRecord {
	PollResponseShared prs;
	int fd;
	ResponseRecord(const PollResponseShared &p, int f) : prs(p), fd(f) { }
};

int Poller::wait(std::chrono::milliseconds timeout) {
	epoll_event events[8];
	int count = epoll_wait(epfd, events, 8, timeout.count());
	if (count < 0) {
		if (errno == EINTR) {
			return 0;
		}
		BOOST_THROW_EXCEPTION(PollerError() <<
			boost::errinfo_errno(errno)
		);
	}
	std::vector<ResponseRecord> responders;
	responders.reserve(count);
	for (int loop = 0; loop < count; ++loop) {
		int fd = events[loop].data.fd;
		std::map<int, PollResponseShared>::const_iterator iter =
			things.find(fd);
		if (iter != things.end()) {
			responders.emplace_back(iter->second, fd);
		}
	}
	for (const ResponseRecord &rr : responders) {
		rr.prs->respond(rr.fd);
	}
	return responders.size();
}
