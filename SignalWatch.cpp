/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "SignalWatch.hpp"
#include <boost/exception/errinfo_errno.hpp>
#include <boost/throw_exception.hpp>
#include <sys/signalfd.h>
#include <unistd.h>
#include <cerrno>

SignalWatch::SignalWatch(std::initializer_list<int> sigs) : last(0) {
	sigemptyset(&watched);
	for (int sig : sigs) {
		sigaddset(&watched, sig);
	}
	if (sigprocmask(SIG_BLOCK, &watched, &prior)) {
		BOOST_THROW_EXCEPTION(SignalWatchError() <<
			boost::errinfo_errno(errno)
		);
	}
	fd = signalfd(-1, &watched, SFD_NONBLOCK | SFD_CLOEXEC);
	if (fd < 0) {
		int err = errno;
		sigprocmask(SIG_SETMASK, &prior, nullptr);
		BOOST_THROW_EXCEPTION(SignalWatchError() <<
			boost::errinfo_errno(err)
		);
	}
}

SignalWatch::~SignalWatch() {
	close(fd);
	sigprocmask(SIG_SETMASK, &prior, nullptr);
}

void SignalWatch::respond(int) {
	signalfd_siginfo info;
	while (read(fd, &info, sizeof(info)) == sizeof(info)) {
		last = info.ssi_signo;
	}
}
