/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "Command.hpp"
#include <boost/exception/errinfo_errno.hpp>
#include <boost/throw_exception.hpp>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>

extern char **environ;

std::string commandLine(const CommandArgs &args) {
	std::string line;
	for (const std::string &arg : args) {
		if (!line.empty()) {
			line += ' ';
		}
		line += arg;
	}
	return line;
}

/**
 * Closes the file descriptors of a pipe when destroyed.
 */
struct Pipe {
	int fds[2];
	Pipe() : fds{-1, -1} { }
	~Pipe() {
		closeRead();
		closeWrite();
	}
	void closeRead() {
		if (fds[0] >= 0) {
			close(fds[0]);
			fds[0] = -1;
		}
	}
	void closeWrite() {
		if (fds[1] >= 0) {
			close(fds[1]);
			fds[1] = -1;
		}
	}
};

static pid_t spawn(const CommandArgs &args, Pipe *out) {
	std::vector<char*> argv;
	argv.reserve(args.size() + 1);
	for (const std::string &arg : args) {
		argv.push_back(const_cast<char*>(arg.c_str()));
	}
	argv.push_back(nullptr);
	posix_spawn_file_actions_t actions;
	posix_spawn_file_actions_init(&actions);
	if (out) {
		posix_spawn_file_actions_adddup2(&actions, out->fds[1], STDOUT_FILENO);
		posix_spawn_file_actions_addclose(&actions, out->fds[0]);
		posix_spawn_file_actions_addclose(&actions, out->fds[1]);
	}
	// signals blocked by this process, such as the ones a SignalWatch takes,
	// must still reach the program
	posix_spawnattr_t attr;
	posix_spawnattr_init(&attr);
	sigset_t none;
	sigemptyset(&none);
	posix_spawnattr_setsigmask(&attr, &none);
	posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK);
	pid_t pid;
	int result = posix_spawnp(
		&pid,
		argv[0],
		&actions,
		&attr,
		argv.data(),
		environ
	);
	posix_spawnattr_destroy(&attr);
	posix_spawn_file_actions_destroy(&actions);
	if (result) {
		BOOST_THROW_EXCEPTION(CommandError() <<
			boost::errinfo_errno(result) <<
			CommandLine(commandLine(args))
		);
	}
	return pid;
}

static int reap(pid_t pid, const CommandArgs &args) {
	int status;
	while (waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR) {
			BOOST_THROW_EXCEPTION(CommandError() <<
				boost::errinfo_errno(errno) <<
				CommandLine(commandLine(args))
			);
		}
	}
	if (!WIFEXITED(status)) {
		BOOST_THROW_EXCEPTION(CommandError() <<
			CommandLine(commandLine(args))
		);
	}
	return WEXITSTATUS(status);
}

int runCommand(const CommandArgs &args) {
	return reap(spawn(args, nullptr), args);
}

std::string commandOutput(const CommandArgs &args) {
	Pipe out;
	if (pipe2(out.fds, O_CLOEXEC)) {
		BOOST_THROW_EXCEPTION(CommandError() <<
			boost::errinfo_errno(errno) <<
			CommandLine(commandLine(args))
		);
	}
	pid_t pid = spawn(args, &out);
	out.closeWrite();
	std::string text;
	char buff[256];
	ssize_t len;
	do {
		len = read(out.fds[0], buff, sizeof(buff));
		if (len > 0) {
			text.append(buff, len);
		}
	} while ((len > 0) || ((len < 0) && (errno == EINTR)));
	int status = reap(pid, args);
	if (status) {
		BOOST_THROW_EXCEPTION(CommandError() <<
			CommandStatus(status) <<
			CommandLine(commandLine(args))
		);
	}
	return text;
}
