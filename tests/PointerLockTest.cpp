/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include <gtest/gtest.h>
#include <stdexcept>
#include "PointerLock.hpp"

/**
 * Records use of the lock.
 */
class CountingLock : public PointerLock {
public:
	int acquired = 0;
	int released = 0;
	virtual void acquire() {
		++acquired;
	}
	virtual void release() {
		++released;
	}
	virtual const char *name() const {
		return "counting";
	}
};

TEST(PointerLockTest, GuardAcquiresAndReleases) {
	CountingLock cl;
	{
		PointerLockGuard guard(cl);
		EXPECT_EQ(1, cl.acquired);
		EXPECT_EQ(0, cl.released);
	}
	EXPECT_EQ(1, cl.acquired);
	EXPECT_EQ(1, cl.released);
}

TEST(PointerLockTest, GuardReleasesOnException) {
	CountingLock cl;
	try {
		PointerLockGuard guard(cl);
		throw std::runtime_error("device removed");
	} catch (std::runtime_error &) {
	}
	EXPECT_EQ(1, cl.released);
}

TEST(PointerLockTest, ParseLockModes) {
	LockMode mode = LockMode::None;
	EXPECT_TRUE(parseLockMode("auto", mode));
	EXPECT_EQ(LockMode::Auto, mode);
	EXPECT_TRUE(parseLockMode("xinput", mode));
	EXPECT_EQ(LockMode::Xinput, mode);
	EXPECT_TRUE(parseLockMode("gnome", mode));
	EXPECT_EQ(LockMode::Gnome, mode);
	EXPECT_TRUE(parseLockMode("grab", mode));
	EXPECT_EQ(LockMode::Grab, mode);
	EXPECT_TRUE(parseLockMode("none", mode));
	EXPECT_EQ(LockMode::None, mode);
	EXPECT_FALSE(parseLockMode("wayland", mode));
	EXPECT_EQ(LockMode::None, mode);
}

TEST(PointerLockTest, AutoFollowsSessionType) {
	EXPECT_EQ(LockMode::Gnome, resolveLockMode(LockMode::Auto, "wayland"));
	EXPECT_EQ(LockMode::Xinput, resolveLockMode(LockMode::Auto, "x11"));
	EXPECT_EQ(LockMode::Grab, resolveLockMode(LockMode::Auto, "tty"));
	EXPECT_EQ(LockMode::Grab, resolveLockMode(LockMode::Auto, nullptr));
}

TEST(PointerLockTest, ExplicitModeKept) {
	EXPECT_EQ(LockMode::Xinput, resolveLockMode(LockMode::Xinput, "wayland"));
	EXPECT_EQ(LockMode::None, resolveLockMode(LockMode::None, "x11"));
}

TEST(PointerLockTest, SendEventsValues) {
	EXPECT_EQ("'enabled'", sendEventsValue("'enabled'\n"));
	EXPECT_EQ("'enabled'", sendEventsValue(""));
	EXPECT_EQ("'enabled'", sendEventsValue("\n"));
	EXPECT_EQ("'disabled-on-external-mouse'",
		sendEventsValue("  'disabled-on-external-mouse'\n"));
	EXPECT_TRUE(knownSendEvents("'enabled'"));
	EXPECT_TRUE(knownSendEvents("'disabled'"));
	EXPECT_TRUE(knownSendEvents("'disabled-on-external-mouse'"));
	EXPECT_FALSE(knownSendEvents("enabled"));
	EXPECT_FALSE(knownSendEvents("No such schema"));
}

TEST(PointerLockTest, NullLockDoesNothing) {
	NullPointerLock nl;
	PointerLockGuard guard(nl);
	EXPECT_STREQ("none", nl.name());
}
