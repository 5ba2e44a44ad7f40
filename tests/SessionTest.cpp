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
#include "Session.hpp"

TEST(MakePointerLockTest, NoneDoesNothing) {
	std::unique_ptr<PointerLock> pl =
		makePointerLock(LockMode::None, EvdevShared(), "Touchpad");
	ASSERT_TRUE(pl != nullptr);
	EXPECT_TRUE(dynamic_cast<NullPointerLock*>(pl.get()) != nullptr);
	EXPECT_STREQ("none", pl->name());
}

TEST(MakePointerLockTest, XinputUsesDeviceName) {
	std::unique_ptr<PointerLock> pl = makePointerLock(
		LockMode::Xinput,
		EvdevShared(),
		"SynPS/2 Synaptics TouchPad"
	);
	XinputPointerLock *xpl = dynamic_cast<XinputPointerLock*>(pl.get());
	ASSERT_TRUE(xpl != nullptr);
	EXPECT_EQ("SynPS/2 Synaptics TouchPad", xpl->device());
	EXPECT_STREQ("xinput", pl->name());
}

TEST(MakePointerLockTest, GnomeAndGrab) {
	std::unique_ptr<PointerLock> pl =
		makePointerLock(LockMode::Gnome, EvdevShared(), "Touchpad");
	EXPECT_TRUE(dynamic_cast<GnomePointerLock*>(pl.get()) != nullptr);
	pl = makePointerLock(LockMode::Grab, EvdevShared(), "Touchpad");
	EXPECT_TRUE(dynamic_cast<GrabPointerLock*>(pl.get()) != nullptr);
	EXPECT_STREQ("grab", pl->name());
}

TEST(MakePointerLockTest, UnheldLocksReleaseQuietly) {
	// never acquired, so neither touches the device or the desktop
	std::unique_ptr<PointerLock> pl =
		makePointerLock(LockMode::Grab, EvdevShared(), "Touchpad");
	pl->release();
	pl = makePointerLock(LockMode::Gnome, EvdevShared(), "Touchpad");
	pl->release();
}
