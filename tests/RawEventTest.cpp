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
#include <linux/input.h>
#include "RawEvent.hpp"

TEST(RawEventTest, AbsoluteAxesAreSamples) {
	RawEvent re = RawEvent::classify(EventTypeCode(EV_ABS, ABS_X), 123);
	EXPECT_EQ(RawEvent::AxisSample, re.kind);
	EXPECT_EQ(Axis::X, re.axis);
	EXPECT_EQ(123, re.value);
	re = RawEvent::classify(EventTypeCode(EV_ABS, ABS_Y), -7);
	EXPECT_EQ(RawEvent::AxisSample, re.kind);
	EXPECT_EQ(Axis::Y, re.axis);
	EXPECT_EQ(-7, re.value);
}

TEST(RawEventTest, OnlyTouchReleaseEndsContact) {
	EXPECT_EQ(RawEvent::ContactEnd,
		RawEvent::classify(EventTypeCode(EV_KEY, BTN_TOUCH), 0).kind);
	EXPECT_EQ(RawEvent::Other,
		RawEvent::classify(EventTypeCode(EV_KEY, BTN_TOUCH), 1).kind);
}

TEST(RawEventTest, ButtonsAreClicks) {
	RawEvent left = RawEvent::classify(EventTypeCode(EV_KEY, BTN_LEFT), 1);
	EXPECT_EQ(RawEvent::Click, left.kind);
	EXPECT_TRUE(left.pressed());
	RawEvent right = RawEvent::classify(EventTypeCode(EV_KEY, BTN_RIGHT), 1);
	EXPECT_EQ(RawEvent::Click, right.kind);
	EXPECT_TRUE(right.pressed());
	RawEvent release = RawEvent::classify(EventTypeCode(EV_KEY, BTN_LEFT), 0);
	EXPECT_EQ(RawEvent::Click, release.kind);
	EXPECT_FALSE(release.pressed());
	// key repeat is not a new press
	EXPECT_FALSE(RawEvent::classify(EventTypeCode(EV_KEY, BTN_RIGHT), 2).pressed());
}

TEST(RawEventTest, SyncReport) {
	EXPECT_EQ(RawEvent::Sync,
		RawEvent::classify(EventTypeCode(EV_SYN, SYN_REPORT), 0).kind);
	EXPECT_EQ(RawEvent::Other,
		RawEvent::classify(EventTypeCode(EV_SYN, SYN_DROPPED), 0).kind);
}

TEST(RawEventTest, UnknownEventsAreOther) {
	EXPECT_EQ(RawEvent::Other,
		RawEvent::classify(EventTypeCode(EV_ABS, ABS_PRESSURE), 50).kind);
	EXPECT_EQ(RawEvent::Other,
		RawEvent::classify(EventTypeCode(EV_ABS, ABS_MT_POSITION_X), 50).kind);
	EXPECT_EQ(RawEvent::Other,
		RawEvent::classify(EventTypeCode(EV_KEY, BTN_MIDDLE), 1).kind);
	EXPECT_EQ(RawEvent::Other,
		RawEvent::classify(EventTypeCode(EV_KEY, BTN_TOOL_FINGER), 1).kind);
	EXPECT_EQ(RawEvent::Other,
		RawEvent::classify(EventTypeCode(EV_MSC, MSC_TIMESTAMP), 9).kind);
}
