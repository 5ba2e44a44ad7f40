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
#include <vector>
#include "ReportPump.hpp"

class ReportPumpTest : public ::testing::Test {
protected:
	ReportPump pump;
	std::vector<Report> reps;
	ReportPumpTest() : pump(Calibration(
		AxisRange(0, 1000, ABS_X),
		AxisRange(0, 1000, ABS_Y)
	)) {
		pump.reportConnect([this](const Report &r) {
			reps.push_back(r);
		});
	}
	bool abs(std::uint16_t code, std::int32_t val) {
		return pump.input(EventTypeCode(EV_ABS, code), val);
	}
	bool key(std::uint16_t code, std::int32_t val) {
		return pump.input(EventTypeCode(EV_KEY, code), val);
	}
	bool syn() {
		return pump.input(EventTypeCode(EV_SYN, SYN_REPORT), 0);
	}
};

TEST_F(ReportPumpTest, ReportsEverySync) {
	EXPECT_TRUE(key(BTN_TOUCH, 1));
	EXPECT_TRUE(abs(ABS_X, 0));
	EXPECT_TRUE(abs(ABS_Y, 0));
	EXPECT_TRUE(syn());
	EXPECT_TRUE(abs(ABS_X, 500));
	EXPECT_TRUE(abs(ABS_Y, 500));
	EXPECT_TRUE(syn());
	ASSERT_EQ(2u, reps.size());
	EXPECT_FALSE(reps[0].moved());
	EXPECT_EQ(Report(Position(0.5, 0.5)), reps[1]);
	EXPECT_EQ(2u, pump.reportCount());
	EXPECT_FALSE(pump.cancelled());
}

TEST_F(ReportPumpTest, InputSignalSeesEveryEvent) {
	std::vector<EventTypeCode> seen;
	pump.inputConnect([&seen](EventTypeCode etc, std::int32_t) {
		seen.push_back(etc);
	});
	abs(ABS_PRESSURE, 30);
	syn();
	ASSERT_EQ(2u, seen.size());
	EXPECT_EQ(EventTypeCode(EV_ABS, ABS_PRESSURE), seen[0]);
	EXPECT_EQ(EventTypeCode(EV_SYN, SYN_REPORT), seen[1]);
}

TEST_F(ReportPumpTest, ButtonPressStopsReports) {
	abs(ABS_X, 100);
	abs(ABS_Y, 100);
	syn();
	abs(ABS_X, 200);
	EXPECT_FALSE(key(BTN_LEFT, 1));
	EXPECT_TRUE(pump.cancelled());
	// the rest of the packet is dropped
	EXPECT_FALSE(syn());
	EXPECT_FALSE(abs(ABS_Y, 300));
	EXPECT_FALSE(syn());
	ASSERT_EQ(1u, reps.size());
	EXPECT_FALSE(reps[0].moved());
}

TEST_F(ReportPumpTest, RightButtonAlsoCancels) {
	EXPECT_FALSE(key(BTN_RIGHT, 1));
	EXPECT_TRUE(pump.cancelled());
	EXPECT_TRUE(reps.empty());
}

TEST_F(ReportPumpTest, ButtonReleaseContinues) {
	EXPECT_TRUE(key(BTN_LEFT, 0));
	EXPECT_TRUE(key(BTN_RIGHT, 0));
	EXPECT_FALSE(pump.cancelled());
}

TEST_F(ReportPumpTest, LiftThenTouchAgain) {
	abs(ABS_X, 200);
	abs(ABS_Y, 200);
	syn();
	key(BTN_TOUCH, 0);
	syn();
	key(BTN_TOUCH, 1);
	abs(ABS_X, 300);
	abs(ABS_Y, 300);
	syn();
	ASSERT_EQ(3u, reps.size());
	for (const Report &r : reps) {
		EXPECT_FALSE(r.moved());
	}
}
