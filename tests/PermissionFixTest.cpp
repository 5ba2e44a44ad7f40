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
#include <sstream>
#include "PermissionFix.hpp"

TEST(PermissionFixTest, AcceptedAnswers) {
	EXPECT_TRUE(acceptsFix(""));
	EXPECT_TRUE(acceptsFix("y"));
	EXPECT_TRUE(acceptsFix("Ye"));
	EXPECT_TRUE(acceptsFix("YES"));
	EXPECT_TRUE(acceptsFix("ok"));
	EXPECT_TRUE(acceptsFix("Sure "));
	EXPECT_FALSE(acceptsFix("no"));
	EXPECT_FALSE(acceptsFix("n"));
	EXPECT_FALSE(acceptsFix("yes please"));
}

TEST(PermissionFixTest, AskReadsOneLine) {
	std::istringstream in("\nno\n");
	std::ostringstream out;
	EXPECT_TRUE(askToFix(in, out));
	EXPECT_NE(std::string::npos, out.str().find("[Yes]/no"));
	EXPECT_FALSE(askToFix(in, out));
}

TEST(PermissionFixTest, EndOfInputDeclines) {
	std::istringstream in("");
	std::ostringstream out;
	EXPECT_FALSE(askToFix(in, out));
}
