/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "AxisCalibration.hpp"
#include <boost/throw_exception.hpp>
#include <linux/input.h>
#include <algorithm>

AxisRange::AxisRange(std::int32_t min, std::int32_t max, unsigned int absEc) :
minv(min), maxv(max) {
	if (maxv <= minv) {
		BOOST_THROW_EXCEPTION(CalibrationError() <<
			CalibrationAxis(absEc) << CalibrationMin(min) << CalibrationMax(max)
		);
	}
}

double AxisRange::normalize(std::int32_t val) const {
	// span computed in double; int32 max - min can overflow
	double norm = (static_cast<double>(val) - minv) /
		(static_cast<double>(maxv) - minv);
	return std::min(std::max(norm, 0.0), 1.0);
}

static AxisRange axisRange(const input_absinfo *info, unsigned int absEc) {
	if (!info) {
		// axis not supported by the device
		BOOST_THROW_EXCEPTION(CalibrationError() << CalibrationAxis(absEc));
	}
	return AxisRange(info->minimum, info->maximum, absEc);
}

Calibration calibrate(const input_absinfo *xinfo, const input_absinfo *yinfo) {
	return Calibration(axisRange(xinfo, ABS_X), axisRange(yinfo, ABS_Y));
}
