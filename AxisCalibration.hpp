/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef AXISCALIBRATION_HPP
#define AXISCALIBRATION_HPP

#include <boost/exception/info.hpp>
#include <cstdint>

struct input_absinfo;

struct CalibrationError : virtual std::exception, virtual boost::exception { };

typedef boost::error_info<struct Info_CalibrationAxis, unsigned int>
	CalibrationAxis;
typedef boost::error_info<struct Info_CalibrationMin, std::int32_t>
	CalibrationMin;
typedef boost::error_info<struct Info_CalibrationMax, std::int32_t>
	CalibrationMax;

/**
 * The range of raw values reported by one absolute axis.
 * @invariant  max > min
 * @author  Jeff Jackowski
 */
class AxisRange {
	std::int32_t minv;
	std::int32_t maxv;
public:
	/**
	 * Makes a range from the bounds reported by the device.
	 * @param absEc  The event code of the axis; only used to report errors.
	 * @throw CalibrationError  The range has no width.
	 */
	AxisRange(std::int32_t min, std::int32_t max, unsigned int absEc);
	std::int32_t min() const {
		return minv;
	}
	std::int32_t max() const {
		return maxv;
	}
	/**
	 * Maps a raw sample onto [0,1]. Samples outside the range are clamped.
	 */
	double normalize(std::int32_t val) const;
};

/**
 * The ranges of the two axes used for the touch position. Made once before
 * any input is interpreted and never changed afterwards.
 */
struct Calibration {
	AxisRange x;
	AxisRange y;
	Calibration(const AxisRange &ax, const AxisRange &ay) : x(ax), y(ay) { }
};

/**
 * Builds the calibration from the axis information of ABS_X and ABS_Y.
 * @param xinfo  Information on ABS_X, or nullptr if the axis is unsupported.
 * @param yinfo  Information on ABS_Y, or nullptr if the axis is unsupported.
 * @throw CalibrationError  An axis is unsupported or has a zero-width range.
 */
Calibration calibrate(const input_absinfo *xinfo, const input_absinfo *yinfo);

#endif        //  #ifndef AXISCALIBRATION_HPP
