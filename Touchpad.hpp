/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef TOUCHPAD_HPP
#define TOUCHPAD_HPP

#include "Evdev.hpp"
#include "AxisCalibration.hpp"

struct NoTouchpadError : virtual std::exception, virtual boost::exception { };

/**
 * True if the device looks like a touchpad: it has absolute X and Y axes
 * and reports finger contact, but is not a touchscreen. This is the same
 * test udev uses to set ID_INPUT_TOUCHPAD.
 */
bool isTouchpad(const Evdev &ev);

/**
 * The name of the device without the double quotes some devices include.
 */
std::string touchpadName(const Evdev &ev);

/**
 * Looks through the event devices in @a dir, in numeric order, for the first
 * touchpad that can be opened.
 * @throw EvdevPermissionError  No touchpad was usable, and at least one
 *                              event device could not be opened due to its
 *                              access rights. The file name of the first such
 *                              device is included.
 * @throw NoTouchpadError       No touchpad was found.
 */
EvdevShared findTouchpad(const std::string &dir = "/dev/input");

/**
 * Reads the ranges of the touchpad's X and Y axes.
 * @throw CalibrationError  An axis is missing or has no range.
 */
Calibration calibrate(const Evdev &ev);

#endif        //  #ifndef TOUCHPAD_HPP
