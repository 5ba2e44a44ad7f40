/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef REPORTPUMP_HPP
#define REPORTPUMP_HPP

#include "TouchInterpreter.hpp"
#include <boost/signals2/signal.hpp>
#include <boost/noncopyable.hpp>

/**
 * Moves input events through a TouchInterpreter and hands out the resulting
 * reports to whatever is connected. Once a button press cancels the session,
 * further events are dropped so that nothing is reported after the press.
 * @author  Jeff Jackowski
 */
class ReportPump : boost::noncopyable {
public:
	typedef boost::signals2::signal< void(const Report &) >  ReportSignal;
	typedef boost::signals2::signal< void(EventTypeCode, std::int32_t) >
		InputSignal;
private:
	TouchInterpreter interp;
	/**
	 * Gets every report, including NoChange.
	 */
	ReportSignal reports;
	/**
	 * Gets every input event given to input(), before it is interpreted.
	 */
	InputSignal inputs;
	/**
	 * The number of reports made so far.
	 */
	unsigned long rcnt;
	bool cancel;
public:
	ReportPump(const Calibration &cal) : interp(cal), rcnt(0), cancel(false) { }
	/**
	 * Handles one input event from the device. Does nothing after the
	 * session was cancelled.
	 * @return  False if the session has been cancelled.
	 */
	bool input(EventTypeCode etc, std::int32_t val);
	/**
	 * True once a button press has been seen.
	 */
	bool cancelled() const {
		return cancel;
	}
	unsigned long reportCount() const {
		return rcnt;
	}
	boost::signals2::connection reportConnect(
		const ReportSignal::slot_type &slot,
		boost::signals2::connect_position at = boost::signals2::at_back
	) {
		return reports.connect(slot, at);
	}
	boost::signals2::connection inputConnect(
		const InputSignal::slot_type &slot,
		boost::signals2::connect_position at = boost::signals2::at_back
	) {
		return inputs.connect(slot, at);
	}
};

#endif        //  #ifndef REPORTPUMP_HPP
