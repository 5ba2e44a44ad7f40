/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef TOUCHINTERPRETER_HPP
#define TOUCHINTERPRETER_HPP

#include "AxisCalibration.hpp"
#include "RawEvent.hpp"
#include <boost/optional.hpp>
#include <iosfwd>

/**
 * A normalized touch position. Either coordinate may be missing; the
 * position is only usable when both are present.
 */
struct Position {
	boost::optional<double> x;
	boost::optional<double> y;
	Position() = default;
	Position(double px, double py) : x(px), y(py) { }
	bool present() const {
		return x && y;
	}
	void clear() {
		x = boost::none;
		y = boost::none;
	}
};

inline bool operator==(const Position &p0, const Position &p1) {
	return (p0.x == p1.x) && (p0.y == p1.y);
}

inline bool operator!=(const Position &p0, const Position &p1) {
	return !(p0 == p1);
}

std::ostream &operator<<(std::ostream &os, const Position &p);

/**
 * The result of one hardware report.
 */
struct Report {
	enum Kind {
		/**
		 * Nothing new to report.
		 */
		NoChange,
		/**
		 * The contact is down and is now at @a pos.
		 */
		Moved
	};
	Kind kind;
	Position pos;
	Report() : kind(NoChange) { }
	explicit Report(const Position &p) : kind(Moved), pos(p) { }
	bool moved() const {
		return kind == Moved;
	}
};

inline bool operator==(const Report &r0, const Report &r1) {
	return (r0.kind == r1.kind) && (r0.pos == r1.pos);
}

std::ostream &operator<<(std::ostream &os, const Report &r);

/**
 * The three positions tracked while interpreting touch input.
 */
struct InterpreterState {
	/**
	 * Collects axis samples until the next sync.
	 */
	Position workInProgress;
	/**
	 * The position as of the last sync.
	 */
	Position committed;
	/**
	 * The position given in the last report; the anchor for motion.
	 */
	Position lastReported;
};

/**
 * What came of handling one event.
 */
struct Step {
	enum Flow {
		Continue,
		/**
		 * A button was pressed; the session must end.
		 */
		Cancelled
	};
	Flow flow;
	/**
	 * Set only when a sync was handled.
	 */
	boost::optional<Report> report;
	Step() : flow(Continue) { }
	Step(Flow f) : flow(f) { }
	Step(const Report &r) : flow(Continue), report(r) { }
	bool cancelled() const {
		return flow == Cancelled;
	}
};

/**
 * Applies one event to the interpreter state.
 * @param cal    The ranges used to normalize axis samples.
 * @param state  The state to update.
 * @param event  The next event from the device.
 * @return       A report if @a event was a sync, and whether to keep going.
 */
Step transition(
	const Calibration &cal,
	InterpreterState &state,
	const RawEvent &event
);

/**
 * Turns the input events of a touchpad into touch position reports. A
 * report is produced for every sync; see transition().
 * @author  Jeff Jackowski
 */
class TouchInterpreter {
	Calibration cal;
	InterpreterState st;
public:
	TouchInterpreter(const Calibration &c) : cal(c) { }
	Step consume(const RawEvent &event) {
		return transition(cal, st, event);
	}
	const InterpreterState &state() const {
		return st;
	}
};

#endif        //  #ifndef TOUCHINTERPRETER_HPP
