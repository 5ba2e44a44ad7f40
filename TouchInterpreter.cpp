/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "TouchInterpreter.hpp"
#include <ostream>

static Report syncReport(InterpreterState &state) {
	Report rep;
	state.committed = state.workInProgress;
	if (state.committed != state.lastReported) {
		if (!state.lastReported.present() && state.committed.present()) {
			// start of a contact; a light tap may produce only one or two
			// samples, so the first is the anchor and not a motion
			state.lastReported = state.committed;
		} else if (state.lastReported.present() && state.committed.present()) {
			rep = Report(state.committed);
		}
	}
	state.lastReported = state.committed;
	return rep;
}

Step transition(
	const Calibration &cal,
	InterpreterState &state,
	const RawEvent &event
) {
	switch (event.kind) {
		case RawEvent::AxisSample:
			if (event.axis == Axis::X) {
				state.workInProgress.x = cal.x.normalize(event.value);
			} else {
				state.workInProgress.y = cal.y.normalize(event.value);
			}
			break;
		case RawEvent::ContactEnd:
			// the whole position is invalid, not just one axis
			state.workInProgress.clear();
			break;
		case RawEvent::Click:
			if (event.pressed()) {
				return Step(Step::Cancelled);
			}
			break;
		case RawEvent::Sync:
			return Step(syncReport(state));
		default:
			break;
	}
	return Step();
}

std::ostream &operator<<(std::ostream &os, const Position &p) {
	if (p.x) {
		os << *p.x;
	} else {
		os << '-';
	}
	os << ' ';
	if (p.y) {
		os << *p.y;
	} else {
		os << '-';
	}
	return os;
}

std::ostream &operator<<(std::ostream &os, const Report &r) {
	if (r.moved()) {
		os << "Moved(" << r.pos << ')';
	} else {
		os << "NoChange";
	}
	return os;
}
