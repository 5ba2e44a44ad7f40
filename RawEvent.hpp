/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef RAWEVENT_HPP
#define RAWEVENT_HPP

#include "EventTypeCode.hpp"
#include <iosfwd>

/**
 * The axes tracked for a touch position.
 */
enum class Axis {
	X,
	Y
};

/**
 * One input event reduced to the kinds that matter when following a single
 * touch contact. Events of any other type or code become Other.
 * @author  Jeff Jackowski
 */
struct RawEvent {
	enum Kind {
		/**
		 * A new absolute sample on @a axis; the sample is in @a value.
		 */
		AxisSample,
		/**
		 * The contact lifted off the surface.
		 */
		ContactEnd,
		/**
		 * A physical button changed state. @a value is non-zero for a press.
		 */
		Click,
		/**
		 * End of a hardware report; everything since the previous Sync is
		 * coherent.
		 */
		Sync,
		/**
		 * Anything else.
		 */
		Other
	};
	Kind kind;
	Axis axis;
	std::int32_t value;
	RawEvent() : kind(Other), axis(Axis::X), value(0) { }
	RawEvent(Kind k, Axis a = Axis::X, std::int32_t v = 0) :
		kind(k), axis(a), value(v) { }
	static RawEvent sample(Axis a, std::int32_t v) {
		return RawEvent(AxisSample, a, v);
	}
	static RawEvent contactEnd() {
		return RawEvent(ContactEnd);
	}
	static RawEvent click(bool pressed) {
		return RawEvent(Click, Axis::X, pressed ? 1 : 0);
	}
	static RawEvent sync() {
		return RawEvent(Sync);
	}
	/**
	 * True for a Click event that reports a press. Releases and key repeats
	 * are not presses.
	 */
	bool pressed() const {
		return (kind == Click) && (value == 1);
	}
	/**
	 * Converts an input event from the kernel into a RawEvent.
	 * @param etc  The type and code of the event.
	 * @param val  The value of the event.
	 */
	static RawEvent classify(EventTypeCode etc, std::int32_t val);
};

std::ostream &operator<<(std::ostream &os, const RawEvent &re);

#endif        //  #ifndef RAWEVENT_HPP
