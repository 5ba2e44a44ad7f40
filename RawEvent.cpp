/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "RawEvent.hpp"
#include <linux/input.h>
#include <ostream>

RawEvent RawEvent::classify(EventTypeCode etc, std::int32_t val) {
	switch (etc.type) {
		case EV_ABS:
			if (etc.code == ABS_X) {
				return sample(Axis::X, val);
			} else if (etc.code == ABS_Y) {
				return sample(Axis::Y, val);
			}
			break;
		case EV_KEY:
			// only the lift matters; the start of a contact is seen as the
			// arrival of new samples
			if ((etc.code == BTN_TOUCH) && (val == 0)) {
				return contactEnd();
			} else if ((etc.code == BTN_LEFT) || (etc.code == BTN_RIGHT)) {
				return RawEvent(Click, Axis::X, val);
			}
			break;
		case EV_SYN:
			if (etc.code == SYN_REPORT) {
				return sync();
			}
			break;
	}
	return RawEvent();
}

std::ostream &operator<<(std::ostream &os, const RawEvent &re) {
	switch (re.kind) {
		case RawEvent::AxisSample:
			os << ((re.axis == Axis::X) ? "X=" : "Y=") << re.value;
			break;
		case RawEvent::ContactEnd:
			os << "ContactEnd";
			break;
		case RawEvent::Click:
			os << (re.pressed() ? "ClickPress" : "ClickRelease");
			break;
		case RawEvent::Sync:
			os << "Sync";
			break;
		default:
			os << "Other";
	}
	return os;
}
