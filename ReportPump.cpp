/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#include "ReportPump.hpp"

bool ReportPump::input(EventTypeCode etc, std::int32_t val) {
	if (cancel) {
		return false;
	}
	inputs(etc, val);
	Step step = interp.consume(RawEvent::classify(etc, val));
	if (step.cancelled()) {
		cancel = true;
		return false;
	}
	if (step.report) {
		++rcnt;
		reports(*step.report);
	}
	return true;
}
