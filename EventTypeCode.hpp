/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef EVENTTYPECODE_HPP
#define EVENTTYPECODE_HPP

#include <cstdint>

/**
 * The type and code of an input event packed together so that the pair can
 * be used as a single key. The names are looked up through libevdev, so
 * typeName() and codeName() are only available to code linked with the
 * device library.
 */
union EventTypeCode {
	struct {
		std::uint16_t type;
		std::uint16_t code;
	};
	std::uint32_t typecode;
	EventTypeCode() = default;
	constexpr EventTypeCode(std::uint16_t t, std::uint16_t c) : type(t), code(c) { }
	const char *typeName() const;
	const char *codeName() const;
};

inline bool operator<(EventTypeCode etc0, EventTypeCode etc1) {
	return etc0.typecode < etc1.typecode;
}

inline bool operator==(EventTypeCode etc0, EventTypeCode etc1) {
	return etc0.typecode == etc1.typecode;
}

#endif        //  #ifndef EVENTTYPECODE_HPP
