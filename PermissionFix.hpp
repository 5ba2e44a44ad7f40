/*
 * This file is part of the Touchdraw project. It is subject to the GPLv3
 * license terms in the LICENSE file found in the top-level directory of this
 * distribution. No part of the Touchdraw project, including this file, may be
 * copied, modified, propagated, or distributed except according to the terms
 * contained in the LICENSE file.
 *
 * Copyright (C) 2018  Jeff Jackowski
 */
#ifndef PERMISSIONFIX_HPP
#define PERMISSIONFIX_HPP

#include <iosfwd>
#include <string>

/**
 * True if the answer to the question of unrestricting the touchpad means
 * yes. An empty answer takes the default, which is yes.
 */
bool acceptsFix(const std::string &answer);

/**
 * Asks the user whether access to the touchpad should be unrestricted.
 * @param in   Where the answer is read from.
 * @param out  Where the question is written.
 * @return     True if the user agreed.
 */
bool askToFix(std::istream &in, std::ostream &out);

/**
 * Runs the helper that changes the access rights of the touchpad through
 * pkexec, which will ask for authorization.
 * @param helper  The path to the helper script.
 * @return        The exit status of pkexec.
 * @throw CommandError  pkexec could not be run.
 */
int runPermissionFix(const std::string &helper);

#endif        //  #ifndef PERMISSIONFIX_HPP
