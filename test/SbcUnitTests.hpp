// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcUnitTests_H
#define SbcUnitTests_H

void SbcSettingsUnitTest();
void SbcNodeUnitTest();
void SbcBranchUnitTest();
void SbcTreeUnitTest();
void SbcCutsUnitTest();
void SbcModelUnitTest();

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
