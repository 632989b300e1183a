// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcCompareBound_H
#define SbcCompareBound_H

#include "SbcCompareBase.hpp"

/** Best first - node with smaller lower bound is better.
    Equal bounds compare as equal. */
class SbcCompareBound : public SbcCompareBase {
public:
  // Default Constructor
  SbcCompareBound();

  virtual ~SbcCompareBound();
  // Copy constructor
  SbcCompareBound(const SbcCompareBound &rhs);

  // Assignment operator
  SbcCompareBound &operator=(const SbcCompareBound &rhs);

  /// Clone
  virtual SbcCompareBase *clone() const;

  /* This returns true if lower bound of node y is less than
     lower bound of node x */
  virtual bool test(SbcNode *x, SbcNode *y);
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
