// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcCompareBase_H
#define SbcCompareBase_H

//#############################################################################
/*  These are alternative strategies for node traversal.

    The node list is stored as a heap and the "test" comparison function
    returns true if node y is better than node x. A comparison that cannot
    separate two nodes returns false both ways; SbcCompare then prefers the
    node that was pushed first, so the order of the heap is deterministic.
*/
#include "SbcNode.hpp"

class SbcCompareBase {
public:
  // Default Constructor
  SbcCompareBase() {}

  virtual ~SbcCompareBase() {}

  /// Clone
  virtual SbcCompareBase *clone() const = 0;

  /// This is test function - true if y is better than x
  virtual bool test(SbcNode *x, SbcNode *y) = 0;

  bool operator()(SbcNode *x, SbcNode *y)
  {
    return test(x, y);
  }
};

/// Functor used by the heap - adds tie break on node number
class SbcCompare {
public:
  SbcCompareBase *test_;

  // Default Constructor
  SbcCompare()
  {
    test_ = NULL;
  }

  virtual ~SbcCompare() {}

  bool operator()(SbcNode *x, SbcNode *y)
  {
    bool testX = test_->test(x, y);
    bool testY = test_->test(y, x);
    if (testX != testY)
      return testX;
    else
      return equalityTest(x, y);
  }
  /// Further test if everything else equal - earlier node is better
  inline bool equalityTest(SbcNode *x, SbcNode *y) const
  {
    return (x->nodeNumber() > y->nodeNumber());
  }
  /// Just for back compatibility
  SbcCompareBase *comparisonObject() const
  {
    return test_;
  }
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
