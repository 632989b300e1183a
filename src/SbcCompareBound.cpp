// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#if defined(_MSC_VER)
// Turn off compiler warning about long names
#pragma warning(disable : 4786)
#endif

#include "SbcCompareBound.hpp"

SbcCompareBound::SbcCompareBound()
  : SbcCompareBase()
{
}

SbcCompareBound::SbcCompareBound(const SbcCompareBound &rhs)
  : SbcCompareBase(rhs)
{
}

SbcCompareBase *
SbcCompareBound::clone() const
{
  return new SbcCompareBound(*this);
}

SbcCompareBound &
SbcCompareBound::operator=(const SbcCompareBound &rhs)
{
  if (this != &rhs) {
    SbcCompareBase::operator=(rhs);
  }
  return (*this);
}

SbcCompareBound::~SbcCompareBound()
{
}

bool SbcCompareBound::test(SbcNode *x, SbcNode *y)
{
  return x->lowerBound() > y->lowerBound();
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
